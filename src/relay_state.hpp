/*
 * File: src/relay_state.hpp
 * Project: Transcript Relay
 * Purpose: Per-process watcher state
 * Notes:
 *  - seen holds absolute paths handled terminally during this run; it is
 *    never persisted and starts empty on every restart
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_set>

using SeenSet = std::unordered_set<std::string>;

struct RelayStats
{
    uint64_t cycles{0};
    uint64_t delivered{0};
    uint64_t rejected{0};
    uint64_t transport_errors{0};
    uint64_t unreadable{0};
    uint64_t archive_anomalies{0};
};

struct RelayState
{
    SeenSet seen;
    RelayStats stats;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};
