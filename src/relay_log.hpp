/*
 * File: src/relay_log.hpp
 * Project: Transcript Relay
 * Purpose: Line logging to stderr
 * Notes:
 *  - <RFC3339 UTC ms> <LEVEL> [tag] message
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm = *std::gmtime(&tt);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

enum class LogLevel
{
    Info,
    Warn,
    Error
};

inline std::string g_log_tag = "relay";

inline void write_log_line(LogLevel level, const std::string &msg)
{
    static std::mutex mtx;
    const char *name = level == LogLevel::Info ? "INFO" : level == LogLevel::Warn ? "WARN" : "ERROR";
    std::scoped_lock lk(mtx);
    std::cerr << iso8601_now_ms() << ' ' << name << " [" << g_log_tag << "] " << msg << '\n';
}

// Streams every argument into one line.
template <typename... Args>
void log_line(LogLevel level, const Args &...args)
{
    std::ostringstream oss;
    (oss << ... << args);
    write_log_line(level, oss.str());
}

template <typename... Args>
void log_info(const Args &...args) { log_line(LogLevel::Info, args...); }

template <typename... Args>
void log_warn(const Args &...args) { log_line(LogLevel::Warn, args...); }

template <typename... Args>
void log_error(const Args &...args) { log_line(LogLevel::Error, args...); }
