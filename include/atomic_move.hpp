/*
 * File: include/atomic_move.hpp
 * Project: Transcript Relay
 * Purpose: Archive naming and no-clobber atomic moves
 * Notes:
 *  - Archive names are <meeting_id>.<YYYYMMDDTHHMMSSZ>.txt
 *  - rename() is atomic only within one filesystem; cross-device moves fail
 * Last updated: 2026-10-18
 */


#pragma once
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>

// Compact ISO 8601 basic format in UTC, second resolution (20240115T093000Z)
inline std::string utc_stamp_compact(std::chrono::system_clock::time_point t)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

// First free name in archive_dir. A second delivery of the same meeting in the
// same second gets a -N counter after the timestamp.
inline std::filesystem::path archive_destination(const std::filesystem::path &archive_dir,
                                                 const std::string &meeting_id,
                                                 std::chrono::system_clock::time_point t)
{
    const std::string stamp = utc_stamp_compact(t);
    std::filesystem::path dst = archive_dir / (meeting_id + "." + stamp + ".txt");
    for (unsigned n = 1;; ++n)
    {
        std::error_code ec;
        const bool taken = std::filesystem::exists(dst, ec);
        if (ec)
            throw std::system_error(ec, "stat " + dst.string());
        if (!taken)
            return dst;
        dst = archive_dir / (meeting_id + "." + stamp + "-" + std::to_string(n) + ".txt");
    }
}

// Atomic move: rename() src onto dst. Throws std::system_error on failure.
inline void move_atomic(const std::filesystem::path &src, const std::filesystem::path &dst)
{
    if (::rename(src.c_str(), dst.c_str()) != 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "rename " + src.string() + " -> " + dst.string());
    }
}
