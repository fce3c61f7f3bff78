/*
 * File: src/relay_detector.hpp
 * Project: Transcript Relay
 * Purpose: Per-cycle candidate selection for the watch root
 * Notes:
 *  - A candidate is stable when two size probes one probe delay apart agree
 *  - Unstable or vanished files are skipped for this cycle only
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "relay_fs.hpp"
#include "relay_log.hpp"
#include "relay_state.hpp"

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper thread_sleeper()
{
    return [](std::chrono::milliseconds d)
    { std::this_thread::sleep_for(d); };
}

class StabilityDetector
{
    fs::path root_;
    fs::path archive_dir_;
    std::chrono::milliseconds probe_delay_;
    Sleeper sleep_;

public:
    StabilityDetector(fs::path root, fs::path archive_dir, std::chrono::milliseconds probe_delay, Sleeper sleeper = {})
        : root_(std::move(root)), archive_dir_(std::move(archive_dir)), probe_delay_(probe_delay),
          sleep_(sleeper ? std::move(sleeper) : thread_sleeper()) {}

    // Stable, unseen candidates in file-name order.
    std::vector<fs::path> scan(const SeenSet &seen) const
    {
        std::vector<fs::path> out;
        for (auto &p : list_candidates())
        {
            if (inside_archive(p))
                continue;
            if (seen.count(p.string()))
                continue;
            if (!is_stable(p))
                continue;
            out.push_back(std::move(p));
        }
        return out;
    }

    std::vector<fs::path> list_candidates() const
    {
        std::vector<fs::path> files;
        std::error_code ec;
        if (!fs::exists(root_, ec) && !ec)
        {
            log_warn("directory not found, creating: ", root_.string());
            fs::create_directories(root_, ec);
            if (ec)
                log_warn("could not recreate ", root_.string(), ": ", ec.message());
            return files;
        }

        fs::directory_iterator it(root_, ec);
        if (ec)
        {
            log_warn("listing ", root_.string(), " failed: ", ec.message());
            return files;
        }
        for (fs::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
                break;
            const auto &entry = *it;
            if (!has_txt_suffix(entry.path().filename().string()))
                continue;
            std::error_code type_ec;
            if (!entry.is_regular_file(type_ec))
                continue;
            files.push_back(entry.path());
        }
        if (ec)
        {
            log_warn("listing ", root_.string(), " interrupted: ", ec.message());
            return {};
        }

        std::sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b)
                  { return a.filename().string() < b.filename().string(); });
        return files;
    }

    // Resolution failures count as "not inside".
    bool inside_archive(const fs::path &p) const
    {
        std::error_code ec;
        auto resolved = fs::weakly_canonical(p, ec);
        if (ec)
            return false;
        auto archive = fs::weakly_canonical(archive_dir_, ec);
        if (ec)
            return false;
        auto rel = resolved.lexically_relative(archive);
        return !rel.empty() && *rel.begin() != "..";
    }

    bool is_stable(const fs::path &p) const
    {
        std::error_code ec;
        auto first = fs::file_size(p, ec);
        if (ec)
            return false;
        sleep_(probe_delay_);
        auto second = fs::file_size(p, ec);
        if (ec)
            return false;
        if (first != second)
        {
            log_info("still being written, skipping this cycle: ", p.string(), " (", first, " -> ", second, " bytes)");
            return false;
        }
        return true;
    }

    const fs::path &root() const { return root_; }
    const fs::path &archive_dir() const { return archive_dir_; }
};
