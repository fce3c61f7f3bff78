/*
 * File: src/relay_watcher.hpp
 * Project: Transcript Relay
 * Purpose: Poll loop: detect, deliver each candidate, sleep
 * Notes:
 *  - Single worker; one cycle finishes before the next starts
 *  - SIGINT/SIGTERM are observed during the sleep and between candidates
 *  - Running two watchers on the same directory is not supported
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>
#include <utility>

#include "relay_config.hpp"
#include "relay_detector.hpp"
#include "relay_fs.hpp"
#include "relay_http.hpp"
#include "relay_log.hpp"
#include "relay_pipeline.hpp"
#include "relay_state.hpp"

class Watcher
{
    RelayConfig cfg_;
    RelayState state_;
    fs::path root_;
    fs::path archive_dir_;
    StabilityDetector detector_;
    DeliveryPipeline pipeline_;

    boost::asio::io_context ioc_;
    boost::asio::steady_timer timer_{ioc_};
    bool stopping_ = false;

public:
    Watcher(RelayConfig cfg, WebhookTransport &transport, Sleeper probe_sleeper = {}, Clock clock = {})
        : cfg_(std::move(cfg)),
          root_(resolve_root(cfg_.watch_dir)),
          archive_dir_(root_ / cfg_.processed_name),
          detector_(root_, archive_dir_, cfg_.probe_delay, std::move(probe_sleeper)),
          pipeline_(transport, archive_dir_, cfg_.stage, state_, std::move(clock)) {}

    static fs::path resolve_root(const std::string &dir)
    {
        fs::path p = fs::absolute(dir).lexically_normal();
        if (!p.has_filename() && p.has_relative_path())
            p = p.parent_path();
        return p;
    }

    // Creates the watch root and the archive directory if missing.
    void prepare()
    {
        ensure_dir(root_);
        ensure_dir(archive_dir_);
    }

    // One detection pass followed by sequential delivery. Returns the number of
    // candidates attempted.
    std::size_t run_cycle()
    {
        ++state_.stats.cycles;
        std::size_t attempted = 0;
        for (const auto &file : detector_.scan(state_.seen))
        {
            if (stop_requested())
                break;
            pipeline_.deliver(file);
            ++attempted;
        }
        return attempted;
    }

    void run()
    {
        prepare();
        log_info("starting watcher: dir=", root_.string(), " webhook=", cfg_.webhook_url,
                 " stage=", cfg_.stage ? "true" : "false", " interval=", cfg_.poll_interval_s, "s");

        boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
        signals.async_wait([this](const boost::system::error_code &ec, int signo)
                           {
            if (ec) return;
            log_info("received signal ", signo, ", stopping");
            stopping_ = true;
            timer_.cancel(); });

        while (!stop_requested())
        {
            run_cycle();
            if (cfg_.once || stop_requested())
                break;
            timer_.expires_after(std::chrono::seconds(cfg_.poll_interval_s));
            timer_.async_wait([](const boost::system::error_code &) {});
            ioc_.restart();
            ioc_.run_one();
        }

        boost::system::error_code ignored;
        signals.cancel(ignored);
        log_summary();
    }

    const RelayState &state() const { return state_; }
    const fs::path &root() const { return root_; }
    const fs::path &archive_dir() const { return archive_dir_; }

private:
    // Runs any ready signal or timer handler without blocking.
    bool stop_requested()
    {
        ioc_.restart();
        ioc_.poll();
        return stopping_;
    }

    void log_summary() const
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state_.start).count();
        const auto &s = state_.stats;
        log_info("watcher stopped after ", up, "s: cycles=", s.cycles, " delivered=", s.delivered,
                 " rejected=", s.rejected, " transport_errors=", s.transport_errors,
                 " unreadable=", s.unreadable, " archive_anomalies=", s.archive_anomalies);
    }
};
