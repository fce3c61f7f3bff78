/*
 * File: tests/test_watcher.cpp
 * Project: Transcript Relay
 * Purpose: Poll cycles end to end: detection, delivery, archive, stop
 * Last updated: 2026-10-18
 */

#include <catch2/catch.hpp>
#include <atomic>
#include <csignal>
#include <regex>
#include <thread>
#include "relay_watcher.hpp"
#include "test_support.hpp"

namespace
{
    RelayConfig config_for(const fs::path &root, const std::string &webhook = "http://127.0.0.1:9/unused")
    {
        RelayConfig cfg;
        cfg.watch_dir = root.string();
        cfg.webhook_url = webhook;
        cfg.poll_interval_s = 1;
        cfg.probe_delay = std::chrono::milliseconds(1);
        cfg.request_timeout = std::chrono::seconds(2);
        return cfg;
    }

    BeastWebhookTransport beast_for(const RelayConfig &cfg)
    {
        return BeastWebhookTransport{parse_http_url(cfg.webhook_url), cfg.request_timeout};
    }
}


TEST_CASE("delivered transcript is moved under processed")
{
    TempDir tmp;
    RunningSink sink{200};
    auto cfg = config_for(tmp.path(), sink.url());
    auto transport = beast_for(cfg);
    Watcher w{cfg, transport};
    w.prepare();

    write_text(tmp.path() / "kickoff.txt", "Agenda: intro");
    REQUIRE(w.run_cycle() == 1);

    REQUIRE_FALSE(fs::exists(tmp.path() / "kickoff.txt"));
    auto archived = list_dir(tmp.path() / "processed");
    REQUIRE(archived.size() == 1);
    REQUIRE(std::regex_match(archived[0].filename().string(), std::regex(R"(kickoff\.\d{8}T\d{6}Z\.txt)")));
    REQUIRE(read_text(archived[0]) == "Agenda: intro");

    auto got = sink.state.received();
    REQUIRE(got.size() == 1);
    REQUIRE(got[0]["meeting_id"] == "kickoff");
    REQUIRE(got[0]["transcript"] == "Agenda: intro");
    REQUIRE(got[0]["stage"] == true);
}

TEST_CASE("rejected transcript is retried every cycle with the same payload")
{
    TempDir tmp;
    RunningSink sink{500};
    auto cfg = config_for(tmp.path(), sink.url());
    auto transport = beast_for(cfg);
    Watcher w{cfg, transport};
    w.prepare();

    write_text(tmp.path() / "broken.txt", "this will bounce");
    for (int i = 0; i < 3; ++i)
        REQUIRE(w.run_cycle() == 1);

    REQUIRE(fs::exists(tmp.path() / "broken.txt"));
    REQUIRE(list_dir(tmp.path() / "processed").empty());
    REQUIRE(w.state().seen.empty());
    REQUIRE(w.state().stats.rejected == 3);

    auto got = sink.state.received();
    REQUIRE(got.size() == 3);
    REQUIRE(got[0] == got[1]);
    REQUIRE(got[1] == got[2]);
}

TEST_CASE("unreachable webhook is retried every cycle")
{
    TempDir tmp;
    unsigned short port = 0;
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor a{ioc, boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
        port = a.local_endpoint().port();
    }
    auto cfg = config_for(tmp.path(), "http://127.0.0.1:" + std::to_string(port) + "/webhook/transcript");
    auto transport = beast_for(cfg);
    Watcher w{cfg, transport};
    w.prepare();

    write_text(tmp.path() / "offline.txt", "queued");
    REQUIRE(w.run_cycle() == 1);
    REQUIRE(w.run_cycle() == 1);
    REQUIRE(fs::exists(tmp.path() / "offline.txt"));
    REQUIRE(w.state().stats.transport_errors == 2);
}

TEST_CASE("file being appended is held back until two probes agree")
{
    TempDir tmp;
    auto partial = tmp.path() / "partial.txt";
    write_text(partial, "line 1\n");

    int appends_left = 2;
    Sleeper writer = [&](std::chrono::milliseconds)
    {
        if (appends_left > 0)
        {
            --appends_left;
            append_text(partial, "more\n");
        }
    };

    FakeTransport transport;
    Watcher w{config_for(tmp.path()), transport, writer};
    w.prepare();

    REQUIRE(w.run_cycle() == 0);
    REQUIRE(w.run_cycle() == 0);
    REQUIRE(transport.bodies.empty());

    REQUIRE(w.run_cycle() == 1);
    REQUIRE(transport.last_json()["transcript"] == "line 1\nmore\nmore\n");
    REQUIRE_FALSE(fs::exists(partial));
}

TEST_CASE("a path is delivered at most once per run")
{
    TempDir tmp;
    FakeTransport transport;
    Watcher w{config_for(tmp.path()), transport};
    w.prepare();

    write_text(tmp.path() / "daily.txt", "first");
    REQUIRE(w.run_cycle() == 1);

    // same name dropped again while the process is still running
    write_text(tmp.path() / "daily.txt", "second");
    REQUIRE(w.run_cycle() == 0);
    REQUIRE(w.run_cycle() == 0);
    REQUIRE(transport.bodies.size() == 1);
    REQUIRE(fs::exists(tmp.path() / "daily.txt"));
}

TEST_CASE("restart forgets the seen set")
{
    TempDir tmp;
    write_text(tmp.path() / "daily.txt", "first");
    {
        FakeTransport transport;
        Watcher w{config_for(tmp.path()), transport};
        w.prepare();
        REQUIRE(w.run_cycle() == 1);
    }
    write_text(tmp.path() / "daily.txt", "second");

    FakeTransport transport;
    Watcher w{config_for(tmp.path()), transport};
    w.prepare();
    REQUIRE(w.run_cycle() == 1);
    REQUIRE(transport.last_json()["transcript"] == "second");
    REQUIRE(list_dir(tmp.path() / "processed").size() == 2);
}

TEST_CASE("unreadable transcript is skipped for the rest of the run")
{
    TempDir tmp;
    FakeTransport transport;
    Watcher w{config_for(tmp.path()), transport};
    w.prepare();

    write_text(tmp.path() / "binary.txt", std::string("\xff\xfe\xfd", 3));
    write_text(tmp.path() / "fine.txt", "ok");
    REQUIRE(w.run_cycle() == 2);
    REQUIRE(w.run_cycle() == 0);
    REQUIRE(transport.bodies.size() == 1);
    REQUIRE(fs::exists(tmp.path() / "binary.txt"));
    REQUIRE(w.state().stats.unreadable == 1);
}

TEST_CASE("existing layout is reused without touching its contents")
{
    TempDir tmp;
    fs::create_directories(tmp.path() / "processed");
    write_text(tmp.path() / "processed" / "old.20240101T000000Z.txt", "archived earlier");
    write_text(tmp.path() / "readme.md", "not a transcript");

    FakeTransport transport;
    Watcher w{config_for(tmp.path()), transport};
    w.prepare();
    w.prepare();

    REQUIRE(read_text(tmp.path() / "processed" / "old.20240101T000000Z.txt") == "archived earlier");
    REQUIRE(read_text(tmp.path() / "readme.md") == "not a transcript");
    REQUIRE(w.run_cycle() == 0);

    write_text(tmp.path() / "new.txt", "n");
    REQUIRE(w.run_cycle() == 1);
    REQUIRE(list_dir(tmp.path() / "processed").size() == 2);
}

TEST_CASE("missing directories are created and the root path is normalised")
{
    TempDir tmp;
    auto cfg = config_for(tmp.path() / "in" / "");
    cfg.processed_name = "done";
    FakeTransport transport;
    Watcher w{cfg, transport};

    REQUIRE(w.root().string() == (tmp.path() / "in").string());
    REQUIRE(w.archive_dir().string() == (tmp.path() / "in" / "done").string());
    w.prepare();
    REQUIRE(fs::is_directory(tmp.path() / "in" / "done"));
}

TEST_CASE("once mode runs a single cycle")
{
    TempDir tmp;
    auto cfg = config_for(tmp.path());
    cfg.once = true;
    FakeTransport transport;
    Watcher w{cfg, transport};

    write_text(tmp.path() / "solo.txt", "x");
    w.run();
    REQUIRE(w.state().stats.cycles == 1);
    REQUIRE(w.state().stats.delivered == 1);
}

TEST_CASE("interrupt between candidates stops the loop cleanly")
{
    TempDir tmp;
    auto cfg = config_for(tmp.path());
    cfg.poll_interval_s = 3600;
    FakeTransport transport;
    transport.on_post = []
    { std::raise(SIGINT); };
    Watcher w{cfg, transport};

    write_text(tmp.path() / "a.txt", "first");
    write_text(tmp.path() / "b.txt", "second");
    w.run();

    REQUIRE(transport.bodies.size() == 1);
    REQUIRE_FALSE(fs::exists(tmp.path() / "a.txt"));
    REQUIRE(fs::exists(tmp.path() / "b.txt"));
    REQUIRE(w.state().stats.cycles == 1);
}

TEST_CASE("interrupt during the poll sleep ends the run promptly")
{
    TempDir tmp;
    auto cfg = config_for(tmp.path());
    cfg.poll_interval_s = 3600;
    std::atomic<bool> posted{false};
    FakeTransport transport;
    transport.on_post = [&posted]
    { posted = true; };
    Watcher w{cfg, transport};

    write_text(tmp.path() / "only.txt", "x");

    // signal once the first cycle has posted and the loop has gone to sleep
    std::thread interrupter([&posted]
                            {
        while (!posted)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        std::raise(SIGINT); });

    auto t0 = std::chrono::steady_clock::now();
    w.run();
    auto elapsed = std::chrono::steady_clock::now() - t0;
    interrupter.join();

    REQUIRE(elapsed < std::chrono::seconds(10));
    REQUIRE(w.state().stats.cycles == 1);
    REQUIRE(w.state().stats.delivered == 1);
    REQUIRE(transport.bodies.size() == 1);
}
