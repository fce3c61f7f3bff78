/*
 * File: services/webhook_sink/webhook_sink_main.cpp
 * Project: Transcript Relay
 * Purpose: Stand-in webhook receiver for running the relay locally
 * Notes:
 *  - --status 500 makes every POST fail so the retry path can be watched
 * Last updated: 2026-10-18
 */

#include <csignal>
#include <iostream>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "relay_log.hpp"
#include "sink_http.hpp"

using json = nlohmann::json;

int main(int argc, char **argv)
{
    std::string http_bind = "127.0.0.1:8080";
    SinkState state;
    bool pretty = false;
    boost::asio::ip::tcp::endpoint listen_at;
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--http" && i + 1 < argc)
                http_bind = argv[++i];
            else if (a == "--path" && i + 1 < argc)
                state.path = argv[++i];
            else if (a == "--status" && i + 1 < argc)
                state.forced_status = std::stoi(argv[++i]);
            else if (a == "--pretty")
                pretty = true;
            else
                throw std::invalid_argument("unknown option: " + a);
        }
        if (state.forced_status != 0 && (state.forced_status < 100 || state.forced_status > 599))
            throw std::invalid_argument("--status must be between 100 and 599");
        listen_at = parse_bind_endpoint(http_bind);
    }
    catch (const std::exception &e)
    {
        std::cerr << "webhook_sink: " << e.what() << "\n"
                  << "usage: " << argv[0] << " [--http host:port] [--path /webhook/transcript] [--status CODE] [--pretty]\n";
        return 1;
    }

    g_log_tag = "sink";
    state.on_payload = [pretty](const json &j)
    {
        log_info("received ", j.value("meeting_id", std::string()), " (",
                 j.value("transcript", std::string()).size(), " bytes, stage=",
                 j.value("stage", false) ? "true" : "false", ")");
        if (pretty)
            std::cout << j.dump(2) << std::endl;
    };

    try
    {
        boost::asio::io_context ioc{1};
        SinkServer server{ioc, listen_at, state};

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code &ec, int)
                           {
            if (ec) return;
            log_info("stopping, ", state.received().size(), " payloads received");
            ioc.stop(); });

        log_info("listening http=", http_bind, " path=", state.path,
                 state.forced_status ? " forced_status=" + std::to_string(state.forced_status) : std::string());
        ioc.run();
    }
    catch (const std::exception &e)
    {
        log_error("sink failed: ", e.what());
        return 2;
    }
    return 0;
}
