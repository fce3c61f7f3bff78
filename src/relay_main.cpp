/*
 * File: src/relay_main.cpp
 * Project: Transcript Relay
 * Purpose: Main binary: watch a directory and POST finished transcripts
 * Notes:
 *  - Exit codes: 0 clean stop, 1 bad arguments, 2 startup failure
 * Last updated: 2026-10-18
 */

#include <iostream>
#include "relay_config.hpp"
#include "relay_http.hpp"
#include "relay_log.hpp"
#include "relay_watcher.hpp"

int main(int argc, char **argv)
{
    RelayConfig cfg;
    try
    {
        cfg = parse_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "transcript_relay: " << e.what() << "\n"
                  << usage(argv[0]);
        return 1;
    }
    if (cfg.show_help)
    {
        std::cout << usage(argv[0]);
        return 0;
    }

    try
    {
        BeastWebhookTransport transport{parse_http_url(cfg.webhook_url), cfg.request_timeout};
        Watcher watcher{cfg, transport};
        watcher.run();
    }
    catch (const std::exception &e)
    {
        log_error("watcher failed to start: ", e.what());
        return 2;
    }
    return 0;
}
