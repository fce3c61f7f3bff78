/*
 * File: src/relay_config.hpp
 * Project: Transcript Relay
 * Purpose: Command line configuration and webhook URL parsing
 * Notes:
 *  - Only plain http:// endpoints are supported
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

struct WebhookUrl
{
    std::string host;
    std::string port{"80"};
    std::string target{"/"};

    // Host header value; the port is omitted when it is the default
    std::string host_header() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        return port == "80" ? h : h + ":" + port;
    }
};

// decimal 1..65535, digits only
inline bool valid_port(const std::string &port)
{
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](unsigned char c)
                     { return std::isdigit(c) != 0; }))
        return false;
    auto n = std::stoul(port);
    return n >= 1 && n <= 65535;
}

// expect http://host[:port][/path][?query]
inline WebhookUrl parse_http_url(const std::string &url)
{
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw std::invalid_argument("webhook URL has no scheme: " + url);
    std::string scheme = url.substr(0, scheme_pos);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http")
        throw std::invalid_argument("unsupported webhook scheme '" + scheme + "' (only http is supported)");

    auto rest = url.substr(scheme_pos + 3);
    auto path_pos = rest.find_first_of("/?#");
    std::string hp = (path_pos == std::string::npos) ? rest : rest.substr(0, path_pos);

    WebhookUrl out;
    if (path_pos != std::string::npos)
    {
        out.target = rest.substr(path_pos);
        auto frag = out.target.find('#');
        if (frag != std::string::npos)
            out.target.erase(frag);
        if (out.target.empty() || out.target[0] != '/')
            out.target.insert(0, "/");
    }

    std::string port;
    if (!hp.empty() && hp[0] == '[')
    {
        auto close = hp.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("unterminated IPv6 literal in webhook URL: " + url);
        out.host = hp.substr(1, close - 1);
        if (close + 1 < hp.size())
        {
            if (hp[close + 1] != ':')
                throw std::invalid_argument("malformed host in webhook URL: " + url);
            port = hp.substr(close + 2);
        }
    }
    else
    {
        auto colon = hp.find(':');
        out.host = hp.substr(0, colon);
        if (colon != std::string::npos)
            port = hp.substr(colon + 1);
    }

    if (out.host.empty())
        throw std::invalid_argument("webhook URL has no host: " + url);
    if (!port.empty())
    {
        if (!valid_port(port))
            throw std::invalid_argument("invalid port in webhook URL: " + url);
        out.port = port;
    }
    return out;
}

struct RelayConfig
{
    std::string watch_dir{"transcripts"};
    std::string webhook_url{"http://localhost:8080/webhook/transcript"};
    bool stage = true;
    int poll_interval_s = 5;
    std::string processed_name{"processed"};
    bool once = false;
    bool show_help = false;

    std::chrono::milliseconds probe_delay{200};
    std::chrono::milliseconds request_timeout{10000};
};

inline std::string usage(const std::string &prog)
{
    return "usage: " + prog + " [options]\n"
                              "  -d, --dir PATH        directory to watch for .txt transcripts (default: transcripts)\n"
                              "  -w, --webhook URL     webhook to POST transcripts to\n"
                              "                        (default: http://localhost:8080/webhook/transcript)\n"
                              "      --no-stage        send stage=false (persist actions directly)\n"
                              "      --interval SECS   poll interval in seconds (default: 5)\n"
                              "      --processed NAME  archive subdirectory name (default: processed)\n"
                              "      --once            run a single poll cycle and exit\n"
                              "  -h, --help            show this help\n";
}

// Throws std::invalid_argument on unknown flags or bad values.
inline RelayConfig parse_args(const std::vector<std::string> &args)
{
    RelayConfig cfg;
    auto value_of = [&](size_t &i) -> const std::string &
    {
        if (i + 1 >= args.size())
            throw std::invalid_argument("missing value for " + args[i]);
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a == "--dir" || a == "-d")
            cfg.watch_dir = value_of(i);
        else if (a == "--webhook" || a == "-w")
            cfg.webhook_url = value_of(i);
        else if (a == "--no-stage")
            cfg.stage = false;
        else if (a == "--interval")
        {
            const std::string &v = value_of(i);
            size_t used = 0;
            int secs = 0;
            try
            {
                secs = std::stoi(v, &used);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("--interval expects an integer, got '" + v + "'");
            }
            if (used != v.size() || secs < 1)
                throw std::invalid_argument("--interval must be a positive integer, got '" + v + "'");
            cfg.poll_interval_s = secs;
        }
        else if (a == "--processed")
            cfg.processed_name = value_of(i);
        else if (a == "--once")
            cfg.once = true;
        else if (a == "--help" || a == "-h")
            cfg.show_help = true;
        else
            throw std::invalid_argument("unknown option: " + a);
    }

    if (cfg.watch_dir.empty())
        throw std::invalid_argument("--dir must not be empty");
    // archive must stay a direct child of the watch root
    const std::string &pn = cfg.processed_name;
    if (pn.empty() || pn == "." || pn == ".." || pn.find('/') != std::string::npos)
        throw std::invalid_argument("--processed must be a single directory name, got '" + pn + "'");
    parse_http_url(cfg.webhook_url);
    return cfg;
}

inline RelayConfig parse_args(int argc, char **argv)
{
    return parse_args(std::vector<std::string>(argv + 1, argv + argc));
}
