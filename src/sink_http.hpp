/*
 * File: src/sink_http.hpp
 * Project: Transcript Relay
 * Purpose: Local webhook receiver for manual runs and end-to-end tests
 * Notes:
 *  - POST <path> validates the transcript payload and records it
 *  - forced_status != 0 answers every valid POST with that status
 *  - /health reports how many payloads were received
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "relay_config.hpp"

namespace http = boost::beast::http;

struct SinkState
{
    std::string path{"/webhook/transcript"};
    int forced_status = 0;
    std::function<void(const nlohmann::json &)> on_payload;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    void record(const nlohmann::json &j)
    {
        std::scoped_lock lk(mtx_);
        received_.push_back(j);
    }
    std::vector<nlohmann::json> received() const
    {
        std::scoped_lock lk(mtx_);
        return received_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<nlohmann::json> received_;
};

// Empty when the body has the expected shape, otherwise the offending fields.
inline std::vector<std::string> payload_problems(const nlohmann::json &body)
{
    std::vector<std::string> bad;
    if (!body.is_object())
        return {"<root>"};
    for (const char *k : {"meeting_id", "title", "transcript"})
        if (!body.contains(k) || !body[k].is_string())
            bad.emplace_back(k);
    if (!body.contains("attendees") || !body["attendees"].is_array())
        bad.emplace_back("attendees");
    if (!body.contains("stage") || !body["stage"].is_boolean())
        bad.emplace_back("stage");
    return bad;
}

// host:port or [v6]:port; the host must be a literal address
inline boost::asio::ip::tcp::endpoint parse_bind_endpoint(const std::string &bind)
{
    auto p = bind.rfind(':');
    if (p == std::string::npos)
        throw std::invalid_argument("--http expects host:port, got " + bind);
    auto host = bind.substr(0, p);
    auto port = bind.substr(p + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    if (!valid_port(port))
        throw std::invalid_argument("invalid port in --http " + bind);

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host, ec);
    if (ec)
        throw std::invalid_argument("invalid address in --http " + bind + ": " + ec.message());
    return {addr, static_cast<unsigned short>(std::stoul(port))};
}

class SinkServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    SinkState &state_;

public:
    // Throws boost::system::system_error if the endpoint cannot be bound.
    SinkServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, SinkState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void close()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted) return;
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        SinkState &state;

        Session(boost::asio::ip::tcp::socket &&s, SinkState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        void respond(http::status status, const nlohmann::json &body)
        {
            respond(static_cast<unsigned>(status), body);
        }

        void respond(unsigned status, const nlohmann::json &body)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>();
            sp->version(req.version());
            sp->result(status);
            sp->set(http::field::server, "transcript-sink");
            sp->set(http::field::content_type, "application/json");
            sp->keep_alive(false);
            sp->body() = body.dump();
            sp->prepare_payload();

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            using nlohmann::json;

            if (req.method() == http::verb::get && req.target() == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return respond(http::status::ok, json{{"status", "ok"}, {"received", state.received().size()}, {"uptime_s", up}});
            }

            if (req.target() == state.path)
            {
                if (req.method() != http::verb::post)
                    return respond(http::status::method_not_allowed, json{{"error", "method not allowed"}});

                auto body = json::parse(req.body(), nullptr, false);
                if (body.is_discarded())
                    return respond(http::status::bad_request, json{{"error", "bad json"}});

                auto bad = payload_problems(body);
                if (!bad.empty())
                    return respond(http::status::bad_request, json{{"error", "missing fields"}, {"fields", bad}});

                state.record(body);
                if (state.on_payload)
                    state.on_payload(body);

                if (state.forced_status != 0)
                    return respond(static_cast<unsigned>(state.forced_status),
                                   json{{"status", "forced"}, {"meeting_id", body["meeting_id"]}});
                return respond(http::status::accepted, json{{"status", "accepted"}, {"meeting_id", body["meeting_id"]}});
            }

            return respond(http::status::not_found, json{{"error", "not found"}});
        }
    };
};
