/*
 * File: src/relay_http.hpp
 * Project: Transcript Relay
 * Purpose: Outbound webhook transport
 * Notes:
 *  - One connection per POST, Connection: close
 *  - The request timeout bounds resolve, connect, write and read together
 *  - IP literals skip the resolver; a name lookup that hangs inside
 *    getaddrinfo is bounded only by the system resolver's own timeouts
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "relay_config.hpp"

namespace http = boost::beast::http;

struct WebhookResponse
{
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Seam between the delivery pipeline and the network.
class WebhookTransport
{
public:
    virtual ~WebhookTransport() = default;
    // Sends one JSON document. Throws on any transport-level failure; an HTTP
    // response of any status is returned, not thrown.
    virtual WebhookResponse post_json(const std::string &body) = 0;
    virtual std::string describe() const = 0;
};

namespace detail
{
    // Set when host is an IP literal, so the exchange can skip the resolver.
    inline std::optional<boost::asio::ip::tcp::endpoint> literal_endpoint(const std::string &host, const std::string &port)
    {
        boost::system::error_code ec;
        auto addr = boost::asio::ip::make_address(host, ec);
        if (ec || !valid_port(port))
            return std::nullopt;
        return boost::asio::ip::tcp::endpoint{addr, static_cast<unsigned short>(std::stoul(port))};
    }

    struct PostExchange : std::enable_shared_from_this<PostExchange>
    {
        boost::asio::ip::tcp::resolver resolver;
        boost::beast::tcp_stream stream;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::response<http::string_body> res;
        boost::beast::error_code ec;
        const char *stage = "resolve";
        bool done = false;

        explicit PostExchange(boost::asio::io_context &ioc)
            : resolver(ioc), stream(ioc) {}

        void run(const std::string &host, const std::string &port, std::chrono::milliseconds timeout)
        {
            auto self = shared_from_this();
            if (auto ep = literal_endpoint(host, port))
            {
                stage = "connect";
                stream.expires_after(timeout);
                stream.async_connect(*ep, [self](boost::beast::error_code e)
                                     {
                    if (e) return self->finish(e);
                    self->send(); });
                return;
            }
            resolver.async_resolve(host, port, [self, timeout](boost::beast::error_code e, boost::asio::ip::tcp::resolver::results_type results)
                                   {
                if (e) return self->finish(e);
                self->stage = "connect";
                self->stream.expires_after(timeout);
                self->stream.async_connect(results, [self](boost::beast::error_code e, boost::asio::ip::tcp::endpoint)
                                           {
                    if (e) return self->finish(e);
                    self->send(); }); });
        }

        void send()
        {
            auto self = shared_from_this();
            stage = "write";
            http::async_write(stream, req, [self](boost::beast::error_code e, std::size_t)
                              {
                if (e) return self->finish(e);
                self->stage = "read";
                http::async_read(self->stream, self->buffer, self->res, [self](boost::beast::error_code e, std::size_t)
                                 { self->finish(e); }); });
        }

        void finish(boost::beast::error_code e)
        {
            ec = e;
            done = true;
            boost::beast::error_code ignored;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        }
    };
}

class BeastWebhookTransport final : public WebhookTransport
{
    WebhookUrl url_;
    std::chrono::milliseconds timeout_;

public:
    BeastWebhookTransport(WebhookUrl url, std::chrono::milliseconds timeout)
        : url_(std::move(url)), timeout_(timeout) {}

    WebhookResponse post_json(const std::string &body) override
    {
        boost::asio::io_context ioc;
        auto ex = std::make_shared<detail::PostExchange>(ioc);

        ex->req = http::request<http::string_body>{http::verb::post, url_.target, 11};
        ex->req.set(http::field::host, url_.host_header());
        ex->req.set(http::field::user_agent, "transcript-relay (" BOOST_BEAST_VERSION_STRING ")");
        ex->req.set(http::field::content_type, "application/json");
        ex->req.keep_alive(false);
        ex->req.body() = body;
        ex->req.prepare_payload();

        ex->run(url_.host, url_.port, timeout_);
        ioc.run_for(timeout_);

        if (!ex->done)
        {
            ex->resolver.cancel();
            ex->stream.close();
            throw std::runtime_error(std::string("timed out after ") + std::to_string(timeout_.count()) +
                                     " ms during " + ex->stage + " to " + describe());
        }
        if (ex->ec)
            throw boost::system::system_error(ex->ec, std::string(ex->stage) + " " + describe());

        return WebhookResponse{static_cast<int>(ex->res.result_int()), ex->res.body()};
    }

    std::string describe() const override
    {
        return "http://" + url_.host_header() + url_.target;
    }
};
