//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/UpstreamExchange.cpp
// Purpose: Upstream HTTP exchange over pooled Boost.Beast connections
//==========================================================================================================

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>

#include "chatproxy/UpstreamExchange.hpp"
#include "chatproxy/errors/Errors.h"
#include "chatproxy/version.h"
#include "logging/Logger.h"

namespace chatproxy {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {

// Errors a keep-alive connection produces when the server closed it while idle.
bool isStaleConnection(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == net::error::eof ||
           ec == net::error::connection_reset ||
           ec == net::error::connection_aborted ||
           ec == net::error::broken_pipe ||
           ec == net::ssl::error::stream_truncated;
}

errors::UpstreamError mapFailure(const boost::system::error_code& ec, const std::string& origin) {
    if (ec == beast::error::timeout) {
        return errors::UpstreamError("Upstream request timed out", std::nullopt, std::string(), true);
    }
    return errors::UpstreamError("Upstream connection to " + origin + " failed: " + ec.message(), std::nullopt);
}

} // namespace

http::request<http::string_body> BuildUpstreamRequest(const UrlParts& url, const HeaderField& auth,
                                                      const std::string& body, bool stream) {
    http::request<http::string_body> req{http::verb::post, url.path, 11};
    const bool defaultPort = (url.IsTls() && url.port == "443") || (!url.IsTls() && url.port == "80");
    req.set(http::field::host, defaultPort ? url.host : url.host + ":" + url.port);
    req.set(http::field::user_agent, "chatproxy/" + getVersionString());
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, stream ? "text/event-stream" : "application/json");
    if (!auth.name.empty()) {
        req.set(auth.name, auth.value);
    }
    req.keep_alive(true);
    req.body() = body;
    req.prepare_payload();
    return req;
}

PreparedRequest PrepareUpstreamRequest(ConnectionPoolManager& pools, const ProviderConfig& provider,
                                       const std::string& body, const std::string& credential, bool stream) {
    const std::string url = BuildChatCompletionsUrl(provider.baseUrl);
    PreparedRequest out;
    UrlParts parts;
    try {
        parts = ParseUrl(url);
        out.pool = pools.GetPool(url);
    } catch (const std::invalid_argument& e) {
        throw errors::ConfigurationError("Provider '" + provider.id + "' has invalid base_url: " + e.what());
    } catch (const std::logic_error& e) {
        throw errors::UpstreamError(std::string("Upstream unavailable: ") + e.what(), std::nullopt);
    }
    out.request = BuildUpstreamRequest(parts, BuildAuthHeader(provider.authHeader, credential), body, stream);
    return out;
}

net::awaitable<UpstreamExchange> UpstreamExchange::Open(std::shared_ptr<ConnectionPool> pool,
                                                        const http::request<http::string_body>& req,
                                                        Clock::time_point deadline) {
    for (int pass = 0;; ++pass) {
        UpstreamExchange ex;
        ex.pool = pool;
        ex.parser = std::make_unique<http::response_parser<http::buffer_body>>();
        ex.parser->body_limit((std::numeric_limits<std::uint64_t>::max)());

        boost::system::error_code failure;
        bool reused = false;
        try {
            ex.lease = co_await pool->Acquire(deadline);
            reused = ex.lease.Reused();
            ex.lease->Tcp().expires_at(deadline);
            co_await ex.lease->Visit([&req](auto& s) {
                return http::async_write(s, req, net::use_awaitable);
            });
            auto& buffer = ex.lease->Buffer();
            auto& parser = *ex.parser;
            co_await ex.lease->Visit([&buffer, &parser](auto& s) {
                return http::async_read_header(s, buffer, parser, net::use_awaitable);
            });
            co_return std::move(ex);
        } catch (const boost::system::system_error& e) {
            failure = e.code();
        } catch (const std::logic_error& e) {
            throw errors::UpstreamError(std::string("Upstream unavailable: ") + e.what(), std::nullopt);
        }

        if (reused && pass == 0 && isStaleConnection(failure) && Clock::now() < deadline) {
            LOG_DEBUG("Stale keep-alive connection to {} ({}), reconnecting", pool->Origin(), failure.message());
            continue;
        }
        throw mapFailure(failure, pool->Origin());
    }
}

int UpstreamExchange::Status() const {
    return parser ? static_cast<int>(parser->get().result_int()) : 0;
}

std::map<std::string, std::string> UpstreamExchange::Headers() const {
    std::map<std::string, std::string> out;
    if (!parser) {
        return out;
    }
    for (const auto& f : parser->get()) {
        auto& slot = out[std::string(f.name_string())];
        if (!slot.empty()) {
            slot += ", ";
        }
        slot += std::string(f.value());
    }
    return out;
}

bool UpstreamExchange::Done() const {
    return !parser || parser->is_done();
}

net::awaitable<std::size_t> UpstreamExchange::ReadSome(char* buf, std::size_t size, Clock::time_point deadline) {
    if (Done()) {
        co_return 0;
    }
    parser->get().body().data = buf;
    parser->get().body().size = size;
    lease->Tcp().expires_at(deadline);

    boost::system::error_code ec;
    auto& buffer = lease->Buffer();
    auto& p = *parser;
    co_await lease->Visit([&buffer, &p, &ec](auto& s) {
        return http::async_read_some(s, buffer, p, net::redirect_error(net::use_awaitable, ec));
    });
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        throw mapFailure(ec, pool->Origin());
    }
    co_return size - parser->get().body().size;
}

net::awaitable<std::string> UpstreamExchange::ReadAll(Clock::time_point deadline, std::size_t limit) {
    std::string body;
    char buf[8192];
    while (!Done()) {
        std::size_t n = co_await ReadSome(buf, sizeof(buf), deadline);
        body.append(buf, n);
        if (body.size() > limit) {
            throw errors::UpstreamError("Upstream response exceeds " + std::to_string(limit) + " bytes",
                                        std::nullopt);
        }
    }
    co_return body;
}

void UpstreamExchange::Finish() {
    if (!lease) {
        return;
    }
    lease->Tcp().expires_never();
    if (parser && parser->is_done() && parser->get().keep_alive()) {
        std::optional<std::string_view> hint;
        auto it = parser->get().find("Keep-Alive");
        if (it != parser->get().end()) {
            hint = std::string_view(it->value().data(), it->value().size());
        }
        if (auto keepFor = ComputeKeepAlive(hint, pool->Options())) {
            lease.MarkReusable(*keepFor);
        }
    }
    lease.Release();
}

void UpstreamExchange::Abandon() {
    lease.Release();
}

} // namespace chatproxy
