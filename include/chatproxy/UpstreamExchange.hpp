//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UpstreamExchange.hpp
// Purpose: One HTTP request/response exchange with an upstream provider over a pooled connection
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

#include "chatproxy/Config.h"
#include "chatproxy/ConnectionPool.hpp"
#include "chatproxy/Url.h"

namespace chatproxy {

struct UpstreamResponse {
    int status{0};
    std::string body;
    std::map<std::string, std::string> headers;
};

//==========================================================================================================
// BuildUpstreamRequest
// Purpose: POST <url.path> with JSON body, Host, auth header and keep-alive.
// Args:
//   stream: When true, Accept is text/event-stream.
//==========================================================================================================
boost::beast::http::request<boost::beast::http::string_body> BuildUpstreamRequest(
    const UrlParts& url, const HeaderField& auth, const std::string& body, bool stream);

//==========================================================================================================
// PreparedRequest / PrepareUpstreamRequest
// Purpose: Resolves the provider's pool and builds the chat completions request for it.
// Throws:
//   errors::ConfigurationError for an unusable base URL; errors::UpstreamError after pool shutdown.
//==========================================================================================================
struct PreparedRequest {
    std::shared_ptr<ConnectionPool> pool;
    boost::beast::http::request<boost::beast::http::string_body> request;
};

PreparedRequest PrepareUpstreamRequest(ConnectionPoolManager& pools, const ProviderConfig& provider,
                                       const std::string& body, const std::string& credential, bool stream);

//==========================================================================================================
// UpstreamExchange
// Purpose: Sends a request and exposes the response header and an incremental body reader.
// Notes:
//   - Open() leases a connection, writes the request and reads the response header. A reused keep-alive
//     connection that the server already closed is replaced by a fresh one once, transparently.
//   - The connection goes back to the pool only after Finish() on a fully read, keep-alive response.
//     Any other exit closes it.
//   - Failures surface as errors::UpstreamError (timedOut on deadline expiry, no status otherwise).
//==========================================================================================================
class UpstreamExchange {
public:
    using Clock = std::chrono::steady_clock;

    UpstreamExchange() = default;
    UpstreamExchange(UpstreamExchange&&) noexcept = default;
    UpstreamExchange& operator=(UpstreamExchange&&) noexcept = default;

    static boost::asio::awaitable<UpstreamExchange> Open(
        std::shared_ptr<ConnectionPool> pool,
        const boost::beast::http::request<boost::beast::http::string_body>& req,
        Clock::time_point deadline);

    int Status() const;
    std::map<std::string, std::string> Headers() const;
    bool Done() const;

    //==========================================================================================================
    // ReadSome
    // Purpose: Reads the next part of the body into buf.
    // Returns:
    //   Bytes stored (0 once the body is complete).
    //==========================================================================================================
    boost::asio::awaitable<std::size_t> ReadSome(char* buf, std::size_t size, Clock::time_point deadline);

    // Reads the remaining body; fails when it exceeds limit bytes.
    boost::asio::awaitable<std::string> ReadAll(Clock::time_point deadline, std::size_t limit);

    // Returns the connection to the pool when the completed response allows reuse.
    void Finish();

    // Closes the connection without reuse.
    void Abandon();

private:
    std::shared_ptr<ConnectionPool> pool;
    ConnectionPool::Lease lease;
    std::unique_ptr<boost::beast::http::response_parser<boost::beast::http::buffer_body>> parser;
};

} // namespace chatproxy
