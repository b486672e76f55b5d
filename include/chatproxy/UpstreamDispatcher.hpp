//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UpstreamDispatcher.hpp
// Purpose: Non-streaming upstream requests with concurrency limiting, pooling and retry/backoff
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatproxy/ConcurrencyLimiter.hpp"
#include "chatproxy/Config.h"
#include "chatproxy/ConnectionPool.hpp"
#include "chatproxy/RetryPolicy.h"
#include "chatproxy/UpstreamExchange.hpp"

namespace chatproxy {

class UpstreamDispatcher {
public:
    // Upper bound for a buffered (non-streaming) upstream response body.
    static constexpr std::size_t kMaxResponseBytes = 64 * 1024 * 1024;

    UpstreamDispatcher(ConnectionPoolManager& pools, ConcurrencyLimiter& limiter,
                       RetryPolicy policy = RetryPolicy());

    //==========================================================================================================
    // Send
    // Purpose: POSTs body to <base_url>/chat/completions and returns the complete response.
    // Notes:
    //   - Holds one concurrency permit for the provider for the whole call, across retries.
    //   - Each attempt gets a fresh deadline of provider.timeoutMs covering connect, header and body.
    //   - Retries network failures, timeouts, 408, 429 and 5xx up to provider.maxRetries times, waiting
    //     BackoffDelayMs(attempt) plus jitter before each retry.
    // Throws:
    //   errors::UpstreamError carrying the last observed status (or timedOut / network failure);
    //   errors::ConfigurationError for an unusable base URL.
    //==========================================================================================================
    boost::asio::awaitable<UpstreamResponse> Send(const ProviderConfig& provider, const std::string& body,
                                                  const std::string& credential);

    const RetryPolicy& Policy() const { return policy; }

private:
    boost::asio::awaitable<UpstreamResponse> attempt(std::shared_ptr<ConnectionPool> pool,
                                                     const boost::beast::http::request<boost::beast::http::string_body>& req,
                                                     std::chrono::milliseconds timeout);

    ConnectionPoolManager& pools;
    ConcurrencyLimiter& limiter;
    RetryPolicy policy;
};

} // namespace chatproxy
