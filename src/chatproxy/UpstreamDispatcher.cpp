//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/UpstreamDispatcher.cpp
// Purpose: Upstream client with retries
//==========================================================================================================

#include <exception>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "chatproxy/UpstreamDispatcher.hpp"
#include "chatproxy/errors/Errors.h"
#include "logging/Logger.h"
#include "logging/Redact.h"

namespace chatproxy {
namespace net = boost::asio;
namespace http = boost::beast::http;
using Clock = std::chrono::steady_clock;

UpstreamDispatcher::UpstreamDispatcher(ConnectionPoolManager& p, ConcurrencyLimiter& l, RetryPolicy r)
    : pools(p), limiter(l), policy(r) {}

net::awaitable<UpstreamResponse> UpstreamDispatcher::attempt(std::shared_ptr<ConnectionPool> pool,
                                                             const http::request<http::string_body>& req,
                                                             std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    auto ex = co_await UpstreamExchange::Open(pool, req, deadline);

    UpstreamResponse res;
    res.status = ex.Status();
    res.headers = ex.Headers();
    res.body = co_await ex.ReadAll(deadline, kMaxResponseBytes);
    ex.Finish();

    if (res.status >= 400) {
        throw errors::UpstreamError("Upstream returned " + std::to_string(res.status), res.status, res.body);
    }
    co_return res;
}

net::awaitable<UpstreamResponse> UpstreamDispatcher::Send(const ProviderConfig& provider, const std::string& body,
                                                          const std::string& credential) {
    const auto started = Clock::now();
    auto permit = co_await limiter.Acquire(provider.id, provider.maxConcurrent);

    const auto prepared = PrepareUpstreamRequest(pools, provider, body, credential, false);
    const auto timeout = std::chrono::milliseconds(provider.timeoutMs);

    std::exception_ptr lastError;
    std::string lastMessage;
    for (int attemptNo = 0; attemptNo <= provider.maxRetries; ++attemptNo) {
        if (attemptNo > 0) {
            const int64_t delay = BackoffDelayMs(attemptNo, policy);
            LOG_INFO("Retrying request to '{}' (attempt {}/{}), delay_ms={}",
                     provider.id, attemptNo, provider.maxRetries, delay);
            net::steady_timer wait(co_await net::this_coro::executor,
                                   std::chrono::milliseconds(delay + JitterMs(policy)));
            co_await wait.async_wait(net::use_awaitable);
        }

        bool retryable = false;
        try {
            UpstreamResponse res = co_await attempt(prepared.pool, prepared.request, timeout);
            LOG_INFO("Upstream request completed: provider={} status={} latency_ms={}", provider.id, res.status,
                     std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());
            co_return res;
        } catch (const errors::UpstreamError& e) {
            lastError = std::current_exception();
            lastMessage = e.what();
            if (!e.body.empty()) {
                lastMessage += " " + e.body;
            }
            retryable = errors::IsRetryable(e);
        }

        if (!retryable || attemptNo >= provider.maxRetries) {
            break;
        }
        LOG_WARN("Upstream request to '{}' failed, retrying ({}/{}): {}",
                 provider.id, attemptNo + 1, provider.maxRetries, logging::RedactSecrets(lastMessage));
    }

    LOG_ERROR("Upstream request to '{}' failed: {}", provider.id, logging::RedactSecrets(lastMessage));
    std::rethrow_exception(lastError);
}

} // namespace chatproxy
