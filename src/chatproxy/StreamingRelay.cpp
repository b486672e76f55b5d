//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/StreamingRelay.cpp
// Purpose: Relays upstream event streams to the client as they arrive
//==========================================================================================================

#include <chrono>

#include "chatproxy/SseFramer.hpp"
#include "chatproxy/StreamingRelay.hpp"
#include "chatproxy/UpstreamExchange.hpp"
#include "chatproxy/errors/Errors.h"
#include "logging/Logger.h"
#include "logging/Redact.h"

namespace chatproxy {
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

StreamingRelay::StreamingRelay(ConnectionPoolManager& p, ConcurrencyLimiter& l) : pools(p), limiter(l) {}

net::awaitable<void> StreamingRelay::Relay(IResponseSink& sink, const ProviderConfig& provider,
                                           const std::string& body, const std::string& credential,
                                           const std::string& alias) {
    const auto started = Clock::now();
    auto permit = co_await limiter.Acquire(provider.id, provider.maxConcurrent);

    const auto prepared = PrepareUpstreamRequest(pools, provider, body, credential, true);
    const auto timeout = std::chrono::milliseconds(provider.timeoutMs);
    auto ex = co_await UpstreamExchange::Open(prepared.pool, prepared.request, Clock::now() + timeout);

    if (ex.Status() >= 400) {
        const int status = ex.Status();
        std::string errorBody = co_await ex.ReadAll(Clock::now() + timeout, kMaxErrorBodyBytes);
        ex.Finish();
        LOG_ERROR("Upstream streaming request to '{}' failed with status {}: {}",
                  provider.id, status, logging::RedactSecrets(errorBody));
        throw errors::UpstreamError("Upstream streaming failed: " + std::to_string(status), status, errorBody);
    }

    SseFramer framer(provider.streamingAdapter, alias);
    std::size_t forwarded = 0;
    std::string failure;
    bool disconnected = false;
    try {
        co_await sink.BeginEventStream();
        char buf[8192];
        while (!ex.Done()) {
            const std::size_t n = co_await ex.ReadSome(buf, sizeof(buf), Clock::now() + timeout);
            const std::string events = framer.Feed(std::string_view(buf, n));
            if (!events.empty()) {
                co_await sink.WriteChunk(events);
                forwarded += events.size();
            }
        }
        co_await sink.WriteChunk(framer.Finish());
        co_await sink.End();
    } catch (const ClientDisconnected& e) {
        disconnected = true;
        failure = e.what();
    } catch (const errors::UpstreamError& e) {
        failure = e.what();
    }

    if (disconnected) {
        LOG_DEBUG("Client disconnected during stream from '{}' after {} bytes: {}", provider.id, forwarded, failure);
        ex.Abandon();
        co_return;
    }
    if (!failure.empty()) {
        LOG_ERROR("Upstream stream from '{}' failed after {} bytes: {}", provider.id, forwarded, failure);
        ex.Abandon();
        sink.Abort();
        co_return;
    }

    ex.Finish();
    LOG_INFO("Upstream stream completed: provider={} bytes={} latency_ms={}", provider.id, forwarded,
             std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count());
}

} // namespace chatproxy
