//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamingRelay.hpp
// Purpose: Relays upstream event streams to the client as they arrive
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatproxy/ConcurrencyLimiter.hpp"
#include "chatproxy/Config.h"
#include "chatproxy/ConnectionPool.hpp"
#include "chatproxy/ResponseSink.h"

namespace chatproxy {

class StreamingRelay {
public:
    // Upper bound for an upstream error body read before a stream is committed.
    static constexpr std::size_t kMaxErrorBodyBytes = 1024 * 1024;

    StreamingRelay(ConnectionPoolManager& pools, ConcurrencyLimiter& limiter);

    //==========================================================================================================
    // Relay
    // Purpose: Sends body upstream as a streaming request and relays the event stream into sink.
    // Args:
    //   alias: Model alias requested by the client, echoed by the rewrite adapter.
    // Notes:
    //   - Holds one concurrency permit for the provider until the stream ends.
    //   - Nothing is written to sink until the upstream status is known. A status >= 400 is raised as
    //     errors::UpstreamError so the caller can still answer with a JSON error.
    //   - Once committed, each upstream read must complete within provider.timeoutMs. Upstream failures
    //     abort the client response; a disconnected client stops the relay and drops the upstream
    //     connection.
    //   - The stream always ends with a single "data: [DONE]" event when it completes.
    // Throws:
    //   errors::UpstreamError / errors::ConfigurationError before commit only.
    //==========================================================================================================
    boost::asio::awaitable<void> Relay(IResponseSink& sink, const ProviderConfig& provider, const std::string& body,
                                       const std::string& credential, const std::string& alias);

private:
    ConnectionPoolManager& pools;
    ConcurrencyLimiter& limiter;
};

} // namespace chatproxy
