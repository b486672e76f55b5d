//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseSink.h
// Purpose: Client-facing response channel used by the request handler and streaming relay
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace chatproxy {

// Raised by a sink when the client connection is gone.
class ClientDisconnected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// IResponseSink
// Purpose: Abstracts the inbound connection so the pipeline can be driven by the HTTP server or by tests.
// Notes:
//   - Either SendJson() is called once, or BeginEventStream() followed by WriteChunk()* and End().
//   - Committed() turns true once response headers have been written; after that SendJson() is invalid.
//   - Write failures throw ClientDisconnected.
//==========================================================================================================
class IResponseSink {
public:
    virtual ~IResponseSink() = default;

    virtual boost::asio::awaitable<void> SendJson(int status, std::string body) = 0;

    // 200 with Content-Type text/event-stream, Cache-Control no-cache, Connection keep-alive.
    virtual boost::asio::awaitable<void> BeginEventStream() = 0;
    virtual boost::asio::awaitable<void> WriteChunk(std::string_view data) = 0;
    virtual boost::asio::awaitable<void> End() = 0;

    // Terminates a committed response without completing it (the client sees a truncated stream).
    virtual void Abort() = 0;

    virtual bool Committed() const = 0;
};

} // namespace chatproxy
