//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestHandler.hpp
// Purpose: Per-request orchestration of routing, transformation and upstream dispatch
//==========================================================================================================

#pragma once

#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "chatproxy/CredentialStore.hpp"
#include "chatproxy/ResponseSink.h"
#include "chatproxy/Router.hpp"
#include "chatproxy/StreamingRelay.hpp"
#include "chatproxy/UpstreamDispatcher.hpp"

namespace chatproxy {

//==========================================================================================================
// RequestHandler
// Purpose: Drives one chat completion request: parse, route, transform, then dispatch or relay.
// Notes:
//   - Every failure becomes a JSON error body with the status of the ProxyError that caused it; other
//     exceptions are answered with 500 "Internal server error". After a stream has been committed the
//     response can only be aborted.
//   - The client's model alias is echoed in the "model" field of non-streaming responses.
//   - Nothing is retried here.
//==========================================================================================================
class RequestHandler {
public:
    RequestHandler(const Router& router, const CredentialStore& credentials,
                   UpstreamDispatcher& dispatcher, StreamingRelay& relay);

    boost::asio::awaitable<void> HandleChatCompletion(const std::string& body, IResponseSink& sink);

    // {"status":"ok","timestamp":<epoch ms>}
    static std::string HealthzBody();

private:
    boost::asio::awaitable<void> process(const std::string& body, IResponseSink& sink);

    const Router& router;
    const CredentialStore& credentials;
    UpstreamDispatcher& dispatcher;
    StreamingRelay& relay;
};

// Replaces the top-level "model" of an upstream JSON response with alias.
// Throws errors::SerializationError when the body is not valid JSON.
std::string EchoModelAlias(const std::string& upstreamBody, const std::string& alias);

} // namespace chatproxy
