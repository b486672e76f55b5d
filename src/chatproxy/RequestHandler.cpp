//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/RequestHandler.cpp
// Purpose: Per-request orchestration of routing, transformation and upstream dispatch
//==========================================================================================================

#include <chrono>

#include "chatproxy/Json.h"
#include "chatproxy/RequestHandler.hpp"
#include "chatproxy/Transformer.hpp"
#include "chatproxy/errors/Errors.h"
#include "logging/Logger.h"
#include "logging/Redact.h"

namespace chatproxy {
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

RequestHandler::RequestHandler(const Router& r, const CredentialStore& c, UpstreamDispatcher& d, StreamingRelay& s)
    : router(r), credentials(c), dispatcher(d), relay(s) {}

std::string RequestHandler::HealthzBody() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    JSONValue::Object o;
    o.set("status", JSONValue("ok"));
    o.set("timestamp", JSONValue(static_cast<int64_t>(now)));
    return SerializeJson(JSONValue(std::move(o)));
}

std::string EchoModelAlias(const std::string& upstreamBody, const std::string& alias) {
    JSONValue doc;
    try {
        doc = ParseJson(upstreamBody);
    } catch (const JsonParseError& e) {
        throw errors::SerializationError(std::string("Failed to parse upstream response: ") + e.what());
    }
    if (auto* obj = doc.asObject()) {
        obj->set("model", JSONValue(alias));
    }
    try {
        return SerializeJson(doc);
    } catch (const JsonSerializeError& e) {
        throw errors::SerializationError(std::string("Failed to serialize response: ") + e.what());
    }
}

net::awaitable<void> RequestHandler::process(const std::string& body, IResponseSink& sink) {
    ChatRequest request = ParseChatRequest(body);
    const ResolvedRoute route = router.ResolveRoute(request.model);
    LOG_INFO("Routing '{}' -> {}/{} (stream={})", request.model, route.provider, route.model, request.stream);

    JSONValue transformed = TransformRequest(request.body, route.providerConfig, route.enableReasoning);
    if (auto* obj = transformed.asObject()) {
        obj->set("model", JSONValue(route.model));
    }
    const std::string upstreamBody = SerializeRequest(transformed);
    const std::string& credential = credentials.Resolve(route.provider);

    if (request.stream) {
        co_await relay.Relay(sink, route.providerConfig, upstreamBody, credential, request.model);
        co_return;
    }

    UpstreamResponse res = co_await dispatcher.Send(route.providerConfig, upstreamBody, credential);
    co_await sink.SendJson(res.status, EchoModelAlias(res.body, request.model));
}

net::awaitable<void> RequestHandler::HandleChatCompletion(const std::string& body, IResponseSink& sink) {
    const auto started = Clock::now();
    int status = 0;
    std::string errorBody;
    try {
        co_await process(body, sink);
    } catch (const ClientDisconnected& e) {
        LOG_DEBUG("Client disconnected before the response was sent: {}", e.what());
        co_return;
    } catch (const errors::ProxyError& e) {
        status = e.httpStatus;
        errorBody = errors::MakeErrorBody(e);
        LOG_ERROR("Request failed ({} {}): {}", status, errors::ToString(e.type), logging::RedactSecrets(e.what()));
    } catch (const std::exception& e) {
        status = 500;
        errorBody = errors::MakeErrorBody(std::string("Internal server error: ") + e.what(), errors::ErrorType::Api);
        LOG_ERROR("Unhandled error while processing request: {}", e.what());
    }

    const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
    if (status == 0) {
        LOG_DEBUG("Request completed in {} ms", latency);
        co_return;
    }
    if (sink.Committed()) {
        sink.Abort();
        co_return;
    }
    co_await sink.SendJson(status, std::move(errorBody));
    LOG_DEBUG("Request failed with {} in {} ms", status, latency);
}

} // namespace chatproxy
