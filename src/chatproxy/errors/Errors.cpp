//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/errors/Errors.cpp
// Purpose: Client-facing error body rendering
//==========================================================================================================

#include <memory>
#include <string>

#include "chatproxy/Json.h"
#include "chatproxy/errors/Errors.h"

namespace chatproxy {
namespace errors {

namespace {

// Pulls error.message / error.code out of an OpenAI-style provider error body.
void extractUpstreamDetail(const std::string& body,
                           std::optional<std::string>& message,
                           std::optional<std::string>& code) {
    if (body.empty()) {
        return;
    }
    JSONValue parsed;
    try {
        parsed = ParseJson(body);
    } catch (const JsonParseError&) {
        return; // Plain-text provider bodies are not surfaced
    }
    const auto* root = parsed.asObject();
    if (!root) {
        return;
    }
    auto it = root->find("error");
    if (it == root->end() || !it->second) {
        return;
    }
    if (const auto* s = it->second->asString()) {
        message = *s;
        return;
    }
    const auto* errObj = it->second->asObject();
    if (!errObj) {
        return;
    }
    auto itMsg = errObj->find("message");
    if (itMsg != errObj->end() && itMsg->second && itMsg->second->asString()) {
        message = *itMsg->second->asString();
    }
    auto itCode = errObj->find("code");
    if (itCode != errObj->end() && itCode->second) {
        if (const auto* s = itCode->second->asString()) {
            code = *s;
        } else if (auto n = itCode->second->asInt()) {
            code = std::to_string(*n);
        }
    }
}

} // namespace

std::string MakeErrorBody(const std::string& message, ErrorType type,
                          const std::optional<std::string>& code) {
    JSONValue::Object err;
    err["message"] = std::make_shared<JSONValue>(message);
    err["type"] = std::make_shared<JSONValue>(ToString(type));
    err["param"] = std::make_shared<JSONValue>(nullptr);
    if (code.has_value()) {
        err["code"] = std::make_shared<JSONValue>(code.value());
    }
    JSONValue::Object root;
    root["error"] = std::make_shared<JSONValue>(std::move(err));
    return SerializeJson(JSONValue(std::move(root)));
}

std::string MakeErrorBody(const ProxyError& err) {
    std::string message = err.what();
    std::optional<std::string> code = err.code;
    if (const auto* up = dynamic_cast<const UpstreamError*>(&err)) {
        std::optional<std::string> upstreamMessage;
        extractUpstreamDetail(up->body, upstreamMessage, code);
        if (upstreamMessage.has_value() && !upstreamMessage->empty()) {
            message += ": " + upstreamMessage.value();
        }
    }
    return MakeErrorBody(message, err.type, code);
}

} // namespace errors
} // namespace chatproxy
