//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/Transformer.cpp
// Purpose: Request transformation pipeline (parse -> filter -> rewrite -> reserialize)
//==========================================================================================================

#include <memory>
#include <stdexcept>

#include "chatproxy/Transformer.hpp"
#include "chatproxy/Url.h"
#include "chatproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace chatproxy {

namespace {

bool hostMatches(const std::string& host, const std::string& domain) {
    if (host == domain) {
        return true;
    }
    if (host.size() > domain.size() + 1) {
        const std::size_t off = host.size() - domain.size();
        return host[off - 1] == '.' && host.compare(off, domain.size(), domain) == 0;
    }
    return false;
}

} // namespace

ChatRequest ParseChatRequest(const std::string& body) {
    ChatRequest out;
    try {
        out.body = ParseJson(body);
    } catch (const JsonParseError& e) {
        throw errors::RequestError(std::string("Invalid JSON in request body: ") + e.what());
    }
    const auto* obj = out.body.asObject();
    if (!obj) {
        throw errors::RequestError("Invalid JSON in request body: expected an object");
    }
    auto model = obj->find("model");
    if (model == obj->end() || !model->second || !model->second->isString() ||
        model->second->asString()->empty()) {
        throw errors::RequestError("Request must contain 'model' field (string)");
    }
    auto messages = obj->find("messages");
    if (messages == obj->end() || !messages->second || !messages->second->isArray()) {
        throw errors::RequestError("Request must contain 'messages' field (array)");
    }
    out.model = *model->second->asString();
    auto stream = obj->find("stream");
    if (stream != obj->end() && stream->second && stream->second->asBool()) {
        out.stream = *stream->second->asBool();
    }
    return out;
}

CacheBehavior InferCacheBehavior(const std::string& baseUrl) {
    std::string host;
    try {
        host = ParseUrl(baseUrl).host;
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG("Cannot infer cache behavior from '{}': {}", baseUrl, e.what());
        return CacheBehavior::Passthrough;
    }
    if (hostMatches(host, "openai.com")) return CacheBehavior::Drop;
    if (hostMatches(host, "openrouter.ai")) return CacheBehavior::OpenRouter;
    if (hostMatches(host, "z.ai")) return CacheBehavior::Zai;
    return CacheBehavior::Passthrough;
}

CacheBehavior EffectiveCacheBehavior(const ProviderConfig& provider) {
    if (provider.cacheBehavior.has_value()) {
        return provider.cacheBehavior.value();
    }
    return InferCacheBehavior(provider.baseUrl);
}

void ApplyCapabilityFilter(JSONValue::Object& request, const std::set<std::string>& allowedFields) {
    for (const auto& field : request.keys()) {
        if (allowedFields.find(field) == allowedFields.end()) {
            LOG_DEBUG("Dropped field '{}' for provider (not supported)", field);
            request.erase(field);
        }
    }
}

void RewriteCacheField(JSONValue::Object& request, CacheBehavior behavior) {
    auto it = request.find("cache");
    if (it == request.end()) {
        return;
    }
    const JSONValue& cache = it->second ? *it->second : JSONValue();

    switch (behavior) {
        case CacheBehavior::Drop:
            LOG_DEBUG("Dropped field 'cache' (provider has no cache support)");
            request.erase("cache");
            break;
        case CacheBehavior::OpenRouter:
            if (const bool* b = cache.asBool()) {
                if (*b) {
                    JSONValue::Object obj;
                    obj["type"] = std::make_shared<JSONValue>("random");
                    obj["max_age"] = std::make_shared<JSONValue>(static_cast<int64_t>(300));
                    LOG_DEBUG("Rewrote 'cache': true -> {{type:random,max_age:300}}");
                    request.set("cache", JSONValue(std::move(obj)));
                } else {
                    LOG_DEBUG("Dropped field 'cache' (false)");
                    request.erase("cache");
                }
            }
            break;
        case CacheBehavior::Zai:
            if (const auto* obj = cache.asObject()) {
                bool enabled = false;
                auto t = obj->find("type");
                if (t != obj->end() && t->second && t->second->asString()) {
                    enabled = *t->second->asString() == "random";
                }
                LOG_DEBUG("Rewrote 'cache': object -> {}", enabled);
                request.set("cache", JSONValue(enabled));
            }
            break;
        case CacheBehavior::Passthrough:
            break;
    }
}

JSONValue TransformRequest(const JSONValue& request, const ProviderConfig& provider,
                           std::optional<bool> enableReasoning) {
    JSONValue transformed = request;
    auto* obj = transformed.asObject();
    if (!obj) {
        throw errors::RequestError("Request body must be a JSON object");
    }

    ApplyCapabilityFilter(*obj, provider.allowedFields);
    RewriteCacheField(*obj, EffectiveCacheBehavior(provider));

    if (enableReasoning.value_or(false) &&
        provider.allowedFields.count("reasoning") != 0 && !obj->contains("reasoning")) {
        JSONValue::Object reasoning;
        reasoning["enabled"] = std::make_shared<JSONValue>(true);
        obj->set("reasoning", JSONValue(std::move(reasoning)));
        LOG_DEBUG("Injected reasoning {{enabled:true}} for provider '{}'", provider.id);
    }
    return transformed;
}

std::string SerializeRequest(const JSONValue& request) {
    try {
        std::string json = SerializeJson(request);
        // Validate by parsing back
        (void)ParseJson(json);
        return json;
    } catch (const JsonSerializeError& e) {
        throw errors::SerializationError(std::string("Failed to serialize request: ") + e.what());
    } catch (const JsonParseError& e) {
        throw errors::SerializationError(std::string("Failed to serialize request: ") + e.what());
    }
}

} // namespace chatproxy
