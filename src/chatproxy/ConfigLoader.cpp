//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/ConfigLoader.cpp
// Purpose: routes.json / providers.json loading and validation
//==========================================================================================================

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "chatproxy/ConfigLoader.hpp"
#include "chatproxy/Duration.h"
#include "chatproxy/Json.h"
#include "chatproxy/Url.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace chatproxy {

const char* ToString(CacheBehavior b) {
    switch (b) {
        case CacheBehavior::Drop: return "drop";
        case CacheBehavior::OpenRouter: return "openrouter";
        case CacheBehavior::Zai: return "zai";
        case CacheBehavior::Passthrough: return "passthrough";
    }
    return "passthrough";
}

const char* ToString(StreamingAdapter a) {
    return a == StreamingAdapter::Rewrite ? "rewrite" : "none";
}

std::optional<CacheBehavior> CacheBehaviorFromString(const std::string& s) {
    if (s == "drop") return CacheBehavior::Drop;
    if (s == "openrouter") return CacheBehavior::OpenRouter;
    if (s == "zai") return CacheBehavior::Zai;
    if (s == "passthrough") return CacheBehavior::Passthrough;
    return std::nullopt;
}

std::optional<StreamingAdapter> StreamingAdapterFromString(const std::string& s) {
    if (s == "none") return StreamingAdapter::None;
    if (s == "rewrite") return StreamingAdapter::Rewrite;
    return std::nullopt;
}

namespace {

// Upper bound for provider timeouts; deadlines are computed as steady_clock::now() + timeout.
constexpr int64_t kMaxTimeoutMs = 24LL * 60 * 60 * 1000;

[[noreturn]] void fail(const std::string& source, const std::string& what) {
    throw std::runtime_error(source + ": " + what);
}

std::string readFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("Config not found: " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

JSONValue parseDocument(const std::string& text, const std::string& source) {
    try {
        JSONValue root = ParseJson(text);
        if (!root.isObject()) {
            fail(source, "top-level value must be an object");
        }
        return root;
    } catch (const JsonParseError& e) {
        fail(source, std::string("invalid JSON: ") + e.what());
    }
}

const JSONValue* member(const JSONValue::Object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || it->second->isNull()) {
        return nullptr;
    }
    return it->second.get();
}

const JSONValue::Object* objectAt(const JSONValue::Object& obj, const std::string& key,
                                  const std::string& source, const std::string& path) {
    const JSONValue* v = member(obj, key);
    if (!v) {
        return nullptr;
    }
    if (!v->isObject()) {
        fail(source, "'" + path + "' must be an object");
    }
    return v->asObject();
}

std::optional<std::string> stringAt(const JSONValue::Object& obj, const std::string& key,
                                    const std::string& source, const std::string& path) {
    const JSONValue* v = member(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->isString()) {
        fail(source, "'" + path + "' must be a string");
    }
    return *v->asString();
}

std::optional<int64_t> intAt(const JSONValue::Object& obj, const std::string& key,
                             const std::string& source, const std::string& path) {
    const JSONValue* v = member(obj, key);
    if (!v) {
        return std::nullopt;
    }
    auto n = v->asInt();
    if (!n.has_value()) {
        fail(source, "'" + path + "' must be an integer");
    }
    return n;
}

std::optional<bool> boolAt(const JSONValue::Object& obj, const std::string& key,
                           const std::string& source, const std::string& path) {
    const JSONValue* v = member(obj, key);
    if (!v) {
        return std::nullopt;
    }
    if (!v->isBool()) {
        fail(source, "'" + path + "' must be a boolean");
    }
    return *v->asBool();
}

ProviderConfig parseProvider(const std::string& id, const JSONValue::Object& p, const std::string& source) {
    const std::string prefix = "providers." + id + ".";
    ProviderConfig cfg;
    cfg.id = id;

    auto baseUrl = stringAt(p, "base_url", source, prefix + "base_url");
    if (!baseUrl || baseUrl->empty()) {
        fail(source, "Provider '" + id + "' is missing required field 'base_url'");
    }
    try {
        (void)ParseUrl(*baseUrl);
    } catch (const std::invalid_argument& e) {
        fail(source, "Provider '" + id + "' has invalid base_url: " + e.what());
    }
    // A trailing slash would produce "//chat/completions"
    while (baseUrl->size() > 1 && baseUrl->back() == '/') {
        baseUrl->pop_back();
    }
    cfg.baseUrl = *baseUrl;

    auto keyEnv = stringAt(p, "api_key_env", source, prefix + "api_key_env");
    if (!keyEnv || keyEnv->empty()) {
        fail(source, "Provider '" + id + "' is missing required field 'api_key_env'");
    }
    cfg.apiKeyEnv = *keyEnv;

    if (auto h = stringAt(p, "auth_header", source, prefix + "auth_header")) {
        if (h->find(':') == std::string::npos) {
            fail(source, "'" + prefix + "auth_header' must have the form 'Name: value'");
        }
        cfg.authHeader = *h;
    }

    const JSONValue* fields = member(p, "allowed_fields");
    if (!fields || !fields->isArray()) {
        fail(source, "Provider '" + id + "' must have an 'allowed_fields' array");
    }
    for (const auto& f : *fields->asArray()) {
        if (!f || !f->isString()) {
            fail(source, "'" + prefix + "allowed_fields' must contain only strings");
        }
        cfg.allowedFields.insert(*f->asString());
    }

    if (auto a = stringAt(p, "streaming_adapter", source, prefix + "streaming_adapter")) {
        auto adapter = StreamingAdapterFromString(*a);
        if (!adapter) {
            fail(source, "'" + prefix + "streaming_adapter' must be 'none' or 'rewrite'");
        }
        cfg.streamingAdapter = *adapter;
    }

    if (auto t = stringAt(p, "default_timeout", source, prefix + "default_timeout")) {
        cfg.defaultTimeout = *t;
    }
    auto ms = ParseDuration(cfg.defaultTimeout);
    if (!ms.has_value() || *ms <= 0) {
        fail(source, "Provider '" + id + "' has invalid default_timeout: " + cfg.defaultTimeout);
    }
    if (*ms > kMaxTimeoutMs) {
        fail(source, "Provider '" + id + "' default_timeout exceeds 24h: " + cfg.defaultTimeout);
    }
    cfg.timeoutMs = *ms;

    if (auto r = intAt(p, "max_retries", source, prefix + "max_retries")) {
        if (*r < 0 || *r > 100) {
            fail(source, "'" + prefix + "max_retries' must be between 0 and 100");
        }
        cfg.maxRetries = static_cast<int>(*r);
    }

    if (auto c = intAt(p, "max_concurrent", source, prefix + "max_concurrent")) {
        if (*c < 1) {
            fail(source, "'" + prefix + "max_concurrent' must be >= 1");
        }
        cfg.maxConcurrent = static_cast<std::size_t>(*c);
    }

    if (auto b = stringAt(p, "cache_behavior", source, prefix + "cache_behavior")) {
        auto behavior = CacheBehaviorFromString(*b);
        if (!behavior) {
            fail(source, "'" + prefix + "cache_behavior' must be one of drop|openrouter|zai|passthrough");
        }
        cfg.cacheBehavior = *behavior;
    }
    return cfg;
}

} // namespace

RoutesConfig ConfigLoader::ParseRoutes(const std::string& text, const std::string& source) {
    JSONValue root = parseDocument(text, source);
    const auto& obj = *root.asObject();

    RoutesConfig cfg;
    const auto* slots = objectAt(obj, "model_slots", source, "model_slots");
    if (!slots || slots->empty()) {
        fail(source, "routes config must contain at least one model_slot");
    }
    for (const auto& [name, value] : *slots) {
        if (!value || !value->isObject()) {
            fail(source, "Model slot '" + name + "' must be an object");
        }
        const auto& s = *value->asObject();
        const std::string prefix = "model_slots." + name + ".";
        auto provider = stringAt(s, "provider", source, prefix + "provider");
        auto model = stringAt(s, "model", source, prefix + "model");
        if (!provider || provider->empty() || !model || model->empty()) {
            fail(source, "Model slot '" + name + "' must have 'provider' and 'model' fields");
        }
        ModelSlot slot;
        slot.provider = *provider;
        slot.model = *model;
        slot.enableReasoning = boolAt(s, "enable_reasoning", source, prefix + "enable_reasoning");
        cfg.modelSlots.emplace(name, std::move(slot));
    }

    if (const auto* proxy = objectAt(obj, "proxy", source, "proxy")) {
        cfg.fallbackToDefault =
            boolAt(*proxy, "fallback_to_default", source, "proxy.fallback_to_default").value_or(false);
    }
    return cfg;
}

ProvidersConfig ConfigLoader::ParseProviders(const std::string& text, const std::string& source) {
    JSONValue root = parseDocument(text, source);
    const auto& obj = *root.asObject();

    ProvidersConfig cfg;
    const auto* providers = objectAt(obj, "providers", source, "providers");
    if (!providers || providers->empty()) {
        fail(source, "providers config must contain at least one provider");
    }
    for (const auto& [id, value] : *providers) {
        if (!value || !value->isObject()) {
            fail(source, "Provider '" + id + "' must be an object");
        }
        cfg.providers.emplace(id, parseProvider(id, *value->asObject(), source));
    }

    if (const auto* proxy = objectAt(obj, "proxy", source, "proxy")) {
        ProxySettings& ps = cfg.proxy;
        if (auto a = stringAt(*proxy, "listen_address", source, "proxy.listen_address")) ps.listenAddress = *a;
        if (auto p = intAt(*proxy, "listen_port", source, "proxy.listen_port")) {
            if (*p < 0 || *p > 65535) {
                fail(source, "'proxy.listen_port' must be between 0 and 65535");
            }
            ps.listenPort = std::to_string(*p);
        }
        if (auto l = stringAt(*proxy, "log_level", source, "proxy.log_level")) ps.logLevel = *l;
        if (auto f = stringAt(*proxy, "log_file", source, "proxy.log_file")) ps.logFile = *f;
        if (auto m = intAt(*proxy, "max_body_bytes", source, "proxy.max_body_bytes")) {
            if (*m < 1) {
                fail(source, "'proxy.max_body_bytes' must be >= 1");
            }
            ps.maxBodyBytes = static_cast<std::size_t>(*m);
        }
    }
    return cfg;
}

RoutesConfig ConfigLoader::LoadRoutes(const std::string& path) {
    return ParseRoutes(readFile(path), path);
}

ProvidersConfig ConfigLoader::LoadProviders(const std::string& path) {
    return ParseProviders(readFile(path), path);
}

LoadedConfig ConfigLoader::LoadDirectory(const std::string& dir) {
    std::string base = dir.empty() ? std::string(".") : dir;
    if (base.back() != '/') {
        base.push_back('/');
    }
    LoadedConfig out;
    out.routes = LoadRoutes(base + "routes.json");
    out.providers = LoadProviders(base + "providers.json");

    for (const auto& [name, slot] : out.routes.modelSlots) {
        if (out.providers.providers.find(slot.provider) == out.providers.providers.end()) {
            // Not fatal: the router reports it as api_error when the slot is used
            LOG_WARN("Model slot '{}' references unknown provider '{}'", name, slot.provider);
        }
    }
    LOG_INFO("Loaded {} model slot(s) and {} provider(s) from {}",
             out.routes.modelSlots.size(), out.providers.providers.size(), base);
    return out;
}

std::string ConfigLoader::ResolveConfigDir(const std::string& cliValue) {
    if (!cliValue.empty()) {
        return cliValue;
    }
    return GetEnvOrDefault("CHATPROXY_CONFIG_DIR", "./config");
}

} // namespace chatproxy
