//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Immutable routing and provider tables consumed by the proxy pipeline
//==========================================================================================================

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace chatproxy {

// Per-provider treatment of the "cache" request field.
enum class CacheBehavior {
    Drop,        // remove regardless of type
    OpenRouter,  // true -> {type:random,max_age:300}, false -> removed, object unchanged
    Zai,         // object -> bool (type == random), bool unchanged
    Passthrough  // no rewrite
};

enum class StreamingAdapter {
    None,
    Rewrite
};

const char* ToString(CacheBehavior b);
const char* ToString(StreamingAdapter a);
std::optional<CacheBehavior> CacheBehaviorFromString(const std::string& s);
std::optional<StreamingAdapter> StreamingAdapterFromString(const std::string& s);

//==========================================================================================================
// ModelSlot
// Purpose: Alias -> provider/model mapping from routes.json.
//==========================================================================================================
struct ModelSlot {
    std::string provider;
    std::string model;
    std::optional<bool> enableReasoning;
};

//==========================================================================================================
// ProviderConfig
// Purpose: One upstream provider from providers.json.
// Fields:
//   id: Key in the provider table; also the concurrency limiter key.
//   baseUrl: Provider API base (http/https).
//   apiKeyEnv: Name of the environment variable holding the credential.
//   authHeader: Template "Name: value" where ${API_KEY} is replaced by the credential.
//   allowedFields: Top-level request fields forwarded upstream.
//   defaultTimeout/timeoutMs: Per-attempt budget, as configured and parsed.
//   maxConcurrent: Concurrency limiter capacity for this provider.
//   cacheBehavior: Explicit cache rewrite mode; inferred from the base URL host when unset.
//==========================================================================================================
struct ProviderConfig {
    std::string id;
    std::string baseUrl;
    std::string apiKeyEnv;
    std::string authHeader{"Authorization: Bearer ${API_KEY}"};
    std::set<std::string> allowedFields;
    StreamingAdapter streamingAdapter{StreamingAdapter::None};
    std::string defaultTimeout{"60s"};
    int64_t timeoutMs{60000};
    int maxRetries{2};
    std::size_t maxConcurrent{25};
    std::optional<CacheBehavior> cacheBehavior;
};

struct RoutesConfig {
    std::map<std::string, ModelSlot> modelSlots;
    bool fallbackToDefault{false};
};

//==========================================================================================================
// ProxySettings
// Purpose: Process-level settings from the "proxy" section of providers.json.
//==========================================================================================================
struct ProxySettings {
    std::string listenAddress{"127.0.0.1"};
    std::string listenPort{"8080"};
    std::string logLevel{"INFO"};
    std::string logFile;
    std::size_t maxBodyBytes{10 * 1024 * 1024};
};

struct ProvidersConfig {
    std::map<std::string, ProviderConfig> providers;
    ProxySettings proxy;
};

//==========================================================================================================
// ResolvedRoute
// Purpose: Router output for a single request.
//==========================================================================================================
struct ResolvedRoute {
    std::string provider;
    std::string model;
    ProviderConfig providerConfig;
    std::optional<bool> enableReasoning;
};

} // namespace chatproxy
