//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transformer.hpp
// Purpose: Per-provider request body transformation (capability whitelist and field rewrites)
//==========================================================================================================

#pragma once

#include <optional>
#include <set>
#include <string>

#include "chatproxy/Config.h"
#include "chatproxy/Json.h"

namespace chatproxy {

//==========================================================================================================
// ChatRequest
// Purpose: Parsed client payload plus the fields the handler needs before transformation.
// Fields:
//   body: Full request object, client field order preserved.
//   model: Client-supplied alias (non-empty).
//   stream: True when the client sent "stream": true.
//==========================================================================================================
struct ChatRequest {
    JSONValue body;
    std::string model;
    bool stream{false};
};

//==========================================================================================================
// ParseChatRequest
// Purpose: Parses and validates an inbound chat completion body.
// Throws:
//   errors::RequestError (400) for invalid JSON, a missing/empty string "model" or a non-array "messages".
//==========================================================================================================
ChatRequest ParseChatRequest(const std::string& body);

//==========================================================================================================
// InferCacheBehavior
// Purpose: Cache rewrite mode derived from the base URL host (exact host or dot-suffix match).
// Returns:
//   Drop for openai.com, OpenRouter for openrouter.ai, Zai for z.ai, Passthrough otherwise.
//==========================================================================================================
CacheBehavior InferCacheBehavior(const std::string& baseUrl);

// Explicit cache_behavior when configured, otherwise InferCacheBehavior(baseUrl).
CacheBehavior EffectiveCacheBehavior(const ProviderConfig& provider);

// Removes every top-level field not in allowedFields. Idempotent.
void ApplyCapabilityFilter(JSONValue::Object& request, const std::set<std::string>& allowedFields);

// Applies the cache field decision table for the given behavior; no-op when "cache" is absent.
void RewriteCacheField(JSONValue::Object& request, CacheBehavior behavior);

//==========================================================================================================
// TransformRequest
// Purpose: Returns a transformed copy of request for the provider.
// Notes:
//   Order: capability filter, cache rewrite, then reasoning injection. Reasoning {"enabled":true} is added
//   only when enableReasoning is true, the whitelist contains "reasoning" and the client did not send one.
//   The "model" field is not touched here; the handler sets the upstream model afterwards.
//==========================================================================================================
JSONValue TransformRequest(const JSONValue& request, const ProviderConfig& provider,
                           std::optional<bool> enableReasoning = std::nullopt);

//==========================================================================================================
// SerializeRequest
// Purpose: Serializes the transformed request and verifies it parses back.
// Throws:
//   errors::SerializationError on failure (e.g. non-finite numbers).
//==========================================================================================================
std::string SerializeRequest(const JSONValue& request);

} // namespace chatproxy
