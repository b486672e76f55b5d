//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Redact.h
// Purpose: Masking of credentials before text reaches the log sink.
//==========================================================================================================
#pragma once

#include <string>
#include <string_view>

namespace logging {

inline constexpr const char* kRedacted = "***REDACTED***";

//==========================================================================================================
// IsSensitiveKey
// Purpose: True when a field/header name suggests a credential (contains key, token, secret, authorization).
//==========================================================================================================
bool IsSensitiveKey(std::string_view name);

//==========================================================================================================
// RedactSecrets
// Purpose: Returns a copy of text with bearer tokens and sk- style API keys replaced by kRedacted.
// Notes:
//   - "Bearer <token>" keeps the scheme word and masks the token.
//   - "sk-" followed by at least 20 characters of [A-Za-z0-9_-] is masked as a whole.
//==========================================================================================================
std::string RedactSecrets(std::string_view text);

} // namespace logging
