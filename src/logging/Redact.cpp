//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/logging/Redact.cpp
// Purpose: Credential masking helpers used by the proxy before logging upstream data.
//==========================================================================================================

#include <cctype>
#include <string>

#include "logging/Redact.h"

namespace logging {

namespace {

std::string toLower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool isKeyChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '_' || c == '-';
}

bool isTokenChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isspace(u) == 0 && c != '"' && c != '\'' && c != ',';
}

} // namespace

bool IsSensitiveKey(std::string_view name) {
    const std::string lower = toLower(name);
    return lower.find("key") != std::string::npos ||
           lower.find("token") != std::string::npos ||
           lower.find("secret") != std::string::npos ||
           lower.find("authorization") != std::string::npos;
}

std::string RedactSecrets(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    const std::string lower = toLower(text);
    std::size_t i = 0;
    while (i < text.size()) {
        // Bearer <token>
        if (lower.compare(i, 7, "bearer ") == 0) {
            std::size_t j = i + 7;
            while (j < text.size() && text[j] == ' ') ++j;
            std::size_t k = j;
            while (k < text.size() && isTokenChar(text[k])) ++k;
            if (k > j) {
                out.append(text.substr(i, j - i));
                out.append(kRedacted);
                i = k;
                continue;
            }
        }
        // sk-XXXXXXXXXXXXXXXXXXXX... (only at a token boundary)
        if (lower.compare(i, 3, "sk-") == 0 && (i == 0 || !isKeyChar(text[i - 1]))) {
            std::size_t k = i + 3;
            while (k < text.size() && isKeyChar(text[k])) ++k;
            if (k - (i + 3) >= 20) {
                out.append(kRedacted);
                i = k;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

} // namespace logging
