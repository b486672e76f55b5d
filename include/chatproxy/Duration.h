//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Duration.h
// Purpose: Parsing of human-readable durations ("30s", "500ms", "2m", "1h") into milliseconds
//==========================================================================================================

#pragma once

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chatproxy {

//==========================================================================================================
// ParseDuration
// Purpose: Converts "<digits>[ms|s|m|h]" to milliseconds. The unit defaults to seconds when omitted.
// Args:
//   text: Duration string. Signs, whitespace, fractions and unknown units are rejected.
// Returns:
//   Milliseconds, or std::nullopt when the text is not a valid duration or the value overflows.
//==========================================================================================================
inline std::optional<int64_t> ParseDuration(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    if (i == 0) {
        return std::nullopt;
    }
    const std::string_view digits = text.substr(0, i);
    const std::string_view unit = text.substr(i);

    int64_t multiplier = 0;
    if (unit.empty() || unit == "s") {
        multiplier = 1000;
    } else if (unit == "ms") {
        multiplier = 1;
    } else if (unit == "m") {
        multiplier = 60 * 1000;
    } else if (unit == "h") {
        multiplier = 60 * 60 * 1000;
    } else {
        return std::nullopt;
    }

    int64_t value = 0;
    for (char c : digits) {
        const int64_t d = c - '0';
        if (value > (std::numeric_limits<int64_t>::max() - d) / 10) {
            return std::nullopt;
        }
        value = value * 10 + d;
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

// Same as ParseDuration but throws std::invalid_argument on malformed input.
inline int64_t ParseDurationOrThrow(std::string_view text) {
    auto ms = ParseDuration(text);
    if (!ms.has_value()) {
        throw std::invalid_argument("Invalid duration format: " + std::string(text));
    }
    return ms.value();
}

} // namespace chatproxy
