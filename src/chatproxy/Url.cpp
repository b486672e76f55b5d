//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/chatproxy/Url.cpp
// Purpose: Upstream URL and auth header helpers
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "chatproxy/Url.h"

namespace chatproxy {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

} // namespace

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("missing scheme in '" + url + "'");
    }
    parts.scheme = toLower(url.substr(0, schemeEnd));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("unsupported scheme '" + parts.scheme + "'");
    }
    pos = schemeEnd + 3;

    std::size_t slash = url.find_first_of("/?#", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
        if (parts.path.front() != '/') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }

    // [v6addr]:port or host:port
    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 literal in '" + url + "'");
        }
        parts.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            parts.port = hostPort.substr(rb + 2);
        }
    } else {
        colon = hostPort.rfind(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("empty host in '" + url + "'");
    }
    if (parts.port.empty()) {
        parts.port = parts.IsTls() ? std::string("443") : std::string("80");
    }
    bool allDigits = std::all_of(parts.port.begin(), parts.port.end(),
                                 [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!allDigits || parts.port.size() > 5 || std::stoul(parts.port) > 65535ul) {
        throw std::invalid_argument("invalid port '" + parts.port + "'");
    }

    parts.host = toLower(parts.host);
    parts.serverName = parts.host;
    return parts;
}

std::string BuildChatCompletionsUrl(const std::string& baseUrl) {
    static const std::string kSuffix = "/chat/completions";
    if (baseUrl.size() >= kSuffix.size() &&
        baseUrl.compare(baseUrl.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
        return baseUrl;
    }
    return baseUrl + kSuffix;
}

HeaderField BuildAuthHeader(const std::string& headerTemplate, const std::string& credential) {
    static const std::string kPlaceholder = "${API_KEY}";
    std::string line = headerTemplate;
    for (auto p = line.find(kPlaceholder); p != std::string::npos;
         p = line.find(kPlaceholder, p + credential.size())) {
        line.replace(p, kPlaceholder.size(), credential);
    }
    HeaderField h;
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        h.name = trim(line);
        return h;
    }
    h.name = trim(line.substr(0, colon));
    h.value = trim(line.substr(colon + 1));
    return h;
}

} // namespace chatproxy
