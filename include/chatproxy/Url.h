//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.h
// Purpose: Upstream URL and auth header helpers
//==========================================================================================================

#pragma once

#include <string>

namespace chatproxy {

//==========================================================================================================
// UrlParts
// Purpose: Components of an http(s)://host[:port]/path URL.
// Fields:
//   port: Explicit port, or 443/80 from the scheme.
//   path: Always starts with '/'.
//   serverName: Host used for SNI and certificate verification.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string serverName;

    bool IsTls() const { return scheme == "https"; }

    // scheme://host:port; the connection pool key.
    std::string Origin() const { return scheme + "://" + host + ":" + port; }
};

//==========================================================================================================
// ParseUrl
// Throws:
//   std::invalid_argument when the scheme is not http/https, the host is empty or the port is not numeric.
//==========================================================================================================
UrlParts ParseUrl(const std::string& url);

// Appends "/chat/completions" unless the base URL already ends with it.
std::string BuildChatCompletionsUrl(const std::string& baseUrl);

struct HeaderField {
    std::string name;
    std::string value;
};

//==========================================================================================================
// BuildAuthHeader
// Purpose: Substitutes ${API_KEY} in a "Name: value" template and splits it into name and value.
//==========================================================================================================
HeaderField BuildAuthHeader(const std::string& headerTemplate, const std::string& credential);

} // namespace chatproxy
