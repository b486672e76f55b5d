//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed proxy errors and their mapping to client-facing HTTP status and error bodies
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace chatproxy {
namespace errors {

// Client-visible error classification (the "type" member of the error body).
enum class ErrorType {
    InvalidRequest,
    Api,
    RateLimit
};

inline const char* ToString(ErrorType t) {
    switch (t) {
        case ErrorType::InvalidRequest: return "invalid_request_error";
        case ErrorType::Api: return "api_error";
        case ErrorType::RateLimit: return "rate_limit_error";
    }
    return "api_error";
}

//==========================================================================================================
// ProxyError
// Purpose: Base of every error the request pipeline raises. Carries the error type, the HTTP status the
//          client receives and an optional machine-readable code.
//==========================================================================================================
class ProxyError : public std::runtime_error {
public:
    ProxyError(const std::string& message, ErrorType type, int httpStatus,
               std::optional<std::string> code = std::nullopt)
        : std::runtime_error(message), type(type), httpStatus(httpStatus), code(std::move(code)) {}

    ErrorType type;
    int httpStatus;
    std::optional<std::string> code;
};

// Malformed or oversized client request (400 / 413).
class RequestError : public ProxyError {
public:
    explicit RequestError(const std::string& message, int httpStatus = 400)
        : ProxyError(message, ErrorType::InvalidRequest, httpStatus) {}
};

// Alias/provider resolution failure. invalid_request_error -> 400, api_error -> 500.
class RoutingError : public ProxyError {
public:
    RoutingError(const std::string& message, ErrorType type)
        : ProxyError(message, type, type == ErrorType::InvalidRequest ? 400 : 500) {}
};

class ConfigurationError : public ProxyError {
public:
    explicit ConfigurationError(const std::string& message)
        : ProxyError(message, ErrorType::Api, 500) {}
};

// Request or response body that does not round-trip as JSON.
class SerializationError : public ProxyError {
public:
    explicit SerializationError(const std::string& message)
        : ProxyError(message, ErrorType::Api, 500) {}
};

//==========================================================================================================
// UpstreamError
// Purpose: Failure talking to a provider.
// Fields:
//   upstreamStatus: HTTP status returned by the provider, when one was observed.
//   body: Provider error body (may be empty).
//   timedOut: True when the attempt exceeded its deadline.
// Notes:
//   The client status is the upstream status when present, else 504 on timeout, else 502.
//==========================================================================================================
class UpstreamError : public ProxyError {
public:
    UpstreamError(const std::string& message, std::optional<int> upstreamStatus,
                  std::string body = std::string(), bool timedOut = false)
        : ProxyError(message,
                     upstreamStatus.value_or(0) == 429 ? ErrorType::RateLimit : ErrorType::Api,
                     upstreamStatus.has_value() ? upstreamStatus.value() : (timedOut ? 504 : 502)),
          upstreamStatus(upstreamStatus), body(std::move(body)), timedOut(timedOut) {}

    std::optional<int> upstreamStatus;
    std::string body;
    bool timedOut;
};

//==========================================================================================================
// IsRetryable
// Purpose: Retry classification for upstream failures.
// Returns:
//   True for network-level failures (no status), timeouts, 408, 429 and any 5xx.
//==========================================================================================================
inline bool IsRetryable(const std::optional<int>& status) {
    if (!status.has_value()) {
        return true;
    }
    const int s = status.value();
    return s == 408 || s == 429 || s >= 500;
}

inline bool IsRetryable(const UpstreamError& e) {
    if (e.timedOut) {
        return true;
    }
    return IsRetryable(e.upstreamStatus);
}

//==========================================================================================================
// MakeErrorBody
// Purpose: Renders {"error":{"message","type","param":null,"code"?}} for a ProxyError.
// Notes:
//   For UpstreamError, a JSON error.message / error.code found in the provider body is surfaced.
//==========================================================================================================
std::string MakeErrorBody(const ProxyError& err);

// Same shape for ad-hoc errors that have no ProxyError (404, internal failures).
std::string MakeErrorBody(const std::string& message, ErrorType type,
                          const std::optional<std::string>& code = std::nullopt);

} // namespace errors
} // namespace chatproxy
