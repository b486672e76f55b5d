//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_errors.cpp
// Purpose: GoogleTests for proxy error types, status mapping and client error bodies
//==========================================================================================================

#include <gtest/gtest.h>

#include "chatproxy/errors/Errors.h"

using namespace chatproxy;
using namespace chatproxy::errors;

TEST(Errors, TypeNames) {
    EXPECT_STREQ(ToString(ErrorType::InvalidRequest), "invalid_request_error");
    EXPECT_STREQ(ToString(ErrorType::Api), "api_error");
    EXPECT_STREQ(ToString(ErrorType::RateLimit), "rate_limit_error");
}

TEST(Errors, StatusMapping) {
    EXPECT_EQ(RequestError("bad").httpStatus, 400);
    EXPECT_EQ(RequestError("big", 413).httpStatus, 413);
    EXPECT_EQ(RoutingError("x", ErrorType::InvalidRequest).httpStatus, 400);
    EXPECT_EQ(RoutingError("x", ErrorType::Api).httpStatus, 500);
    EXPECT_EQ(ConfigurationError("x").httpStatus, 500);
    EXPECT_EQ(SerializationError("x").httpStatus, 500);
}

TEST(Errors, UpstreamStatusPassThroughAndFallbacks) {
    UpstreamError unauthorized("u", 401);
    EXPECT_EQ(unauthorized.httpStatus, 401);
    EXPECT_EQ(unauthorized.type, ErrorType::Api);

    UpstreamError limited("l", 429);
    EXPECT_EQ(limited.httpStatus, 429);
    EXPECT_EQ(limited.type, ErrorType::RateLimit);

    EXPECT_EQ(UpstreamError("unreachable", std::nullopt).httpStatus, 502);
    EXPECT_EQ(UpstreamError("slow", std::nullopt, "", true).httpStatus, 504);
}

TEST(Errors, RetryClassification) {
    EXPECT_TRUE(IsRetryable(std::optional<int>()));
    EXPECT_TRUE(IsRetryable(std::optional<int>(408)));
    EXPECT_TRUE(IsRetryable(std::optional<int>(429)));
    EXPECT_TRUE(IsRetryable(std::optional<int>(500)));
    EXPECT_TRUE(IsRetryable(std::optional<int>(503)));
    EXPECT_FALSE(IsRetryable(std::optional<int>(400)));
    EXPECT_FALSE(IsRetryable(std::optional<int>(401)));
    EXPECT_FALSE(IsRetryable(std::optional<int>(404)));
    EXPECT_TRUE(IsRetryable(UpstreamError("t", std::nullopt, "", true)));
    EXPECT_FALSE(IsRetryable(UpstreamError("f", 403)));
}

TEST(Errors, ErrorBodyShape) {
    EXPECT_EQ(MakeErrorBody("Not Found", ErrorType::InvalidRequest),
              R"({"error":{"message":"Not Found","type":"invalid_request_error","param":null}})");
    EXPECT_EQ(MakeErrorBody("x", ErrorType::Api, std::string("oops")),
              R"({"error":{"message":"x","type":"api_error","param":null,"code":"oops"}})");
}

TEST(Errors, UpstreamBodyDetailIsSurfaced) {
    UpstreamError e("Upstream returned 401", 401,
                    R"({"error":{"message":"Invalid API key","code":"invalid_api_key"}})");
    const std::string body = MakeErrorBody(e);
    EXPECT_NE(body.find("Upstream returned 401: Invalid API key"), std::string::npos) << body;
    EXPECT_NE(body.find(R"("code":"invalid_api_key")"), std::string::npos) << body;
}

TEST(Errors, PlainTextUpstreamBodyIsNotSurfaced) {
    UpstreamError e("Upstream returned 502", 502, "<html>bad gateway</html>");
    EXPECT_EQ(MakeErrorBody(e), R"({"error":{"message":"Upstream returned 502","type":"api_error","param":null}})");
}
