//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_url.cpp
// Purpose: GoogleTests for upstream URL parsing and auth header construction
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "chatproxy/Url.h"

using namespace chatproxy;

TEST(Url, ParsesHttpsWithDefaultPort) {
    auto u = ParseUrl("https://OpenRouter.ai/api/v1/chat/completions");
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "openrouter.ai");
    EXPECT_EQ(u.port, "443");
    EXPECT_EQ(u.path, "/api/v1/chat/completions");
    EXPECT_TRUE(u.IsTls());
    EXPECT_EQ(u.Origin(), "https://openrouter.ai:443");
}

TEST(Url, ParsesExplicitPortAndIpv6) {
    auto u = ParseUrl("http://127.0.0.1:8081/v1");
    EXPECT_EQ(u.port, "8081");
    EXPECT_FALSE(u.IsTls());

    auto v6 = ParseUrl("http://[::1]:9000");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, "9000");
    EXPECT_EQ(v6.path, "/");
}

TEST(Url, RejectsInvalidUrls) {
    EXPECT_THROW(ParseUrl("openrouter.ai/api"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("ftp://example.com"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://:80/"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://host:99999/"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://host:abc/"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://[::1/"), std::invalid_argument);
}

TEST(Url, ChatCompletionsSuffixIsAppendedOnce) {
    EXPECT_EQ(BuildChatCompletionsUrl("https://api.openai.com/v1"), "https://api.openai.com/v1/chat/completions");
    EXPECT_EQ(BuildChatCompletionsUrl("https://api.openai.com/v1/chat/completions"),
              "https://api.openai.com/v1/chat/completions");
}

TEST(Url, AuthHeaderTemplateSubstitution) {
    auto h = BuildAuthHeader("Authorization: Bearer ${API_KEY}", "sk-test");
    EXPECT_EQ(h.name, "Authorization");
    EXPECT_EQ(h.value, "Bearer sk-test");

    auto custom = BuildAuthHeader("x-api-key: ${API_KEY}", "abc");
    EXPECT_EQ(custom.name, "x-api-key");
    EXPECT_EQ(custom.value, "abc");
}
