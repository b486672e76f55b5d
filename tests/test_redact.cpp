//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_redact.cpp
// Purpose: GoogleTests for secret redaction in log text
//==========================================================================================================

#include <gtest/gtest.h>

#include "logging/Redact.h"

TEST(Redact, MasksBearerTokens) {
    EXPECT_EQ(logging::RedactSecrets("Authorization: Bearer abc.def-123"),
              "Authorization: Bearer ***REDACTED***");
    EXPECT_EQ(logging::RedactSecrets("bearer xyz, next"), "bearer ***REDACTED***, next");
}

TEST(Redact, MasksApiKeys) {
    const std::string key = "sk-abcdefghijklmnopqrstuvwxyz012345";
    EXPECT_EQ(logging::RedactSecrets("{\"error\":\"bad key " + key + "\"}"),
              "{\"error\":\"bad key ***REDACTED***\"}");
}

TEST(Redact, LeavesOrdinaryTextAlone) {
    EXPECT_EQ(logging::RedactSecrets("task-sk-short and sk-tooShort"), "task-sk-short and sk-tooShort");
    EXPECT_EQ(logging::RedactSecrets("Upstream returned 500"), "Upstream returned 500");
}

TEST(Redact, SensitiveKeyNames) {
    EXPECT_TRUE(logging::IsSensitiveKey("api_key"));
    EXPECT_TRUE(logging::IsSensitiveKey("Authorization"));
    EXPECT_TRUE(logging::IsSensitiveKey("ACCESS_TOKEN"));
    EXPECT_TRUE(logging::IsSensitiveKey("client_secret"));
    EXPECT_FALSE(logging::IsSensitiveKey("model"));
    EXPECT_FALSE(logging::IsSensitiveKey("base_url"));
}
