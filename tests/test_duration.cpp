//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_duration.cpp
// Purpose: GoogleTests for duration string parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "chatproxy/Duration.h"

using namespace chatproxy;

TEST(Duration, ParsesEachUnit) {
    EXPECT_EQ(ParseDuration("250ms").value(), 250);
    EXPECT_EQ(ParseDuration("30s").value(), 30000);
    EXPECT_EQ(ParseDuration("2m").value(), 120000);
    EXPECT_EQ(ParseDuration("1h").value(), 3600000);
}

TEST(Duration, BareNumberMeansSeconds) {
    EXPECT_EQ(ParseDuration("60").value(), 60000);
    EXPECT_EQ(ParseDuration("0").value(), 0);
}

TEST(Duration, RejectsMalformedInput) {
    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("s").has_value());
    EXPECT_FALSE(ParseDuration("-5s").has_value());
    EXPECT_FALSE(ParseDuration("1.5s").has_value());
    EXPECT_FALSE(ParseDuration("10 s").has_value());
    EXPECT_FALSE(ParseDuration("10d").has_value());
    EXPECT_FALSE(ParseDuration("10S").has_value());
}

TEST(Duration, RejectsOverflow) {
    EXPECT_FALSE(ParseDuration("99999999999999999999ms").has_value());
    EXPECT_FALSE(ParseDuration("9223372036854775807h").has_value());
}

TEST(Duration, OrThrowNamesTheInput) {
    EXPECT_EQ(ParseDurationOrThrow("5s"), 5000);
    try {
        (void)ParseDurationOrThrow("soon");
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid duration format: soon");
    }
}
