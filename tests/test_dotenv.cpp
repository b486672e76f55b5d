//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_dotenv.cpp
// Purpose: GoogleTests for .env loading and environment helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include "env/EnvVars.h"

namespace {

std::string writeTemp(const std::string& name, const std::string& content) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

} // namespace

TEST(DotEnv, ExportsUnsetVariables) {
    ::unsetenv("CHATPROXY_TEST_A");
    ::unsetenv("CHATPROXY_TEST_B");
    ::unsetenv("CHATPROXY_TEST_C");
    const auto path = writeTemp("chatproxy_dotenv_1.env",
                                "# comment\n"
                                "\n"
                                "CHATPROXY_TEST_A=plain\n"
                                "export CHATPROXY_TEST_B = \"quoted value\"\n"
                                "CHATPROXY_TEST_C='single'\n"
                                "not a pair\n");
    EXPECT_EQ(LoadDotEnvFile(path), 3u);
    EXPECT_EQ(GetEnvOrDefault("CHATPROXY_TEST_A", ""), "plain");
    EXPECT_EQ(GetEnvOrDefault("CHATPROXY_TEST_B", ""), "quoted value");
    EXPECT_EQ(GetEnvOrDefault("CHATPROXY_TEST_C", ""), "single");
    std::remove(path.c_str());
}

TEST(DotEnv, NeverOverridesExistingVariables) {
    ::setenv("CHATPROXY_TEST_KEEP", "original", 1);
    const auto path = writeTemp("chatproxy_dotenv_2.env", "CHATPROXY_TEST_KEEP=replaced\n");
    EXPECT_EQ(LoadDotEnvFile(path), 0u);
    EXPECT_EQ(GetEnvOrDefault("CHATPROXY_TEST_KEEP", ""), "original");
    std::remove(path.c_str());
}

TEST(DotEnv, MissingFileIsNotAnError) {
    EXPECT_EQ(LoadDotEnvFile(::testing::TempDir() + "does_not_exist.env"), 0u);
}

TEST(EnvVars, TryGetEnvTreatsEmptyAsUnset) {
    ::setenv("CHATPROXY_TEST_EMPTY", "", 1);
    EXPECT_FALSE(TryGetEnv("CHATPROXY_TEST_EMPTY").has_value());
    ::unsetenv("CHATPROXY_TEST_EMPTY");
    EXPECT_FALSE(TryGetEnv("CHATPROXY_TEST_EMPTY").has_value());
    EXPECT_EQ(GetEnvOrDefault("CHATPROXY_TEST_EMPTY", "fallback"), "fallback");
    ::setenv("CHATPROXY_TEST_SET", "v", 1);
    EXPECT_EQ(TryGetEnv("CHATPROXY_TEST_SET").value(), "v");
}
