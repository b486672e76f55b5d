//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: GoogleTests for the JSON value model, parser and serializer
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "chatproxy/Json.h"

using namespace chatproxy;

TEST(Json, ParsesScalarsAndContainers) {
    auto v = ParseJson(R"({"a":1,"b":-2.5,"c":true,"d":null,"e":"x","f":[1,"two",false],"g":{}})");
    const auto* o = v.asObject();
    ASSERT_NE(o, nullptr);
    EXPECT_EQ(o->size(), 7u);
    EXPECT_EQ(o->find("a")->second->asInt().value(), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(o->find("b")->second->value), -2.5);
    EXPECT_TRUE(*o->find("c")->second->asBool());
    EXPECT_TRUE(o->find("d")->second->isNull());
    EXPECT_EQ(*o->find("e")->second->asString(), "x");
    ASSERT_TRUE(o->find("f")->second->isArray());
    EXPECT_EQ(o->find("f")->second->asArray()->size(), 3u);
    EXPECT_TRUE(o->find("g")->second->isObject());
}

TEST(Json, PreservesFieldOrderOnSerialize) {
    const std::string text = R"({"model":"m","stream":true,"messages":[{"role":"user","content":"hi"}],"temperature":0.7})";
    EXPECT_EQ(SerializeJson(ParseJson(text)), text);
}

TEST(Json, SetKeepsPositionAndEraseRemoves) {
    auto v = ParseJson(R"({"a":1,"b":2,"c":3})");
    auto* o = v.asObject();
    o->set("b", JSONValue("two"));
    EXPECT_TRUE(o->erase("a"));
    EXPECT_FALSE(o->erase("missing"));
    o->set("d", JSONValue(static_cast<int64_t>(4)));
    EXPECT_EQ(SerializeJson(v), R"({"b":"two","c":3,"d":4})");
}

TEST(Json, DuplicateKeysKeepLastValue) {
    auto v = ParseJson(R"({"k":1,"k":2})");
    EXPECT_EQ(v.asObject()->size(), 1u);
    EXPECT_EQ(v.asObject()->find("k")->second->asInt().value(), 2);
}

TEST(Json, StringEscapesAndSurrogatePairs) {
    auto v = ParseJson(R"(["a\"b\\c\/d\n", "\u00e9", "\ud83d\ude00"])");
    const auto& arr = *v.asArray();
    EXPECT_EQ(*arr[0]->asString(), "a\"b\\c/d\n");
    EXPECT_EQ(*arr[1]->asString(), "\xC3\xA9");
    EXPECT_EQ(*arr[2]->asString(), "\xF0\x9F\x98\x80");
    EXPECT_EQ(SerializeJson(JSONValue(std::string("tab\there\x01"))), "\"tab\\there\\u0001\"");
}

TEST(Json, RejectsMalformedDocuments) {
    EXPECT_THROW(ParseJson(""), JsonParseError);
    EXPECT_THROW(ParseJson("{"), JsonParseError);
    EXPECT_THROW(ParseJson("{\"a\":1,}"), JsonParseError);
    EXPECT_THROW(ParseJson("[1] x"), JsonParseError);
    EXPECT_THROW(ParseJson("\"\\x\""), JsonParseError);
    EXPECT_THROW(ParseJson("\"\\ud83d\""), JsonParseError);
    EXPECT_THROW(ParseJson("01"), JsonParseError);
    EXPECT_THROW(ParseJson("1e999"), JsonParseError);
}

TEST(Json, ParseErrorCarriesOffset) {
    try {
        (void)ParseJson("[1, 2, ?]");
        FAIL() << "expected JsonParseError";
    } catch (const JsonParseError& e) {
        EXPECT_GE(e.offset, 6u);
        EXPECT_LE(e.offset, 7u);
    }
}

TEST(Json, NestingDepthIsBounded) {
    std::string ok(kMaxJsonDepth, '[');
    ok += std::string(kMaxJsonDepth, ']');
    EXPECT_NO_THROW(ParseJson(ok));
    std::string deep(kMaxJsonDepth + 1, '[');
    deep += std::string(kMaxJsonDepth + 1, ']');
    EXPECT_THROW(ParseJson(deep), JsonParseError);
}

TEST(Json, LargeIntegersFallBackToDouble) {
    auto v = ParseJson("123456789012345678901234");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
    auto i = ParseJson("9223372036854775807");
    EXPECT_EQ(i.asInt().value(), std::numeric_limits<int64_t>::max());
}

TEST(Json, NonFiniteDoublesCannotBeSerialized) {
    EXPECT_THROW(SerializeJson(JSONValue(std::numeric_limits<double>::quiet_NaN())), JsonSerializeError);
    EXPECT_THROW(SerializeJson(JSONValue(std::numeric_limits<double>::infinity())), JsonSerializeError);
    EXPECT_EQ(SerializeJson(JSONValue(0.5)), "0.5");
}
