//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Json.h
// Purpose: JSON value model, parser and serializer used for request/response bodies and configuration.
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace chatproxy {

struct JSONValue;

//==========================================================================================================
// JSONObject
// Purpose: Insertion-ordered string -> JSONValue map. Field order of parsed documents is preserved on
//          re-serialization, so bodies forwarded upstream keep the client's layout.
// Notes:
//   Lookups are linear; request objects carry a handful of top-level fields.
//==========================================================================================================
class JSONObject {
public:
    using Entry = std::pair<std::string, std::shared_ptr<JSONValue>>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    iterator begin() { return entries.begin(); }
    iterator end() { return entries.end(); }
    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    iterator find(std::string_view key);
    const_iterator find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != end(); }

    // Returns the slot for key, appending a null value when absent.
    std::shared_ptr<JSONValue>& operator[](const std::string& key);

    // Replaces the value in place (keeping position) or appends it.
    void set(const std::string& key, JSONValue value);

    // Removes key; returns true when something was removed.
    bool erase(std::string_view key);

    std::vector<std::string> keys() const;

private:
    std::vector<Entry> entries;
};

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant; arrays and objects hold shared_ptr children.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = JSONObject;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isNumber() const {
        return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    }

    // Typed views; nullptr when the value holds another alternative.
    const bool* asBool() const { return std::get_if<bool>(&value); }
    const std::string* asString() const { return std::get_if<std::string>(&value); }
    const Array* asArray() const { return std::get_if<Array>(&value); }
    const Object* asObject() const { return std::get_if<Object>(&value); }
    Object* asObject() { return std::get_if<Object>(&value); }
    std::optional<int64_t> asInt() const;
};

//==========================================================================================================
// JsonParseError / JsonSerializeError
// Purpose: Raised by ParseJson and SerializeJson. JsonParseError carries the byte offset of the failure.
//==========================================================================================================
class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

class JsonSerializeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ParseJson
// Purpose: Parses a complete JSON document.
// Notes:
//   Rejects trailing content, invalid escapes, lone surrogates, out-of-range numbers and nesting deeper
//   than kMaxJsonDepth.
// Throws:
//   JsonParseError
//==========================================================================================================
inline constexpr std::size_t kMaxJsonDepth = 512;
JSONValue ParseJson(std::string_view text);

//==========================================================================================================
// SerializeJson
// Purpose: Compact serialization. Doubles use the shortest round-trip form.
// Throws:
//   JsonSerializeError for NaN/Infinity, which JSON cannot represent.
//==========================================================================================================
std::string SerializeJson(const JSONValue& value);

} // namespace chatproxy
