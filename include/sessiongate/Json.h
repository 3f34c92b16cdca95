//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Json.h
// Purpose: Small JSON value type with parser and serializer for login payloads and API responses
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sessiongate {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

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

    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// ParseJson
// Purpose: Parse a complete JSON document. Trailing non-whitespace is rejected.
// Throws:
//   std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJson(const std::string& text);

//==========================================================================================================
// SerializeJson
// Purpose: Compact serialization. Object keys are emitted in sorted order so output is stable.
//==========================================================================================================
std::string SerializeJson(const JSONValue& value);

//==========================================================================================================
// GetStringField
// Purpose: Read obj[key] when obj is an object and the member is a string.
// Returns:
//   The string value; nullopt when missing, null, or of another type.
//==========================================================================================================
std::optional<std::string> GetStringField(const JSONValue& obj, const std::string& key);

// Set obj[key] = value, converting obj to an empty object first when it is not one.
void SetStringField(JSONValue& obj, const std::string& key, const std::string& value);

} // namespace sessiongate
