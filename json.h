// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace jschema {

enum class JsonType
{
    Null,
    Bool,
    Int,
    Double,
    String,
    Array,
    Object
};

enum class JsonStatus
{
    success,
    bad_double,
    absent_value,
    bad_negative,
    bad_exponent,
    missing_comma,
    missing_colon,
    malformed_utf8,
    depth_exceeded,
    unexpected_eof,
    overlong_ascii,
    unexpected_comma,
    unexpected_colon,
    unexpected_octal,
    trailing_content,
    illegal_character,
    overlong_utf8_0x7ff,
    overlong_utf8_0xffff,
    object_missing_value,
    illegal_utf8_character,
    invalid_unicode_escape,
    utf16_surrogate_in_utf8,
    unexpected_end_of_array,
    invalid_escape_character,
    utf8_exceeds_utf16_range,
    unexpected_end_of_string,
    unexpected_end_of_object,
    object_key_must_be_string,
    c1_control_code_in_string,
    non_del_c0_control_code_in_string,
    non_finite_number,
    internal_error_unreachable_code
};

// A JSON value: null, bool, integer, double, string, array or object.
//
// Integers and doubles are distinct alternatives. A literal without a
// fraction or exponent that fits in a long long parses as Int, anything
// else numeric parses as Double, and each is printed back the same way
// (a Double always carries a fractional part or an exponent).
//
// Object members are kept in a std::map, so iteration is by key and two
// objects compare equal regardless of the order their keys were added.
class Json
{
  private:
    JsonType type_;
    union
    {
        bool bool_value;
        long long int_value;
        double double_value;
        std::string string_value;
        std::vector<Json> array_value;
        std::map<std::string, Json> object_value;
    };

  public:
    static const char* StatusToString(JsonStatus);
    static const char* TypeToString(JsonType);

    // Parses exactly one JSON document. If offset is non-null it receives
    // the number of bytes consumed, which on failure is where the parser
    // gave up.
    static std::pair<JsonStatus, Json> parse(const char* s,
                                             size_t len,
                                             size_t* offset = nullptr);
    static std::pair<JsonStatus, Json> parse(const std::string& s);

    static Json array();
    static Json object();

    Json(const Json&);
    Json(Json&&) noexcept;
    Json(unsigned long);
    Json(unsigned long long);
    Json(const char*);
    Json(const std::string&);
    Json(std::string&&);
    Json(std::vector<Json>);
    Json(std::map<std::string, Json>);
    ~Json();

    Json(const std::nullptr_t = nullptr) : type_(JsonType::Null)
    {
    }

    Json(bool value) : type_(JsonType::Bool), bool_value(value)
    {
    }

    Json(int value) : type_(JsonType::Int), int_value(value)
    {
    }

    Json(unsigned value) : type_(JsonType::Int), int_value(value)
    {
    }

    Json(long value) : type_(JsonType::Int), int_value(value)
    {
    }

    Json(long long value) : type_(JsonType::Int), int_value(value)
    {
    }

    Json(double value) : type_(JsonType::Double), double_value(value)
    {
    }

    JsonType getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == JsonType::Null;
    }

    bool isBool() const
    {
        return type_ == JsonType::Bool;
    }

    bool isNumber() const
    {
        return isInt() || isDouble();
    }

    bool isInt() const
    {
        return type_ == JsonType::Int;
    }

    bool isDouble() const
    {
        return type_ == JsonType::Double;
    }

    bool isString() const
    {
        return type_ == JsonType::String;
    }

    bool isArray() const
    {
        return type_ == JsonType::Array;
    }

    bool isObject() const
    {
        return type_ == JsonType::Object;
    }

    // The getters abort() when called on the wrong type. Check first with
    // the is*() predicates, or use the as*() conversions below.
    bool getBool() const;
    long long getInt() const;
    double getDouble() const;
    double getNumber() const;

    const std::string& getString() const;
    std::string& getString();

    const std::vector<Json>& getArray() const;
    std::vector<Json>& getArray();

    const std::map<std::string, Json>& getObject() const;
    std::map<std::string, Json>& getObject();

    bool contains(const std::string&) const;

    // Returns the member named key, or nullptr if this isn't an object or
    // has no such member.
    const Json* find(const std::string& key) const;

    size_t size() const;

    void setArray();
    void setObject();

    // Scalar conversions. Each returns false and leaves out untouched when
    // the value can't be represented under the requested mode.
    //
    // strict  asBool    Bool only
    //         asInt     Int only
    //         asDouble  Double or Int
    //         asString  String only
    //
    // Non-strict mode additionally accepts Int 0/1, Double 0.0/1.0 and the
    // tokens true,t,yes,y,on,1 / false,f,no,n,off,0 as bools; integral
    // in-range doubles and base-10 strings as ints; float strings as
    // doubles; and prints Int, Double and Bool values as strings.
    bool asBool(bool& out, bool strict = true) const;
    bool asInt(long long& out, bool strict = true) const;
    bool asDouble(double& out, bool strict = true) const;
    bool asString(std::string& out, bool strict = true) const;

    // Appends the serialized value to b. Fails with non_finite_number if a
    // Double is infinite or NaN; b may then hold a partial document. When
    // pretty printing, indent is the nesting level the value starts at.
    JsonStatus encode(std::string& b, bool pretty = false, int indent = 0) const;

    // Return an empty string if encode() fails.
    std::string toString() const;
    std::string toStringPretty() const;

    size_t hash() const;

    bool operator==(const Json&) const;
    bool operator!=(const Json& other) const
    {
        return !(*this == other);
    }

    Json& operator=(const Json&);
    Json& operator=(Json&&) noexcept;

    Json& operator[](size_t);
    Json& operator[](const std::string&);

    // Appends s to b as a quoted JSON string literal.
    static void stringify(std::string& b, const std::string& s);

    // Appends the shortest round-tripping text for a finite double, always
    // with a fractional part or exponent. Returns false for inf and NaN.
    static bool stringifyDouble(std::string& b, double value);

  private:
    void clear();
    JsonStatus marshal(std::string&, bool, int) const;
    static void serialize(std::string&, const char*, size_t);
    static JsonStatus parse(Json&, const char*&, const char*, int, int);
};

} // namespace jschema

namespace std {

template<>
struct hash<jschema::Json>
{
    size_t operator()(const jschema::Json& json) const
    {
        return json.hash();
    }
};

} // namespace std
