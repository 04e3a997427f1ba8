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

#include "json.h"
#include "jtckdint.h"

#include <cctype>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cwchar>

#include "double-conversion/double-to-string.h"
#include "double-conversion/string-to-double.h"

#define KEY 1
#define COMMA 2
#define COLON 4
#define ARRAY 8
#define OBJECT 16
#define DEPTH 64

#define ASCII 0
#define C0 1
#define DQUOTE 2
#define BACKSLASH 3
#define UTF8_2 4
#define UTF8_3 5
#define UTF8_4 6
#define C1 7
#define UTF8_3_E0 8
#define UTF8_3_ED 9
#define UTF8_4_F0 10
#define BADUTF8 11
#define EVILUTF8 12

#define UTF16_MASK 0xfc00
#define UTF16_MOAR 0xd800 // 0xD800..0xDBFF
#define UTF16_CONT 0xdc00 // 0xDC00..0xDFFF

#define READ32LE(S) \
    ((uint_least32_t)(255 & (S)[3]) << 030 | \
     (uint_least32_t)(255 & (S)[2]) << 020 | \
     (uint_least32_t)(255 & (S)[1]) << 010 | \
     (uint_least32_t)(255 & (S)[0]) << 000)

#define ThomPikeCont(x) (0200 == (0300 & (x)))
#define ThomPikeByte(x) ((x) & (((1 << ThomPikeMsb(x)) - 1) | 3))
#define ThomPikeLen(x) (7 - ThomPikeMsb(x))
#define ThomPikeMsb(x) ((255 & (x)) < 252 ? Bsr(255 & ~(x)) : 1)
#define ThomPikeMerge(x, y) ((x) << 6 | (077 & (y)))

#define IsSurrogate(wc) ((0xf800 & (wc)) == 0xd800)
#define IsHighSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_MOAR)
#define IsLowSurrogate(wc) (((wc) & UTF16_MASK) == UTF16_CONT)
#define MergeUtf16(hi, lo) ((((hi) - 0xD800) << 10) + ((lo) - 0xDC00) + 0x10000)
#define EncodeUtf16(wc) \
    ((0x0000 <= (wc) && (wc) <= 0xFFFF) || (0xE000 <= (wc) && (wc) <= 0xFFFF) \
       ? (wc) \
     : 0x10000 <= (wc) && (wc) <= 0x10FFFF \
       ? (((((wc) - 0x10000) >> 10) + 0xD800) | \
          (unsigned)((((wc) - 0x10000) & 1023) + 0xDC00) << 16) \
       : 0xFFFD)

namespace jschema {

static const char kJsonStr[256] = {
    1,  1,  1,  1,  1,  1,  1,  1, // 0000 ascii (0)
    1,  1,  1,  1,  1,  1,  1,  1, // 0010
    1,  1,  1,  1,  1,  1,  1,  1, // 0020 c0 (1)
    1,  1,  1,  1,  1,  1,  1,  1, // 0030
    0,  0,  2,  0,  0,  0,  0,  0, // 0040 dquote (2)
    0,  0,  0,  0,  0,  0,  0,  0, // 0050
    0,  0,  0,  0,  0,  0,  0,  0, // 0060
    0,  0,  0,  0,  0,  0,  0,  0, // 0070
    0,  0,  0,  0,  0,  0,  0,  0, // 0100
    0,  0,  0,  0,  0,  0,  0,  0, // 0110
    0,  0,  0,  0,  0,  0,  0,  0, // 0120
    0,  0,  0,  0,  3,  0,  0,  0, // 0130 backslash (3)
    0,  0,  0,  0,  0,  0,  0,  0, // 0140
    0,  0,  0,  0,  0,  0,  0,  0, // 0150
    0,  0,  0,  0,  0,  0,  0,  0, // 0160
    0,  0,  0,  0,  0,  0,  0,  0, // 0170
    7,  7,  7,  7,  7,  7,  7,  7, // 0200 c1 (8)
    7,  7,  7,  7,  7,  7,  7,  7, // 0210
    7,  7,  7,  7,  7,  7,  7,  7, // 0220
    7,  7,  7,  7,  7,  7,  7,  7, // 0230
    11, 11, 11, 11, 11, 11, 11, 11, // 0240 latin1 (4)
    11, 11, 11, 11, 11, 11, 11, 11, // 0250
    11, 11, 11, 11, 11, 11, 11, 11, // 0260
    11, 11, 11, 11, 11, 11, 11, 11, // 0270
    12, 12, 4,  4,  4,  4,  4,  4, // 0300 utf8-2 (5)
    4,  4,  4,  4,  4,  4,  4,  4, // 0310
    4,  4,  4,  4,  4,  4,  4,  4, // 0320 utf8-2
    4,  4,  4,  4,  4,  4,  4,  4, // 0330
    8,  5,  5,  5,  5,  5,  5,  5, // 0340 utf8-3 (6)
    5,  5,  5,  5,  5,  9,  5,  5, // 0350
    10, 6,  6,  6,  6,  11, 11, 11, // 0360 utf8-4 (7)
    11, 11, 11, 11, 11, 11, 11, 11, // 0370
};

// Unlike the usual web-safe table, '/' and the HTML specials pass through,
// since schema patterns and URIs are easier to read that way.
static const char kEscapeLiteral[128] = {
    9, 9, 9, 9, 9, 9, 9, 9, 9, 1, 2, 9, 4, 3, 9, 9, // 0x00
    9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, // 0x10
    0, 0, 7, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x20
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x30
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x40
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5, 0, 0, 0, // 0x50
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x60
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, // 0x70
};

alignas(signed char) static const signed char kHexToInt[256] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0x30
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x40
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x50
    -1, 10, 11, 12, 13, 14, 15, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x60
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x70
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x80
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x90
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xa0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xb0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xc0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xd0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xe0
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0xf0
};

// Non-finite values have no symbol, so ToShortest() refuses them and the
// encoder reports non_finite_number instead of inventing a token.
static const double_conversion::DoubleToStringConverter kDoubleToJson(
  double_conversion::DoubleToStringConverter::UNIQUE_ZERO |
    double_conversion::DoubleToStringConverter::EMIT_POSITIVE_EXPONENT_SIGN |
    double_conversion::DoubleToStringConverter::EMIT_TRAILING_DECIMAL_POINT |
    double_conversion::DoubleToStringConverter::EMIT_TRAILING_ZERO_AFTER_POINT,
  nullptr,
  nullptr,
  'e',
  -6,
  21,
  6,
  0);

// Used by the lexer, which has already checked the token shape.
static const double_conversion::StringToDoubleConverter kJsonToDouble(
  double_conversion::StringToDoubleConverter::ALLOW_TRAILING_JUNK,
  0.0,
  1.0,
  nullptr,
  nullptr);

// Used by the non-strict string conversion, which must consume everything.
static const double_conversion::StringToDoubleConverter kTextToDouble(
  double_conversion::StringToDoubleConverter::NO_FLAGS,
  0.0,
  0.0,
  nullptr,
  nullptr);

#if defined(__GNUC__) || defined(__clang__)
#define Bsr(x) (__builtin_clz(x) ^ (sizeof(int) * CHAR_BIT - 1))
#else
static int
Bsr(int x)
{
    int r = 0;
    if (x & 0xFFFF0000u) {
        x >>= 16;
        r |= 16;
    }
    if (x & 0xFF00) {
        x >>= 8;
        r |= 8;
    }
    if (x & 0xF0) {
        x >>= 4;
        r |= 4;
    }
    if (x & 0xC) {
        x >>= 2;
        r |= 2;
    }
    if (x & 0x2) {
        r |= 1;
    }
    return r;
}
#endif

static char*
UlongToString(char* p, unsigned long long x)
{
    char t;
    size_t i, a, b;
    i = 0;
    do {
        p[i++] = x % 10 + '0';
        x = x / 10;
    } while (x > 0);
    p[i] = '\0';
    if (i) {
        for (a = 0, b = i - 1; a < b; ++a, --b) {
            t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
    return p + i;
}

static char*
LongToString(char* p, long long x)
{
    if (x < 0)
        *p++ = '-', x = 0 - (unsigned long long)x;
    return UlongToString(p, x);
}

static void
AppendLong(std::string& b, long long x)
{
    char buf[64];
    b.append(buf, LongToString(buf, x) - buf);
}

static void
Indent(std::string& b, int indent)
{
    b += '\n';
    for (int j = 0; j < indent; ++j)
        b += "  ";
}

static inline size_t
HashCombine(size_t seed, size_t h)
{
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

Json::Json(unsigned long value)
{
    if (value <= LLONG_MAX) {
        type_ = JsonType::Int;
        int_value = value;
    } else {
        type_ = JsonType::Double;
        double_value = value;
    }
}

Json::Json(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = JsonType::Int;
        int_value = value;
    } else {
        type_ = JsonType::Double;
        double_value = value;
    }
}

Json::Json(const char* value)
{
    if (value) {
        type_ = JsonType::String;
        new (&string_value) std::string(value);
    } else {
        type_ = JsonType::Null;
    }
}

Json::Json(const std::string& value) : type_(JsonType::String), string_value(value)
{
}

Json::Json(std::string&& value) : type_(JsonType::String), string_value(std::move(value))
{
}

Json::Json(std::vector<Json> value) : type_(JsonType::Array), array_value(std::move(value))
{
}

Json::Json(std::map<std::string, Json> value) : type_(JsonType::Object), object_value(std::move(value))
{
}

Json::~Json()
{
    if (type_ >= JsonType::String)
        clear();
}

Json
Json::array()
{
    Json json;
    json.setArray();
    return json;
}

Json
Json::object()
{
    Json json;
    json.setObject();
    return json;
}

void
Json::clear()
{
    switch (type_) {
        case JsonType::String:
            string_value.~basic_string();
            break;
        case JsonType::Array:
            array_value.~vector();
            break;
        case JsonType::Object:
            object_value.~map();
            break;
        default:
            break;
    }
    type_ = JsonType::Null;
}

Json::Json(const Json& other) : type_(other.type_)
{
    switch (type_) {
        case JsonType::Null:
            break;
        case JsonType::Bool:
            bool_value = other.bool_value;
            break;
        case JsonType::Int:
            int_value = other.int_value;
            break;
        case JsonType::Double:
            double_value = other.double_value;
            break;
        case JsonType::String:
            new (&string_value) std::string(other.string_value);
            break;
        case JsonType::Array:
            new (&array_value) std::vector<Json>(other.array_value);
            break;
        case JsonType::Object:
            new (&object_value) std::map<std::string, Json>(other.object_value);
            break;
        default:
            abort();
    }
}

Json&
Json::operator=(const Json& other)
{
    if (this != &other) {
        // other may live inside this value's array or object.
        Json copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Json::Json(Json&& other) noexcept : type_(other.type_)
{
    switch (type_) {
        case JsonType::Null:
            break;
        case JsonType::Bool:
            bool_value = other.bool_value;
            break;
        case JsonType::Int:
            int_value = other.int_value;
            break;
        case JsonType::Double:
            double_value = other.double_value;
            break;
        case JsonType::String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case JsonType::Array:
            new (&array_value) std::vector<Json>(std::move(other.array_value));
            break;
        case JsonType::Object:
            new (&object_value)
              std::map<std::string, Json>(std::move(other.object_value));
            break;
        default:
            abort();
    }
    other.clear();
}

Json&
Json::operator=(Json&& other) noexcept
{
    if (this != &other) {
        if (type_ >= JsonType::String)
            clear();
        type_ = other.type_;
        switch (type_) {
            case JsonType::Null:
                break;
            case JsonType::Bool:
                bool_value = other.bool_value;
                break;
            case JsonType::Int:
                int_value = other.int_value;
                break;
            case JsonType::Double:
                double_value = other.double_value;
                break;
            case JsonType::String:
                new (&string_value) std::string(std::move(other.string_value));
                break;
            case JsonType::Array:
                new (&array_value)
                  std::vector<Json>(std::move(other.array_value));
                break;
            case JsonType::Object:
                new (&object_value)
                  std::map<std::string, Json>(std::move(other.object_value));
                break;
            default:
                abort();
        }
        other.clear();
    }
    return *this;
}

double
Json::getNumber() const
{
    switch (type_) {
        case JsonType::Int:
            return int_value;
        case JsonType::Double:
            return double_value;
        default:
            abort();
    }
}

long long
Json::getInt() const
{
    switch (type_) {
        case JsonType::Int:
            return int_value;
        default:
            abort();
    }
}

bool
Json::getBool() const
{
    switch (type_) {
        case JsonType::Bool:
            return bool_value;
        default:
            abort();
    }
}

double
Json::getDouble() const
{
    switch (type_) {
        case JsonType::Double:
            return double_value;
        default:
            abort();
    }
}

const std::string&
Json::getString() const
{
    switch (type_) {
        case JsonType::String:
            return string_value;
        default:
            abort();
    }
}

std::string&
Json::getString()
{
    switch (type_) {
        case JsonType::String:
            return string_value;
        default:
            abort();
    }
}

const std::vector<Json>&
Json::getArray() const
{
    switch (type_) {
        case JsonType::Array:
            return array_value;
        default:
            abort();
    }
}

std::vector<Json>&
Json::getArray()
{
    switch (type_) {
        case JsonType::Array:
            return array_value;
        default:
            abort();
    }
}

const std::map<std::string, Json>&
Json::getObject() const
{
    switch (type_) {
        case JsonType::Object:
            return object_value;
        default:
            abort();
    }
}

std::map<std::string, Json>&
Json::getObject()
{
    switch (type_) {
        case JsonType::Object:
            return object_value;
        default:
            abort();
    }
}

void
Json::setArray()
{
    if (type_ >= JsonType::String)
        clear();
    type_ = JsonType::Array;
    new (&array_value) std::vector<Json>();
}

void
Json::setObject()
{
    if (type_ >= JsonType::String)
        clear();
    type_ = JsonType::Object;
    new (&object_value) std::map<std::string, Json>();
}

bool
Json::contains(const std::string& key) const
{
    if (type_ != JsonType::Object)
        return false;
    return object_value.find(key) != object_value.end();
}

const Json*
Json::find(const std::string& key) const
{
    if (type_ != JsonType::Object)
        return nullptr;
    auto it = object_value.find(key);
    if (it == object_value.end())
        return nullptr;
    return &it->second;
}

size_t
Json::size() const
{
    switch (type_) {
        case JsonType::String:
            return string_value.size();
        case JsonType::Array:
            return array_value.size();
        case JsonType::Object:
            return object_value.size();
        default:
            return 0;
    }
}

Json&
Json::operator[](size_t index)
{
    if (type_ != JsonType::Array)
        setArray();
    if (index >= array_value.size())
        array_value.resize(index + 1);
    return array_value[index];
}

Json&
Json::operator[](const std::string& key)
{
    if (type_ != JsonType::Object)
        setObject();
    return object_value[key];
}

bool
Json::operator==(const Json& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case JsonType::Null:
            return true;
        case JsonType::Bool:
            return bool_value == other.bool_value;
        case JsonType::Int:
            return int_value == other.int_value;
        case JsonType::Double:
            return double_value == other.double_value;
        case JsonType::String:
            return string_value == other.string_value;
        case JsonType::Array:
            return array_value == other.array_value;
        case JsonType::Object:
            return object_value == other.object_value;
        default:
            abort();
    }
}

size_t
Json::hash() const
{
    size_t h = std::hash<int>()(static_cast<int>(type_));
    switch (type_) {
        case JsonType::Null:
            return h;
        case JsonType::Bool:
            return HashCombine(h, std::hash<bool>()(bool_value));
        case JsonType::Int:
            return HashCombine(h, std::hash<long long>()(int_value));
        case JsonType::Double:
            // 0.0 and -0.0 compare equal so they must hash alike.
            return HashCombine(
              h, std::hash<double>()(double_value == 0 ? 0.0 : double_value));
        case JsonType::String:
            return HashCombine(h, std::hash<std::string>()(string_value));
        case JsonType::Array:
            for (auto i = array_value.begin(); i != array_value.end(); ++i)
                h = HashCombine(h, i->hash());
            return h;
        case JsonType::Object:
            for (auto i = object_value.begin(); i != object_value.end(); ++i) {
                h = HashCombine(h, std::hash<std::string>()(i->first));
                h = HashCombine(h, i->second.hash());
            }
            return h;
        default:
            abort();
    }
}

bool
Json::asBool(bool& out, bool strict) const
{
    switch (type_) {
        case JsonType::Bool:
            out = bool_value;
            return true;
        case JsonType::Int:
            if (strict || (int_value != 0 && int_value != 1))
                return false;
            out = int_value == 1;
            return true;
        case JsonType::Double:
            if (strict || (double_value != 0.0 && double_value != 1.0))
                return false;
            out = double_value == 1.0;
            return true;
        case JsonType::String: {
            if (strict)
                return false;
            static const char* const kTrue[] = { "true", "t", "yes", "y", "on", "1" };
            static const char* const kFalse[] = { "false", "f", "no", "n", "off", "0" };
            for (size_t i = 0; i < sizeof(kTrue) / sizeof(*kTrue); ++i) {
                if (string_value == kTrue[i]) {
                    out = true;
                    return true;
                }
                if (string_value == kFalse[i]) {
                    out = false;
                    return true;
                }
            }
            return false;
        }
        default:
            return false;
    }
}

// Accepts an optional sign followed by one or more decimal digits and
// nothing else.
static bool
ParseDecimalLong(const std::string& s, long long& out)
{
    const char* p = s.data();
    const char* e = p + s.size();
    int d = +1;
    if (p < e && (*p == '-' || *p == '+')) {
        if (*p == '-')
            d = -1;
        ++p;
    }
    if (p == e)
        return false;
    long long x = 0;
    for (; p < e; ++p) {
        if (!isdigit(*p & 255))
            return false;
        if (ckd_mul(&x, x, 10) || ckd_add(&x, x, (*p - '0') * d))
            return false;
    }
    out = x;
    return true;
}

bool
Json::asInt(long long& out, bool strict) const
{
    switch (type_) {
        case JsonType::Int:
            out = int_value;
            return true;
        case JsonType::Double:
            if (strict)
                return false;
            // [-2**63, 2**63) holding no fraction; NaN fails every test.
            if (!(double_value >= -9223372036854775808.0 &&
                  double_value < 9223372036854775808.0))
                return false;
            if (std::floor(double_value) != double_value)
                return false;
            out = static_cast<long long>(double_value);
            return true;
        case JsonType::String:
            if (strict)
                return false;
            return ParseDecimalLong(string_value, out);
        default:
            return false;
    }
}

bool
Json::asDouble(double& out, bool strict) const
{
    switch (type_) {
        case JsonType::Double:
            out = double_value;
            return true;
        case JsonType::Int:
            out = static_cast<double>(int_value);
            return true;
        case JsonType::String: {
            if (strict || string_value.empty())
                return false;
            int processed = 0;
            double d = kTextToDouble.StringToDouble(
              string_value.data(), (int)string_value.size(), &processed);
            if (processed != (int)string_value.size())
                return false;
            out = d;
            return true;
        }
        default:
            return false;
    }
}

bool
Json::asString(std::string& out, bool strict) const
{
    std::string b;
    switch (type_) {
        case JsonType::String:
            out = string_value;
            return true;
        case JsonType::Int:
            if (strict)
                return false;
            AppendLong(b, int_value);
            break;
        case JsonType::Double:
            if (strict || !stringifyDouble(b, double_value))
                return false;
            break;
        case JsonType::Bool:
            if (strict)
                return false;
            b = bool_value ? "true" : "false";
            break;
        default:
            return false;
    }
    out = std::move(b);
    return true;
}

JsonStatus
Json::encode(std::string& b, bool pretty, int indent) const
{
    return marshal(b, pretty, indent);
}

std::string
Json::toString() const
{
    std::string b;
    if (encode(b, false) != JsonStatus::success)
        return std::string();
    return b;
}

std::string
Json::toStringPretty() const
{
    std::string b;
    if (encode(b, true) != JsonStatus::success)
        return std::string();
    return b;
}

bool
Json::stringifyDouble(std::string& b, double value)
{
    char buf[128];
    double_conversion::StringBuilder db(buf, 128);
    if (!kDoubleToJson.ToShortest(value, &db))
        return false;
    db.Finalize();
    b += buf;
    return true;
}

JsonStatus
Json::marshal(std::string& b, bool pretty, int indent) const
{
    switch (type_) {
        case JsonType::Null:
            b += "null";
            break;
        case JsonType::String:
            stringify(b, string_value);
            break;
        case JsonType::Bool:
            b += bool_value ? "true" : "false";
            break;
        case JsonType::Int:
            AppendLong(b, int_value);
            break;
        case JsonType::Double:
            if (!stringifyDouble(b, double_value))
                return JsonStatus::non_finite_number;
            break;
        case JsonType::Array: {
            bool once = false;
            b += '[';
            for (auto i = array_value.begin(); i != array_value.end(); ++i) {
                if (once) {
                    b += ',';
                    if (pretty)
                        b += ' ';
                } else {
                    once = true;
                }
                JsonStatus status = i->marshal(b, pretty, indent);
                if (status != JsonStatus::success)
                    return status;
            }
            b += ']';
            break;
        }
        case JsonType::Object: {
            bool once = false;
            b += '{';
            for (auto i = object_value.begin(); i != object_value.end(); ++i) {
                if (once) {
                    b += ',';
                } else {
                    once = true;
                }
                if (pretty)
                    Indent(b, indent + 1);
                stringify(b, i->first);
                b += ':';
                if (pretty)
                    b += ' ';
                JsonStatus status = i->second.marshal(b, pretty, indent + 1);
                if (status != JsonStatus::success)
                    return status;
            }
            if (pretty && once)
                Indent(b, indent);
            b += '}';
            break;
        }
        default:
            abort();
    }
    return JsonStatus::success;
}

void
Json::stringify(std::string& b, const std::string& s)
{
    b += '"';
    serialize(b, s.data(), s.size());
    b += '"';
}

void
Json::serialize(std::string& sb, const char* input, size_t len)
{
    size_t i, j, m;
    wint_t x, a, b;
    unsigned long long w;
    for (i = 0; i < len;) {
        x = input[i++] & 255;
        if (x >= 0300) {
            a = ThomPikeByte(x);
            m = ThomPikeLen(x) - 1;
            if (i + m <= len) {
                for (j = 0;;) {
                    b = input[i + j] & 0xff;
                    if (!ThomPikeCont(b))
                        break;
                    a = ThomPikeMerge(a, b);
                    if (++j == m) {
                        x = a;
                        i += j;
                        break;
                    }
                }
            }
        }
        switch (x <= 127 ? kEscapeLiteral[x] : 9) {
            case 0:
                sb += x;
                break;
            case 1:
                sb += "\\t";
                break;
            case 2:
                sb += "\\n";
                break;
            case 3:
                sb += "\\r";
                break;
            case 4:
                sb += "\\f";
                break;
            case 5:
                sb += "\\\\";
                break;
            case 7:
                sb += "\\\"";
                break;
            case 9:
                w = EncodeUtf16(x);
                do {
                    char esc[6];
                    esc[0] = '\\';
                    esc[1] = 'u';
                    esc[2] = "0123456789abcdef"[(w & 0xF000) >> 014];
                    esc[3] = "0123456789abcdef"[(w & 0x0F00) >> 010];
                    esc[4] = "0123456789abcdef"[(w & 0x00F0) >> 004];
                    esc[5] = "0123456789abcdef"[(w & 0x000F) >> 000];
                    sb.append(esc, 6);
                } while ((w >>= 16));
                break;
            default:
                abort();
        }
    }
}

static inline JsonStatus
ReturnColonCommaErrorStatus(int context)
{
    if (context & COLON)
        return JsonStatus::missing_colon;
    return JsonStatus::missing_comma;
}

static inline JsonStatus
ReturnColonCommaKeyErrorStatus(int context)
{
    if (context & KEY)
        return JsonStatus::object_key_must_be_string;
    return ReturnColonCommaErrorStatus(context);
}

static inline int
EncodeUTF8(char w[4], int c)
{
    int i = 0;
    if (c <= 0x7f) {
        w[0] = c;
        i = 1;
    } else if (c <= 0x7ff) {
        w[0] = 0300 | (c >> 6);
        w[1] = 0200 | (c & 077);
        i = 2;
    } else if (c <= 0xffff) {
        if (IsSurrogate(c)) {
            c = 0xfffd;
        }
        w[0] = 0340 | (c >> 12);
        w[1] = 0200 | ((c >> 6) & 077);
        w[2] = 0200 | (c & 077);
        i = 3;
    } else if (~(c >> 18) & 007) {
        w[0] = 0360 | (c >> 18);
        w[1] = 0200 | ((c >> 12) & 077);
        w[2] = 0200 | ((c >> 6) & 077);
        w[3] = 0200 | (c & 077);
        i = 4;
    } else {
        c = 0xfffd;
        w[0] = 0340 | (c >> 12);
        w[1] = 0200 | ((c >> 6) & 077);
        w[2] = 0200 | (c & 077);
        i = 3;
    }
    return i;
}

// Returns the value of four hex digits at p, or -1.
static inline int
ReadHex4(const char* p, const char* e)
{
    int A, B, C, D;
    if (p + 4 <= e && //
        (A = kHexToInt[p[0] & 255]) != -1 && //
        (B = kHexToInt[p[1] & 255]) != -1 && //
        (C = kHexToInt[p[2] & 255]) != -1 && //
        (D = kHexToInt[p[3] & 255]) != -1) { //
        return A << 12 | B << 8 | C << 4 | D;
    }
    return -1;
}

// Decodes the escape sequence after a backslash. A lone UTF-16 surrogate
// becomes U+FFFD rather than corrupting the UTF-8 output.
static JsonStatus
DecodeEscape(const char*& p, const char* e, std::string& b)
{
    char w[4];
    int c, u;
    if (p >= e)
        return JsonStatus::unexpected_end_of_string;
    switch ((c = *p++ & 255)) {
        case '"':
        case '/':
        case '\\':
            b += c;
            return JsonStatus::success;
        case 'b':
            b += '\b';
            return JsonStatus::success;
        case 'f':
            b += '\f';
            return JsonStatus::success;
        case 'n':
            b += '\n';
            return JsonStatus::success;
        case 'r':
            b += '\r';
            return JsonStatus::success;
        case 't':
            b += '\t';
            return JsonStatus::success;
        case 'u':
            if ((c = ReadHex4(p, e)) == -1)
                return JsonStatus::invalid_unicode_escape;
            p += 4;
            if (IsHighSurrogate(c) && p + 6 <= e && p[0] == '\\' &&
                p[1] == 'u' && (u = ReadHex4(p + 2, e)) != -1 &&
                IsLowSurrogate(u)) {
                p += 6;
                c = MergeUtf16(c, u);
            }
            b.append(w, EncodeUTF8(w, c));
            return JsonStatus::success;
        default:
            return JsonStatus::invalid_escape_character;
    }
}

// Decodes the body of a string literal whose opening quote has been
// consumed, validating UTF-8 as it goes.
static JsonStatus
DecodeString(const char*& p, const char* e, std::string& b)
{
    for (;;) {
        if (p >= e)
            return JsonStatus::unexpected_end_of_string;
        const char* start = p;
        int c = *p++ & 255;
        int n = 0;
        switch (kJsonStr[c]) {
            case ASCII:
                b += c;
                continue;
            case DQUOTE:
                return JsonStatus::success;
            case BACKSLASH: {
                JsonStatus status = DecodeEscape(p, e, b);
                if (status != JsonStatus::success)
                    return status;
                continue;
            }
            case UTF8_2:
                n = 1;
                break;
            case UTF8_3_E0:
                if (p < e && (p[0] & 0377) < 0240)
                    return JsonStatus::overlong_utf8_0x7ff;
                n = 2;
                break;
            case UTF8_3_ED:
                if (p < e && (p[0] & 0377) >= 0240)
                    return JsonStatus::utf16_surrogate_in_utf8;
                n = 2;
                break;
            case UTF8_3:
                n = 2;
                break;
            case UTF8_4_F0:
                if (p < e && (p[0] & 0377) < 0220)
                    return JsonStatus::overlong_utf8_0xffff;
                n = 3;
                break;
            case UTF8_4:
                if (c == 0364 && p < e && (p[0] & 0377) >= 0220)
                    return JsonStatus::utf8_exceeds_utf16_range;
                n = 3;
                break;
            case EVILUTF8:
                if (p < e && ThomPikeCont(p[0] & 255))
                    return JsonStatus::overlong_ascii;
                return JsonStatus::illegal_utf8_character;
            case BADUTF8:
                return JsonStatus::illegal_utf8_character;
            case C0:
                return JsonStatus::non_del_c0_control_code_in_string;
            case C1:
                return JsonStatus::c1_control_code_in_string;
            default:
                return JsonStatus::internal_error_unreachable_code;
        }
        if (p + n > e)
            return JsonStatus::malformed_utf8;
        for (int i = 0; i < n; ++i)
            if (!ThomPikeCont(p[i] & 255))
                return JsonStatus::malformed_utf8;
        p += n;
        b.append(start, n + 1);
    }
}

// Lexes a number token starting at a (which may point at a minus sign)
// whose first digit has already been consumed.
static JsonStatus
LexNumber(Json& json, const char* a, const char*& p, const char* e, int c, int d)
{
    bool use_double = false;
    long long x = (c - '0') * d;
    if (c == '0') {
        if (p < e) {
            if (*p == '.') {
                if (p + 1 == e || !isdigit(p[1] & 255))
                    return JsonStatus::bad_double;
                use_double = true;
            } else if (*p == 'e' || *p == 'E') {
                use_double = true;
            } else if (isdigit(*p & 255)) {
                return JsonStatus::unexpected_octal;
            }
        }
    } else {
        for (; p < e; ++p) {
            c = *p & 255;
            if (isdigit(c)) {
                if (ckd_mul(&x, x, 10) || ckd_add(&x, x, (c - '0') * d)) {
                    use_double = true;
                    break;
                }
            } else if (c == '.') {
                if (p + 1 == e || !isdigit(p[1] & 255))
                    return JsonStatus::bad_double;
                use_double = true;
                break;
            } else if (c == 'e' || c == 'E') {
                use_double = true;
                break;
            } else {
                break;
            }
        }
    }
    if (!use_double) {
        json = Json(x);
        return JsonStatus::success;
    }
    int processed;
    double value = kJsonToDouble.StringToDouble(a, (int)(e - a), &processed);
    if (processed <= 0)
        return JsonStatus::bad_double;
    if (a + processed < e && (a[processed] == 'e' || a[processed] == 'E'))
        return JsonStatus::bad_exponent;
    p = a + processed;
    json = Json(value);
    return JsonStatus::success;
}

JsonStatus
Json::parse(Json& json, const char*& p, const char* e, int context, int depth)
{
    const char* a;
    int c, d;
    if (!depth)
        return JsonStatus::depth_exceeded;
    for (a = p, d = +1; p < e;) {
        switch ((c = *p++ & 255)) {
            case ' ': // spaces
            case '\n':
            case '\r':
            case '\t':
                a = p;
                break;

            case ',': // present in list and object
                if (context & COMMA) {
                    context = 0;
                    a = p;
                    break;
                } else {
                    return JsonStatus::unexpected_comma;
                }

            case ':': // present only in object after key
                if (context & COLON) {
                    context = 0;
                    a = p;
                    break;
                } else {
                    return JsonStatus::unexpected_colon;
                }

            case 'n': // null
                if (context & (KEY | COLON | COMMA))
                    return ReturnColonCommaKeyErrorStatus(context);
                if (p + 3 <= e && READ32LE(p - 1) == READ32LE("null")) {
                    json = Json();
                    p += 3;
                    return JsonStatus::success;
                } else {
                    return JsonStatus::illegal_character;
                }

            case 'f': // false
                if (context & (KEY | COLON | COMMA))
                    return ReturnColonCommaKeyErrorStatus(context);
                if (p + 4 <= e && READ32LE(p) == READ32LE("alse")) {
                    json = Json(false);
                    p += 4;
                    return JsonStatus::success;
                } else {
                    return JsonStatus::illegal_character;
                }

            case 't': // true
                if (context & (KEY | COLON | COMMA))
                    return ReturnColonCommaKeyErrorStatus(context);
                if (p + 3 <= e && READ32LE(p - 1) == READ32LE("true")) {
                    json = Json(true);
                    p += 3;
                    return JsonStatus::success;
                } else {
                    return JsonStatus::illegal_character;
                }

            default:
                return JsonStatus::illegal_character;

            case '-': // negative
                if (context & (COLON | COMMA | KEY))
                    return ReturnColonCommaKeyErrorStatus(context);
                if (d == +1 && p < e && isdigit(*p & 255)) {
                    d = -1;
                    break;
                } else {
                    return JsonStatus::bad_negative;
                }

            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                if (context & (COLON | COMMA | KEY))
                    return ReturnColonCommaKeyErrorStatus(context);
                return LexNumber(json, a, p, e, c, d);

            case '[': { // Array
                if (context & (COLON | COMMA | KEY))
                    return ReturnColonCommaKeyErrorStatus(context);
                json.setArray();
                for (context = ARRAY;;) {
                    Json value;
                    JsonStatus status = parse(value, p, e, context, depth - 1);
                    if (status == JsonStatus::absent_value)
                        return JsonStatus::success;
                    if (status != JsonStatus::success)
                        return status;
                    json.array_value.emplace_back(std::move(value));
                    context = ARRAY | COMMA;
                }
            }

            case ']':
                if (context & ARRAY)
                    return JsonStatus::absent_value;
                return JsonStatus::unexpected_end_of_array;

            case '}':
                if (context & OBJECT)
                    return JsonStatus::absent_value;
                return JsonStatus::unexpected_end_of_object;

            case '{': { // Object
                if (context & (COLON | COMMA | KEY))
                    return ReturnColonCommaKeyErrorStatus(context);
                json.setObject();
                for (context = KEY | OBJECT;;) {
                    Json key, value;
                    JsonStatus status = parse(key, p, e, context, depth - 1);
                    if (status == JsonStatus::absent_value)
                        return JsonStatus::success;
                    if (status != JsonStatus::success)
                        return status;
                    if (key.type_ != JsonType::String)
                        return JsonStatus::object_key_must_be_string;
                    status = parse(value, p, e, COLON, depth - 1);
                    if (status == JsonStatus::absent_value)
                        return JsonStatus::object_missing_value;
                    if (status != JsonStatus::success)
                        return status;
                    // A repeated key replaces the earlier member.
                    json.object_value[std::move(key.string_value)] =
                      std::move(value);
                    context = KEY | COMMA | OBJECT;
                }
            }

            case '"': { // string
                if (context & (COLON | COMMA))
                    return ReturnColonCommaErrorStatus(context);
                std::string b;
                JsonStatus status = DecodeString(p, e, b);
                if (status != JsonStatus::success)
                    return status;
                json = Json(std::move(b));
                return JsonStatus::success;
            }
        }
    }
    if (depth == DEPTH && d == +1)
        return JsonStatus::absent_value;
    return JsonStatus::unexpected_eof;
}

std::pair<JsonStatus, Json>
Json::parse(const char* s, size_t len, size_t* offset)
{
    std::pair<JsonStatus, Json> res;
    const char* p = s;
    const char* e = s + len;
    res.first = parse(res.second, p, e, 0, DEPTH);
    if (res.first == JsonStatus::success) {
        Json j2;
        const char* q = p;
        JsonStatus s2 = parse(j2, q, e, 0, DEPTH);
        if (s2 != JsonStatus::absent_value) {
            res.first = JsonStatus::trailing_content;
            res.second = Json();
        }
    } else {
        res.second = Json();
    }
    if (offset)
        *offset = p - s;
    return res;
}

std::pair<JsonStatus, Json>
Json::parse(const std::string& s)
{
    return parse(s.data(), s.size());
}

const char*
Json::TypeToString(JsonType type)
{
    switch (type) {
        case JsonType::Null:
            return "null";
        case JsonType::Bool:
            return "boolean";
        case JsonType::Int:
            return "integer";
        case JsonType::Double:
            return "number";
        case JsonType::String:
            return "string";
        case JsonType::Array:
            return "array";
        case JsonType::Object:
            return "object";
        default:
            abort();
    }
}

const char*
Json::StatusToString(JsonStatus status)
{
    switch (status) {
        case JsonStatus::success:
            return "success";
        case JsonStatus::bad_double:
            return "bad_double";
        case JsonStatus::absent_value:
            return "absent_value";
        case JsonStatus::bad_negative:
            return "bad_negative";
        case JsonStatus::bad_exponent:
            return "bad_exponent";
        case JsonStatus::missing_comma:
            return "missing_comma";
        case JsonStatus::missing_colon:
            return "missing_colon";
        case JsonStatus::malformed_utf8:
            return "malformed_utf8";
        case JsonStatus::depth_exceeded:
            return "depth_exceeded";
        case JsonStatus::unexpected_eof:
            return "unexpected_eof";
        case JsonStatus::overlong_ascii:
            return "overlong_ascii";
        case JsonStatus::unexpected_comma:
            return "unexpected_comma";
        case JsonStatus::unexpected_colon:
            return "unexpected_colon";
        case JsonStatus::unexpected_octal:
            return "unexpected_octal";
        case JsonStatus::trailing_content:
            return "trailing_content";
        case JsonStatus::illegal_character:
            return "illegal_character";
        case JsonStatus::overlong_utf8_0x7ff:
            return "overlong_utf8_0x7ff";
        case JsonStatus::overlong_utf8_0xffff:
            return "overlong_utf8_0xffff";
        case JsonStatus::object_missing_value:
            return "object_missing_value";
        case JsonStatus::illegal_utf8_character:
            return "illegal_utf8_character";
        case JsonStatus::invalid_unicode_escape:
            return "invalid_unicode_escape";
        case JsonStatus::utf16_surrogate_in_utf8:
            return "utf16_surrogate_in_utf8";
        case JsonStatus::unexpected_end_of_array:
            return "unexpected_end_of_array";
        case JsonStatus::invalid_escape_character:
            return "invalid_escape_character";
        case JsonStatus::utf8_exceeds_utf16_range:
            return "utf8_exceeds_utf16_range";
        case JsonStatus::unexpected_end_of_string:
            return "unexpected_end_of_string";
        case JsonStatus::unexpected_end_of_object:
            return "unexpected_end_of_object";
        case JsonStatus::object_key_must_be_string:
            return "object_key_must_be_string";
        case JsonStatus::c1_control_code_in_string:
            return "c1_control_code_in_string";
        case JsonStatus::non_del_c0_control_code_in_string:
            return "non_del_c0_control_code_in_string";
        case JsonStatus::non_finite_number:
            return "non_finite_number";
        case JsonStatus::internal_error_unreachable_code:
            return "internal_error_unreachable_code";
        default:
            abort();
    }
}

} // namespace jschema
