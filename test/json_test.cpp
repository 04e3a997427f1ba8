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

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <time.h>
#include <unordered_set>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define STRING(sl) std::string(sl, sizeof(sl) - 1)

using jschema::Json;
using jschema::JsonStatus;
using jschema::JsonType;

static const char kHuge[] = R"([
    "JSON Test Pattern pass1",
    {"object with 1 member":["array with 1 element"]},
    {},
    [],
    -42,
    true,
    false,
    null,
    {
        "integer": 1234567890,
        "real": -9876.543210,
        "e": 0.123456789e-12,
        "E": 1.234567890E+34,
        "":  23456789012E66,
        "zero": 0,
        "one": 1,
        "space": " ",
        "quote": "\"",
        "backslash": "\\",
        "controls": "\b\f\n\r\t",
        "slash": "/ & \/",
        "alpha": "abcdefghijklmnopqrstuvwyz",
        "ALPHA": "ABCDEFGHIJKLMNOPQRSTUVWYZ",
        "digit": "0123456789",
        "0123456789": "digit",
        "special": "`1~!@#$%^&*()_+-={':[,]}|;.</>?",
        "hex": "\u0123\u4567\u89AB\uCDEF\uabcd\uef4A",
        "true": true,
        "false": false,
        "null": null,
        "array":[  ],
        "object":{  },
        "address": "50 St. James Street",
        "url": "http://www.JSON.org/",
        "comment": "// /* <!-- --",
        "# -- --> */": " ",
        " s p a c e d " :[1,2 , 3

,

4 , 5        ,          6           ,7        ],"compact":[1,2,3,4,5,6,7],
        "jsontext": "{\"object with 1 member\":[\"array with 1 element\"]}",
        "quotes": "&#34; \u0022 %22 0x22 034 &#x22;",
        "\/\\\"\uCAFE\uBABE\uAB98\uFCDE\ubcda\uef4A\b\f\n\r\t`1~!@#$%^&*()_+-=[]{}|;:',./<>?"
: "A key can be any string"
    },
    0.5 ,98.6
,
99.44
,

1066,
1e1,
0.1e1,
1e-1,
1e00,2e+00,2e-00
,"rosebud"])";

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        struct timespec start = now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            asm volatile("" ::: "memory"); \
            CODE; \
        } \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (tonanos(tub(now(), start)) + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

struct timespec
now(void)
{
    struct timespec ts;
    timespec_get(&ts, TIME_UTC);
    return ts;
}

struct timespec
tub(struct timespec a, struct timespec b)
{
    a.tv_sec -= b.tv_sec;
    if (a.tv_nsec < b.tv_nsec) {
        a.tv_nsec += 1000000000;
        a.tv_sec--;
    }
    a.tv_nsec -= b.tv_nsec;
    return a;
}

int64_t
tonanos(struct timespec x)
{
    return x.tv_sec * 1000000000ull + x.tv_nsec;
}

void
object_test()
{
    Json obj;
    obj["content"] = "hello";
    if (obj.toString() != "{\"content\":\"hello\"}")
        exit(1);
    if (!obj.contains("content") || obj.contains("missing"))
        exit(7);
    if (Json("content").contains("content"))
        exit(7);
    Json empty = Json::object();
    if (!empty.isObject() || empty.size() || empty.toString() != "{}")
        exit(8);
}

void
deep_test()
{
    Json A1;
    A1[0] = 0;
    A1[1] = 10;
    A1[2] = 20;
    A1[3] = 3.14;
    A1[4] = 40;
    Json A2;
    A2[0] = std::move(A1);
    Json A3;
    A3[0] = std::move(A2);
    Json obj;
    obj["content"] = std::move(A3);
    if (obj.toString() != "{\"content\":[[[0,10,20,3.14,40]]]}")
        exit(2);
}

void
parse_test()
{
    std::pair<JsonStatus, Json> res =
      Json::parse("{ \"content\":[[[0,10,20,3.14,40]]]}");
    if (res.first != JsonStatus::success)
        exit(3);
    if (res.second.toString() != "{\"content\":[[[0,10,20,3.14,40]]]}")
        exit(4);
    res = Json::parse("{ \"a\": 1, \"b\": [2,   3]}");
    if (res.first != JsonStatus::success)
        exit(5);
    if (res.second.toString() != R"({"a":1,"b":[2,3]})")
        exit(6);
}

void
number_test()
{
    std::pair<JsonStatus, Json> res = Json::parse("42");
    if (res.first != JsonStatus::success || !res.second.isInt())
        exit(20);
    if (res.second.getInt() != 42)
        exit(21);
    res = Json::parse("42.0");
    if (res.first != JsonStatus::success || !res.second.isDouble())
        exit(22);
    if (res.second.getDouble() != 42.0)
        exit(23);
    if (res.second.toString() != "42.0")
        exit(24);
    res = Json::parse("9223372036854775807");
    if (!res.second.isInt() || res.second.getInt() != 9223372036854775807ll)
        exit(25);
    res = Json::parse("-9223372036854775808");
    if (!res.second.isInt() || res.second.getInt() != -9223372036854775807ll - 1)
        exit(26);
    res = Json::parse("9223372036854775808");
    if (!res.second.isDouble())
        exit(27);
    res = Json::parse("1e300");
    if (!res.second.isDouble() || res.second.toString() != "1e+300")
        exit(28);
    if (Json(0.5).toString() != "0.5")
        exit(29);
    if (Json(-0.0).toString() != "0.0")
        exit(30);
    if (Json(1) == Json(1.0))
        exit(31);
    if (Json(1).getNumber() != Json(1.0).getNumber())
        exit(32);
    if (Json::parse("[]").second.getType() != JsonType::Array)
        exit(33);
}

void
non_finite_test()
{
    std::string b;
    if (Json(INFINITY).encode(b) != JsonStatus::non_finite_number)
        exit(40);
    if (!Json(NAN).toString().empty())
        exit(41);
    Json array = Json::array();
    array[0] = 1;
    array[1] = -INFINITY;
    if (!array.toString().empty())
        exit(42);
    if (!array.toStringPretty().empty())
        exit(43);
    b.clear();
    if (Json::stringifyDouble(b, NAN))
        exit(44);
}

void
equality_test()
{
    Json a = Json::parse(R"({"a":1,"b":2})").second;
    Json b = Json::parse(R"({"b":2,"a":1})").second;
    if (a != b)
        exit(50);
    if (a.hash() != b.hash())
        exit(51);
    if (Json::parse("[1,2]").second == Json::parse("[2,1]").second)
        exit(52);
    if (Json(0.0) != Json(-0.0) || Json(0.0).hash() != Json(-0.0).hash())
        exit(53);
    std::unordered_set<Json> set;
    set.insert(a);
    set.insert(Json::parse("[1,2]").second);
    if (!set.count(b))
        exit(54);
    if (set.count(Json::parse("[2,1]").second))
        exit(55);
    if (Json("x") == Json(std::string("y")))
        exit(56);
    if (Json() != Json(nullptr))
        exit(57);
}

void
conversion_test()
{
    long long i = 7;
    if (Json(42.0).asInt(i) || i != 7)
        exit(60);
    if (!Json(42.0).asInt(i, false) || i != 42)
        exit(61);
    i = 7;
    if (Json(42.5).asInt(i, false) || i != 7)
        exit(62);
    if (!Json("-123").asInt(i, false) || i != -123)
        exit(63);
    if (Json("-123").asInt(i) || Json("12a").asInt(i, false) ||
        Json("").asInt(i, false) || Json("99999999999999999999").asInt(i, false))
        exit(64);
    if (Json(1e19).asInt(i, false) || Json(NAN).asInt(i, false))
        exit(65);

    bool v = false;
    if (Json(1).asBool(v) || !Json(1).asBool(v, false) || !v)
        exit(66);
    if (Json(2).asBool(v, false) || Json(0.5).asBool(v, false))
        exit(67);
    if (!Json("off").asBool(v, false) || v)
        exit(68);
    if (!Json("y").asBool(v, false) || !v)
        exit(69);
    if (Json("YES").asBool(v, false) || Json(nullptr).asBool(v, false))
        exit(70);

    double d = 0;
    if (!Json(3).asDouble(d) || d != 3.0)
        exit(71);
    if (Json("2.5").asDouble(d) || !Json("2.5").asDouble(d, false) || d != 2.5)
        exit(72);
    if (Json("2.5x").asDouble(d, false) || Json("inf").asDouble(d, false))
        exit(73);

    std::string s = "unchanged";
    if (Json(42).asString(s) || s != "unchanged")
        exit(74);
    if (!Json(42).asString(s, false) || s != "42")
        exit(75);
    if (!Json(42.0).asString(s, false) || s != "42.0")
        exit(76);
    if (!Json(false).asString(s, false) || s != "false")
        exit(77);
    if (Json(nullptr).asString(s, false) || Json::array().asString(s, false))
        exit(78);
    if (!Json("text").asString(s) || s != "text")
        exit(79);
}

void
string_test()
{
    std::pair<JsonStatus, Json> res = Json::parse(R"(["\u00e9","\ud83d\ude00","a/b","\u0001"])");
    if (res.first != JsonStatus::success)
        exit(80);
    if (res.second[0].getString() != "\xc3\xa9")
        exit(81);
    if (res.second[1].getString() != "\xf0\x9f\x98\x80")
        exit(82);
    if (res.second.toString() != R"(["\u00e9","\ud83d\ude00","a/b","\u0001"])")
        exit(83);
    Json copy = res.second;
    copy = copy[2];
    if (copy.getString() != "a/b")
        exit(84);
}

void
pretty_test()
{
    Json obj = Json::parse(R"({"b":[1,2],"a":{"c":null},"d":{}})").second;
    if (obj.toStringPretty() != "{\n"
                                "  \"a\": {\n"
                                "    \"c\": null\n"
                                "  },\n"
                                "  \"b\": [1, 2],\n"
                                "  \"d\": {}\n"
                                "}")
        exit(90);
}

void
error_test()
{
    size_t offset = 0;
    std::pair<JsonStatus, Json> res = Json::parse("[1] x", 5, &offset);
    if (res.first != JsonStatus::trailing_content || offset != 3)
        exit(91);
    if (!res.second.isNull())
        exit(92);
    if (Json::parse("").first != JsonStatus::absent_value)
        exit(93);
    if (Json::parse("{\"a\":1,}").first != JsonStatus::unexpected_end_of_object)
        exit(94);
    // A repeated key keeps the last value.
    res = Json::parse(R"({"a":1,"a":2})");
    if (res.first != JsonStatus::success || res.second.size() != 1 ||
        res.second.find("a")->getInt() != 2)
        exit(95);
}

void
depth_test()
{
    std::string ok = std::string(63, '[') + std::string(63, ']');
    if (Json::parse(ok).first != JsonStatus::success)
        exit(96);
    std::string deep = std::string(64, '[') + std::string(64, ']');
    if (Json::parse(deep).first != JsonStatus::depth_exceeded)
        exit(97);
}

static const struct
{
    std::string before;
    std::string after;
} kRoundTrip[] = {

    // valid utf16 sequences
    { " [\"\\u0020\"] ", "[\" \"]" },
    { " [\"\\u00A0\"] ", "[\"\\u00a0\"]" },

    // lone surrogates become the replacement character
    { "[\"\\uDFAA\"]", "[\"\\ufffd\"]" },
    { "[\"\\uD800\"]", "[\"\\ufffd\"]" },
    { "[\"\\uD800\\u0041\"]", "[\"\\ufffdA\"]" },

    // underflow and overflow
    { " [123.456e-789] ", "[0.0]" },
    { " [-123123123123123123123123123123] ", "[-1.2312312312312312e+29]" },
};

// https://github.com/nst/JSONTestSuite/
static const struct
{
    bool fail;
    std::string json;
} kJsonTestSuite[] = {
    { true, "" },
    { true, "[] []" },
    { true, "[nan]" },
    { true, "[-nan]" },
    { true, "[+NaN]" },
    { true, "{\"Extra value after close\": true} \"misplaced quoted value\"" },
    { true, "{\"Illegal expression\": 1 + 2}" },
    { true, "{\"Illegal invocation\": alert()}" },
    { true, "{\"Numbers cannot have leading zeroes\": 013}" },
    { true, "{\"Numbers cannot be hex\": 0x14}" },
    { true, "[\"Illegal backslash escape: \\x15\"]" },
    { true, "[\\naked]" },
    { true, "[\"Illegal backslash escape: \\017\"]" },
    { false, "[[[[[[[[[[[[[[[[[[[[\"Twenty deep\"]]]]]]]]]]]]]]]]]]]]" },
    { true, "{\"Missing colon\" null}" },
    { true, "{\"Double colon\":: null}" },
    { true, "{\"Comma instead of colon\", null}" },
    { true, "[\"Colon instead of comma\": false]" },
    { true, "[\"Bad value\", truth]" },
    { true, "[\'single quote\']" },
    { true, "[\"\ttab\tcharacter\tin\tstring\t\"]" },
    { true, "[\"tab\\   character\\   in\\  string\\  \"]" },
    { true, "[\"line\nbreak\"]" },
    { true, "[\"line\\\nbreak\"]" },
    { true, "[0e]" },
    { true, "[\"Unclosed array\"" },
    { true, "[0e+]" },
    { true, "[0e+-1]" },
    { true, "{\"Comma instead if closing brace\": true," },
    { true, "[\"mismatch\"}" },
    { true, "{unquoted_key: \"keys must be quoted\"}" },
    { true, "[\"extra comma\",]" },
    { true, "[\"double extra comma\",,]" },
    { true, "[   , \"<-- missing value\"]" },
    { true, "[\"Comma after the close\"]," },
    { true, "[\"Extra close\"]]" },
    { true, "{\"Extra comma\": true,}" },
    { true, " {\"a\" " },
    { true, " {\"a\": " },
    { true, " {:\"b\" " },
    { true, " {\"a\" b} " },
    { true, " {key: 'value'} " },
    { true, " {\"a\":\"a\" 123} " },
    { true, " \x7b\xf0\x9f\x87\xa8\xf0\x9f\x87\xad\x7d " },
    { true, " {[: \"x\"} " },
    { true, " [1.8011670033376514H-308] " },
    { true, " [1.2a-3] " },
    { true, " [.123] " },
    { true, " [1e\xe5] " },
    { true, " [1ea] " },
    { true, " [-1x] " },
    { true, " [-.123] " },
    { true, " [-foo] " },
    { true, " [-Infinity] " },
    { true, " \x5b\x30\xe5\x5d " },
    { true, " \x5b\x31\x65\x31\xe5\x5d " },
    { true, " \x5b\x31\x32\x33\xe5\x5d " },
    { true, " \x5b\x2d\x31\x32\x33\x2e\x31\x32\x33\x66\x6f\x6f\x5d " },
    { true, " [0e+-1] " },
    { true, " [Infinity] " },
    { true, " [0x42] " },
    { true, " [0x1] " },
    { true, " [1+2] " },
    { true, " \x5b\xef\xbc\x91\x5d " },
    { true, " [NaN] " },
    { true, " [Inf] " },
    { true, " [9.e+] " },
    { true, " [1eE2] " },
    { true, " [1e0e] " },
    { true, " [1.0e-] " },
    { true, " [1.0e+] " },
    { true, " [0e] " },
    { true, " [0e+] " },
    { true, " [0E] " },
    { true, " [0E+] " },
    { true, " [0.3e] " },
    { true, " [0.3e+] " },
    { true, " [0.1.2] " },
    { true, " [.2e-3] " },
    { true, " [.-1] " },
    { true, " [-NaN] " },
    { true, " [+Inf] " },
    { true, " [+1] " },
    { true, " [++1234] " },
    { true, " [tru] " },
    { true, " [nul] " },
    { true, " [fals] " },
    { true, " [{} " },
    { true, "\n[1,\n1\n,1  " },
    { true, " [1, " },
    { true, " [\"\" " },
    { true, " [* " },
    { true, " \x5b\x22\x0b\x61\x22\x5c\x66\x5d " },
    { true, "[\"a\",\n4\n,1,1  " },
    { true, " [1:2] " },
    { true, " \x5b\xff\x5d " },
    { true, " \x5b\x78 " },
    { true, " [\"x\" " },
    { true, " [\"\": 1] " },
    { true, " [a\xe5] " },
    { true, " {\"x\", null} " },
    { true, " [\"x\", truth] " },
    { true, STRING("\x00") },
    { true, "\n[\"x\"]]" },
    { true, " [012] " },
    { true, " [-012] " },
    { true, " [1 000.0] " },
    { true, " [-01] " },
    { true, " [- 1] " },
    { true, " [-] " },
    { true, " {\"\xb9\":\"0\",} " },
    { true, " {\"x\"::\"b\"} " },
    { true, " [1,,] " },
    { true, " [1,] " },
    { true, " [1,,2] " },
    { true, " [,1] " },
    { true, " [ 3[ 4]] " },
    { true, " [1 true] " },
    { true, " [\"a\" \"b\"] " },
    { true, " [--2.] " },
    { true, " [1.] " },
    { true, " [2.e3] " },
    { true, " [2.e-3] " },
    { true, " [2.e+3] " },
    { true, " [0.e1] " },
    { true, " [-2.] " },
    { true, " \xef\xbb\xbf{} " },
    { true, STRING(" [\x00\"\x00\xe9\x00\"\x00]\x00 ") },
    { true, STRING(" \x00[\x00\"\x00\xe9\x00\"\x00] ") },
    { true, " [\"\xe0\xff\"] " },
    { true, " [\"\xfc\x80\x80\x80\x80\x80\"] " },
    { true, " [\"\xfc\x83\xbf\xbf\xbf\xbf\"] " },
    { true, " [\"\xc0\xaf\"] " },
    { true, " [\"\xf4\xbf\xbf\xbf\"] " },
    { true, " [\"\x81\"] " },
    { true, " [\"\xe9\"] " },
    { true, " [\"\xff\"] " },
    { false, kHuge },
    { false, R"([[[[[[[[[[[[[[[[[[["Not too deep"]]]]]]]]]]]]]]]]]]])" },
    { false, R"({
    "JSON Test Pattern pass3": {
        "The outermost value": "must be an object or array.",
        "In this test": "It is an object."
    }
}
)" },
};

void
round_trip_test()
{
    for (size_t i = 0; i < ARRAYLEN(kRoundTrip); ++i) {
        std::pair<JsonStatus, Json> res = Json::parse(kRoundTrip[i].before);
        if (res.first != JsonStatus::success) {
            printf("error: round_trip_test fail #1 on %zu: %s\n",
                   i,
                   Json::StatusToString(res.first));
            exit(10);
        }
        if (res.second.toString() != kRoundTrip[i].after) {
            printf("error: round_trip_test fail #2 on %zu: %s\n",
                   i,
                   res.second.toString().c_str());
            exit(11);
        }
    }
}

void
json_test_suite()
{
    for (size_t i = 0; i < ARRAYLEN(kJsonTestSuite); ++i) {
        JsonStatus status = Json::parse(kJsonTestSuite[i].json).first;
        if ((status != JsonStatus::success) != kJsonTestSuite[i].fail) {
            printf("error: fail json_test_suite %zu: %s\n",
                   i,
                   Json::StatusToString(status));
            exit(12);
        }
    }
}

void
afl_regression()
{
    if (Json::parse("[{\"\":1,3:14,]\n").first == JsonStatus::success)
        exit(100);
    if (Json::parse("[\n"
                    "\n"
                    "3E14,\n"
                    "{\"!\":4,733:4,[\n"
                    "\n"
                    "3EL%,3E14,\n"
                    "{][1][1,,]")
          .first == JsonStatus::success)
        exit(101);
    if (Json::parse("[\n"
                    "null,\n"
                    "1,\n"
                    "3.14,\n"
                    "{\"a\": \"b\",\n"
                    "3:14,ull}\n"
                    "]")
          .first == JsonStatus::success)
        exit(102);
    if (Json::parse("[\n"
                    "\n"
                    "3E14,\n"
                    "{\"a!!!!!!!!!!!!!!!!!!\":4, \n"
                    "\n"
                    "3:1,,\n"
                    "3[\n"
                    "\n"
                    "]")
          .first == JsonStatus::success)
        exit(103);
    if (Json::parse("[\n"
                    "\n"
                    "3E14,\n"
                    "{\"a!!:!!!!!!!!!!!!!!!\":4, \n"
                    "\n"
                    "3E1:4, \n"
                    "\n"
                    "3E1,,\n"
                    ",,\n"
                    "3[\n"
                    "\n"
                    "]")
          .first == JsonStatus::success)
        exit(104);
    if (Json::parse("[\n"
                    "\n"
                    "3E14,\n"
                    "{\"!\":4,733:4,[\n"
                    "\n"
                    "3E1%,][1,,]")
          .first == JsonStatus::success)
        exit(105);
}

int
main()
{
    object_test();
    deep_test();
    parse_test();
    number_test();
    non_finite_test();
    equality_test();
    conversion_test();
    string_test();
    pretty_test();
    error_test();
    depth_test();
    round_trip_test();
    json_test_suite();
    afl_regression();

    BENCH(2000, 1, object_test());
    BENCH(2000, 1, deep_test());
    BENCH(2000, 1, parse_test());
    BENCH(2000, 1, round_trip_test());
    BENCH(2000, 1, json_test_suite());
}
