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

#include "property_order.h"
#include "json.h"

#include <cstring>
#include <utility>

namespace jschema {

static const char*
SkipSpace(const char* p, const char* e)
{
    while (p < e && (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r'))
        ++p;
    return p;
}

// p points at an opening quote. Returns the byte after the closing quote,
// or nullptr if the string is unterminated.
static const char*
SkipString(const char* p, const char* e)
{
    for (++p; p < e; ++p) {
        if (*p == '\\') {
            if (++p == e)
                return nullptr;
        } else if (*p == '"') {
            return p + 1;
        }
    }
    return nullptr;
}

// Returns the byte after the value starting at p, or nullptr.
static const char*
SkipValue(const char* p, const char* e)
{
    if (p >= e)
        return nullptr;
    if (*p == '"')
        return SkipString(p, e);
    if (*p == '{' || *p == '[') {
        int depth = 0;
        while (p < e) {
            switch (*p) {
                case '"':
                    if (!(p = SkipString(p, e)))
                        return nullptr;
                    continue;
                case '{':
                case '[':
                    ++depth;
                    break;
                case '}':
                case ']':
                    if (!--depth)
                        return p + 1;
                    break;
                default:
                    break;
            }
            ++p;
        }
        return nullptr;
    }
    const char* a = p;
    while (p < e && *p != ',' && *p != '}' && *p != ']' && *p != ' ' &&
           *p != '\t' && *p != '\n' && *p != '\r')
        ++p;
    return p > a ? p : nullptr;
}

// Decodes the quoted key spanning [a,b). Keys holding escapes go through
// the regular string parser so they come out exactly as in parsed objects.
static bool
DecodeKey(const char* a, const char* b, std::string& key)
{
    if (!memchr(a, '\\', b - a)) {
        key.assign(a + 1, b - 1);
        return true;
    }
    std::pair<JsonStatus, Json> res = Json::parse(a, b - a);
    if (res.first != JsonStatus::success || !res.second.isString())
        return false;
    key = std::move(res.second.getString());
    return true;
}

bool
scanObjectMembers(const char* p, const char* e, std::vector<SourceMember>& members)
{
    p = SkipSpace(p, e);
    if (p >= e || *p != '{')
        return false;
    p = SkipSpace(p + 1, e);
    if (p < e && *p == '}')
        return true;
    for (;;) {
        if (p >= e || *p != '"')
            return false;
        const char* key_end = SkipString(p, e);
        if (!key_end)
            return false;
        SourceMember member;
        if (!DecodeKey(p, key_end, member.key))
            return false;
        p = SkipSpace(key_end, e);
        if (p >= e || *p != ':')
            return false;
        p = SkipSpace(p + 1, e);
        member.value = p;
        if (!(p = SkipValue(p, e)))
            return false;
        members.emplace_back(std::move(member));
        p = SkipSpace(p, e);
        if (p >= e)
            return false;
        if (*p == '}')
            return true;
        if (*p != ',')
            return false;
        p = SkipSpace(p + 1, e);
    }
}

bool
extractPropertyOrder(const char* s,
                     size_t len,
                     const std::vector<std::string>& key_path,
                     std::vector<std::string>& out)
{
    if (Json::parse(s, len).first != JsonStatus::success)
        return false;
    const char* e = s + len;
    const char* p = s;
    std::vector<SourceMember> members;
    for (auto seg = key_path.begin(); seg != key_path.end(); ++seg) {
        members.clear();
        if (!scanObjectMembers(p, e, members))
            return false;
        const char* next = nullptr;
        for (auto m = members.begin(); m != members.end(); ++m)
            if (m->key == *seg)
                next = m->value;
        if (!next)
            return false;
        p = next;
    }
    members.clear();
    if (!scanObjectMembers(p, e, members))
        return false;
    std::vector<std::string> keys;
    keys.reserve(members.size());
    for (auto m = members.begin(); m != members.end(); ++m)
        keys.emplace_back(std::move(m->key));
    out = std::move(keys);
    return true;
}

bool
extractPropertyOrder(const std::string& s,
                     const std::vector<std::string>& key_path,
                     std::vector<std::string>& out)
{
    return extractPropertyOrder(s.data(), s.size(), key_path, out);
}

bool
extractPropertyOrder(const std::string& s, std::vector<std::string>& out)
{
    return extractPropertyOrder(s.data(), s.size(), std::vector<std::string>(), out);
}

bool
extractSchemaPropertyOrder(const char* s, size_t len, std::vector<std::string>& out)
{
    static const std::vector<std::string> kPropertiesPath(1, "properties");
    return extractPropertyOrder(s, len, kPropertiesPath, out);
}

bool
extractSchemaPropertyOrder(const std::string& s, std::vector<std::string>& out)
{
    return extractSchemaPropertyOrder(s.data(), s.size(), out);
}

} // namespace jschema
