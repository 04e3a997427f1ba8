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
#include <string>
#include <vector>

namespace jschema {

// Recovers the order in which an object's keys appear in JSON text.
//
// The document must be valid JSON. Starting at the root, each segment of
// key_path selects a member of the current object; the keys of the object
// reached at the end are stored in out in source order, repeats included.
// Keys are returned decoded, with escape sequences resolved. If a segment
// names a key more than once, the last occurrence is followed.
//
// Returns false, leaving out untouched, if the text isn't valid JSON, a
// segment is missing, or the value reached isn't an object.
bool extractPropertyOrder(const char* s,
                          size_t len,
                          const std::vector<std::string>& key_path,
                          std::vector<std::string>& out);
bool extractPropertyOrder(const std::string& s,
                          const std::vector<std::string>& key_path,
                          std::vector<std::string>& out);
bool extractPropertyOrder(const std::string& s, std::vector<std::string>& out);

// Same with key_path fixed to {"properties"}, i.e. the declared property
// order of a root object schema.
bool extractSchemaPropertyOrder(const char* s,
                                size_t len,
                                std::vector<std::string>& out);
bool extractSchemaPropertyOrder(const std::string& s,
                                std::vector<std::string>& out);

// A member of an object as it is written in JSON text.
struct SourceMember
{
    std::string key;   // decoded
    const char* value; // first byte of the member's value
};

// Appends the members of the object starting at p (after any whitespace)
// to out in source order, repeats included. The text up to e must already
// be known to be valid JSON. Returns false if p doesn't start an object.
bool scanObjectMembers(const char* p,
                       const char* e,
                       std::vector<SourceMember>& out);

} // namespace jschema
