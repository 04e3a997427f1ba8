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
#include "json.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jschema {

class JsonSchema;

enum class SchemaType
{
    Object,
    Array,
    String,
    Number,
    Integer,
    Boolean,
    Null,
    Reference,
    AnyOf,
    AllOf,
    OneOf,
    Not,
    Empty,
    Any
};

enum class SchemaStatus
{
    success,
    invalid_json,
    invalid_schema,
    unknown_type,
    wrong_keyword_type,
    non_finite_number
};

struct SchemaError
{
    SchemaStatus status = SchemaStatus::success;
    std::string path; // JSON pointer to the offending value, "" for the root
    std::string message;

    bool ok() const
    {
        return status == SchemaStatus::success;
    }
};

// Options consulted while decoding. property_order lists property names
// in the order object schemas should present them; keys it doesn't name
// follow in key order. With preserve_source_order set, JsonSchema::parse()
// instead recovers each object schema's order from the document text,
// falling back to property_order where it can't.
struct DecodeContext
{
    std::vector<std::string> property_order;
    bool preserve_source_order = false;
};

// Presence bits for optional keywords.
enum SchemaKeyword : unsigned
{
    kTitle = 1u << 0,
    kDescription = 1u << 1,
    kDefault = 1u << 2,
    kExamples = 1u << 3,
    kEnum = 1u << 4,
    kConst = 1u << 5,
    kAdditionalProperties = 1u << 6,
    kMinItems = 1u << 7,
    kMaxItems = 1u << 8,
    kUniqueItems = 1u << 9,
    kMinLength = 1u << 10,
    kMaxLength = 1u << 11,
    kPattern = 1u << 12,
    kFormat = 1u << 13,
    kMinimum = 1u << 14,
    kMaximum = 1u << 15,
    kExclusiveMinimum = 1u << 16,
    kExclusiveMaximum = 1u << 17,
    kMultipleOf = 1u << 18
};

// The "format" of a string schema. Every string maps to some format:
// the standard names to their own kinds, anything else to Custom.
class StringFormat
{
  public:
    enum Kind
    {
        DateTime,
        Date,
        Time,
        Duration,
        Email,
        IdnEmail,
        Hostname,
        IdnHostname,
        Ipv4,
        Ipv6,
        Uri,
        UriReference,
        IriReference,
        UriTemplate,
        JsonPointer,
        RelativeJsonPointer,
        Regex,
        Uuid,
        Custom
    };

    StringFormat() : kind_(Custom)
    {
    }

    StringFormat(Kind kind) : kind_(kind)
    {
    }

    static StringFormat fromString(const std::string&);

    // A Custom format named s, even if s is a standard name.
    static StringFormat custom(const std::string& s);

    Kind getKind() const
    {
        return kind_;
    }

    std::string toString() const;

    size_t hash() const;

    bool operator==(const StringFormat&) const;
    bool operator!=(const StringFormat& other) const
    {
        return !(*this == other);
    }

  private:
    Kind kind_;
    std::string custom_;
};

// The value of "additionalProperties": a flag or a schema.
class AdditionalProperties
{
  public:
    AdditionalProperties(bool allowed = true);
    AdditionalProperties(const JsonSchema&);
    AdditionalProperties(const AdditionalProperties&);
    AdditionalProperties(AdditionalProperties&&) noexcept;
    ~AdditionalProperties();

    AdditionalProperties& operator=(const AdditionalProperties&);
    AdditionalProperties& operator=(AdditionalProperties&&) noexcept;

    bool isBoolean() const
    {
        return !schema_;
    }

    bool isSchema() const
    {
        return !!schema_;
    }

    // abort() on the wrong alternative, like Json's getters.
    bool getBoolean() const;
    const JsonSchema& getSchema() const;

    size_t hash() const;

    bool operator==(const AdditionalProperties&) const;
    bool operator!=(const AdditionalProperties& other) const
    {
        return !(*this == other);
    }

  private:
    bool allowed_;
    std::unique_ptr<JsonSchema> schema_;
};

// The "properties" of an object schema. Remembers insertion order, which
// is what the encoder emits; equality ignores it.
class PropertyMap
{
  public:
    PropertyMap();
    PropertyMap(const PropertyMap&);
    PropertyMap(PropertyMap&&) noexcept;
    ~PropertyMap();

    PropertyMap& operator=(const PropertyMap&);
    PropertyMap& operator=(PropertyMap&&) noexcept;

    // Adds key at the end, or replaces its schema in place.
    void set(const std::string& key, const JsonSchema& schema);
    bool erase(const std::string& key);

    bool contains(const std::string& key) const;
    const JsonSchema* find(const std::string& key) const;

    // abort() if key isn't present.
    const JsonSchema& at(const std::string& key) const;

    // Moves the keys named in order to the front, in that order. Unknown
    // names and repeats are ignored; other keys keep their relative order.
    void reorder(const std::vector<std::string>& order);

    const std::vector<std::string>& keys() const
    {
        return keys_;
    }

    size_t size() const
    {
        return keys_.size();
    }

    bool empty() const
    {
        return keys_.empty();
    }

    // Independent of key order, like operator==.
    size_t hash() const;

    bool operator==(const PropertyMap&) const;
    bool operator!=(const PropertyMap& other) const
    {
        return !(*this == other);
    }

  private:
    std::vector<std::string> keys_;
    std::map<std::string, JsonSchema> values_;
};

// Keywords shared by every typed schema.
struct SchemaAnnotations
{
    unsigned keywords = 0;
    std::string title;
    std::string description;
    Json default_value;
    std::vector<Json> examples;
    std::vector<Json> enum_values;
    Json const_value;

    bool has(SchemaKeyword keyword) const
    {
        return (keywords & keyword) != 0;
    }

    void unset(SchemaKeyword keyword)
    {
        keywords &= ~(unsigned)keyword;
    }

    void setTitle(const std::string& value)
    {
        title = value;
        keywords |= kTitle;
    }

    void setDescription(const std::string& value)
    {
        description = value;
        keywords |= kDescription;
    }

    void setDefault(const Json& value)
    {
        default_value = value;
        keywords |= kDefault;
    }

    void setExamples(const std::vector<Json>& value)
    {
        examples = value;
        keywords |= kExamples;
    }

    void setEnum(const std::vector<Json>& value)
    {
        enum_values = value;
        keywords |= kEnum;
    }

    void setConst(const Json& value)
    {
        const_value = value;
        keywords |= kConst;
    }

    bool sameAnnotations(const SchemaAnnotations&) const;
};

struct ObjectSchema : SchemaAnnotations
{
    PropertyMap properties;
    std::vector<std::string> required;
    AdditionalProperties additional_properties;

    void setAdditionalProperties(const AdditionalProperties& value)
    {
        additional_properties = value;
        keywords |= kAdditionalProperties;
    }

    bool operator==(const ObjectSchema&) const;
};

struct ArraySchema : SchemaAnnotations
{
    long long min_items = 0;
    long long max_items = 0;
    bool unique_items = false;

    ArraySchema();
    ArraySchema(const ArraySchema&);
    ArraySchema(ArraySchema&&) noexcept;
    ~ArraySchema();

    ArraySchema& operator=(const ArraySchema&);
    ArraySchema& operator=(ArraySchema&&) noexcept;

    bool hasItems() const
    {
        return !!items_;
    }

    // abort() if there is no items schema.
    const JsonSchema& getItems() const;
    void setItems(const JsonSchema&);
    void clearItems();

    void setMinItems(long long value)
    {
        min_items = value;
        keywords |= kMinItems;
    }

    void setMaxItems(long long value)
    {
        max_items = value;
        keywords |= kMaxItems;
    }

    void setUniqueItems(bool value)
    {
        unique_items = value;
        keywords |= kUniqueItems;
    }

    bool operator==(const ArraySchema&) const;

  private:
    std::unique_ptr<JsonSchema> items_;
};

struct StringSchema : SchemaAnnotations
{
    long long min_length = 0;
    long long max_length = 0;
    std::string pattern;
    StringFormat format;

    void setMinLength(long long value)
    {
        min_length = value;
        keywords |= kMinLength;
    }

    void setMaxLength(long long value)
    {
        max_length = value;
        keywords |= kMaxLength;
    }

    void setPattern(const std::string& value)
    {
        pattern = value;
        keywords |= kPattern;
    }

    void setFormat(const StringFormat& value)
    {
        format = value;
        keywords |= kFormat;
    }

    bool operator==(const StringSchema&) const;
};

// "number" schemas bound with doubles, "integer" schemas with integers.
template<typename T>
struct NumericSchema : SchemaAnnotations
{
    T minimum = 0;
    T maximum = 0;
    T exclusive_minimum = 0;
    T exclusive_maximum = 0;
    T multiple_of = 0;

    void setMinimum(T value)
    {
        minimum = value;
        keywords |= kMinimum;
    }

    void setMaximum(T value)
    {
        maximum = value;
        keywords |= kMaximum;
    }

    void setExclusiveMinimum(T value)
    {
        exclusive_minimum = value;
        keywords |= kExclusiveMinimum;
    }

    void setExclusiveMaximum(T value)
    {
        exclusive_maximum = value;
        keywords |= kExclusiveMaximum;
    }

    void setMultipleOf(T value)
    {
        multiple_of = value;
        keywords |= kMultipleOf;
    }

    bool operator==(const NumericSchema& other) const
    {
        return sameAnnotations(other) && //
               (!has(kMinimum) || minimum == other.minimum) &&
               (!has(kMaximum) || maximum == other.maximum) &&
               (!has(kExclusiveMinimum) ||
                exclusive_minimum == other.exclusive_minimum) &&
               (!has(kExclusiveMaximum) ||
                exclusive_maximum == other.exclusive_maximum) &&
               (!has(kMultipleOf) || multiple_of == other.multiple_of);
    }
};

typedef NumericSchema<double> NumberSchema;
typedef NumericSchema<long long> IntegerSchema;

struct BooleanSchema : SchemaAnnotations
{
    bool operator==(const BooleanSchema& other) const
    {
        return sameAnnotations(other);
    }
};

// A JSON Schema node.
//
// Typed schemas (object, array, string, number, integer, boolean) carry a
// record of their keywords. The remaining kinds are null, a $ref link
// (never resolved here), anyOf/allOf/oneOf lists, a negation, the empty
// schema {} and the accept-everything schema. Negating Any gives the
// reject-everything schema, which encodes as false.
class JsonSchema
{
  private:
    SchemaType type_;
    union
    {
        ObjectSchema object_value;
        ArraySchema array_value;
        StringSchema string_value;
        NumberSchema number_value;
        IntegerSchema integer_value;
        BooleanSchema boolean_value;
        std::string ref_value;
        std::vector<JsonSchema> list_value;
        std::unique_ptr<JsonSchema> not_value;
    };

  public:
    static const char* StatusToString(SchemaStatus);

    // Returns the "type" keyword for typed schemas and null, and a
    // descriptive name (reference, anyOf, not, empty, any...) otherwise.
    static const char* TypeToString(SchemaType);

    // Decodes a schema document. Decoding is all or nothing: on failure
    // the schema half of the result is the empty schema.
    static std::pair<SchemaError, JsonSchema> parse(const DecodeContext& ctx,
                                                    const char* s,
                                                    size_t len);
    static std::pair<SchemaError, JsonSchema> parse(const DecodeContext& ctx,
                                                    const std::string& s);
    static std::pair<SchemaError, JsonSchema> parse(const std::string& s);

    // Decodes a schema from an already parsed document. Source order isn't
    // available here, so preserve_source_order has no effect.
    static SchemaError decode(const DecodeContext& ctx,
                              const Json& json,
                              JsonSchema& schema);

    static JsonSchema object();
    static JsonSchema array();
    static JsonSchema string();
    static JsonSchema number();
    static JsonSchema integer();
    static JsonSchema boolean();
    static JsonSchema null();
    static JsonSchema reference(const std::string& ref);
    static JsonSchema anyOf(std::vector<JsonSchema> schemas);
    static JsonSchema allOf(std::vector<JsonSchema> schemas);
    static JsonSchema oneOf(std::vector<JsonSchema> schemas);
    static JsonSchema negate(const JsonSchema& schema);
    static JsonSchema empty();
    static JsonSchema any();

    // The empty schema.
    JsonSchema();

    JsonSchema(const ObjectSchema&);
    JsonSchema(const ArraySchema&);
    JsonSchema(const StringSchema&);
    JsonSchema(const NumberSchema&);
    JsonSchema(const IntegerSchema&);
    JsonSchema(const BooleanSchema&);

    JsonSchema(const JsonSchema&);
    JsonSchema(JsonSchema&&) noexcept;
    ~JsonSchema();

    JsonSchema& operator=(const JsonSchema&);
    JsonSchema& operator=(JsonSchema&&) noexcept;

    SchemaType getType() const
    {
        return type_;
    }

    bool isAny() const
    {
        return type_ == SchemaType::Any;
    }

    // True for not(any), the schema nothing satisfies.
    bool isFalse() const
    {
        return type_ == SchemaType::Not && not_value->type_ == SchemaType::Any;
    }

    // The typed getters abort() when called on the wrong type.
    const ObjectSchema& getObject() const;
    ObjectSchema& getObject();
    const ArraySchema& getArray() const;
    ArraySchema& getArray();
    const StringSchema& getString() const;
    StringSchema& getString();
    const NumberSchema& getNumber() const;
    NumberSchema& getNumber();
    const IntegerSchema& getInteger() const;
    IntegerSchema& getInteger();
    const BooleanSchema& getBoolean() const;
    BooleanSchema& getBoolean();

    const std::string& getReference() const;

    // The list of an anyOf, allOf or oneOf schema.
    const std::vector<JsonSchema>& getSchemas() const;

    // The operand of a not schema.
    const JsonSchema& getNegated() const;

    // The shared keywords of a typed schema, or nullptr for other kinds.
    const SchemaAnnotations* getAnnotations() const;

    // Appends the schema document to b. Object properties come out in
    // their stored order. Fails with non_finite_number if a number
    // keyword, or a number inside default/examples/enum/const, is
    // infinite or NaN.
    SchemaStatus encode(std::string& b, bool pretty = false, int indent = 0) const;

    // Return an empty string if encode() fails.
    std::string toString() const;
    std::string toStringPretty() const;

    // Hashes what operator== compares: unset keywords don't contribute
    // and property order is ignored.
    size_t hash() const;

    bool operator==(const JsonSchema&) const;
    bool operator!=(const JsonSchema& other) const
    {
        return !(*this == other);
    }

  private:
    void clear();
    void copy(const JsonSchema&);
    void take(JsonSchema&&);
    SchemaStatus marshal(std::string&, bool, int) const;
};

} // namespace jschema

namespace std {

template<>
struct hash<jschema::StringFormat>
{
    size_t operator()(const jschema::StringFormat& format) const
    {
        return format.hash();
    }
};

template<>
struct hash<jschema::AdditionalProperties>
{
    size_t operator()(const jschema::AdditionalProperties& value) const
    {
        return value.hash();
    }
};

template<>
struct hash<jschema::JsonSchema>
{
    size_t operator()(const jschema::JsonSchema& schema) const
    {
        return schema.hash();
    }
};

} // namespace std
