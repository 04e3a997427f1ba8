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

#include "schema.h"
#include "property_order.h"

#include <cstdlib>
#include <set>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

namespace jschema {

static const struct
{
    StringFormat::Kind kind;
    const char* name;
} kStringFormats[] = {
    { StringFormat::DateTime, "date-time" },
    { StringFormat::Date, "date" },
    { StringFormat::Time, "time" },
    { StringFormat::Duration, "duration" },
    { StringFormat::Email, "email" },
    { StringFormat::IdnEmail, "idn-email" },
    { StringFormat::Hostname, "hostname" },
    { StringFormat::IdnHostname, "idn-hostname" },
    { StringFormat::Ipv4, "ipv4" },
    { StringFormat::Ipv6, "ipv6" },
    { StringFormat::Uri, "uri" },
    { StringFormat::UriReference, "uri-reference" },
    { StringFormat::IriReference, "iri-reference" },
    { StringFormat::UriTemplate, "uri-template" },
    { StringFormat::JsonPointer, "json-pointer" },
    { StringFormat::RelativeJsonPointer, "relative-json-pointer" },
    { StringFormat::Regex, "regex" },
    { StringFormat::Uuid, "uuid" },
};

static const SchemaType kPrimitiveTypes[] = {
    SchemaType::Object,  SchemaType::Array,   SchemaType::String,
    SchemaType::Number,  SchemaType::Integer, SchemaType::Boolean,
    SchemaType::Null,
};

static void
Indent(std::string& b, int indent)
{
    b += '\n';
    for (int j = 0; j < indent; ++j)
        b += "  ";
}

StringFormat
StringFormat::fromString(const std::string& s)
{
    for (size_t i = 0; i < ARRAYLEN(kStringFormats); ++i)
        if (s == kStringFormats[i].name)
            return StringFormat(kStringFormats[i].kind);
    return custom(s);
}

StringFormat
StringFormat::custom(const std::string& s)
{
    StringFormat format(Custom);
    format.custom_ = s;
    return format;
}

std::string
StringFormat::toString() const
{
    if (kind_ == Custom)
        return custom_;
    for (size_t i = 0; i < ARRAYLEN(kStringFormats); ++i)
        if (kStringFormats[i].kind == kind_)
            return kStringFormats[i].name;
    abort();
}

bool
StringFormat::operator==(const StringFormat& other) const
{
    if (kind_ != other.kind_)
        return false;
    return kind_ != Custom || custom_ == other.custom_;
}

AdditionalProperties::AdditionalProperties(bool allowed) : allowed_(allowed)
{
}

AdditionalProperties::AdditionalProperties(const JsonSchema& schema)
  : allowed_(true), schema_(new JsonSchema(schema))
{
}

AdditionalProperties::AdditionalProperties(const AdditionalProperties& other)
  : allowed_(other.allowed_)
{
    if (other.schema_)
        schema_.reset(new JsonSchema(*other.schema_));
}

AdditionalProperties::AdditionalProperties(AdditionalProperties&& other) noexcept
  : allowed_(other.allowed_), schema_(std::move(other.schema_))
{
}

AdditionalProperties::~AdditionalProperties()
{
}

AdditionalProperties&
AdditionalProperties::operator=(const AdditionalProperties& other)
{
    if (this != &other) {
        AdditionalProperties copy(other);
        *this = std::move(copy);
    }
    return *this;
}

AdditionalProperties&
AdditionalProperties::operator=(AdditionalProperties&& other) noexcept
{
    allowed_ = other.allowed_;
    schema_ = std::move(other.schema_);
    return *this;
}

bool
AdditionalProperties::getBoolean() const
{
    if (schema_)
        abort();
    return allowed_;
}

const JsonSchema&
AdditionalProperties::getSchema() const
{
    if (!schema_)
        abort();
    return *schema_;
}

bool
AdditionalProperties::operator==(const AdditionalProperties& other) const
{
    if (isSchema() != other.isSchema())
        return false;
    if (isSchema())
        return *schema_ == *other.schema_;
    return allowed_ == other.allowed_;
}

PropertyMap::PropertyMap()
{
}

PropertyMap::PropertyMap(const PropertyMap& other)
  : keys_(other.keys_), values_(other.values_)
{
}

PropertyMap::PropertyMap(PropertyMap&& other) noexcept
  : keys_(std::move(other.keys_)), values_(std::move(other.values_))
{
}

PropertyMap::~PropertyMap()
{
}

PropertyMap&
PropertyMap::operator=(const PropertyMap& other)
{
    if (this != &other) {
        PropertyMap copy(other);
        *this = std::move(copy);
    }
    return *this;
}

PropertyMap&
PropertyMap::operator=(PropertyMap&& other) noexcept
{
    keys_ = std::move(other.keys_);
    values_ = std::move(other.values_);
    return *this;
}

void
PropertyMap::set(const std::string& key, const JsonSchema& schema)
{
    auto it = values_.find(key);
    if (it != values_.end()) {
        it->second = schema;
        return;
    }
    values_.insert(std::make_pair(key, schema));
    keys_.push_back(key);
}

bool
PropertyMap::erase(const std::string& key)
{
    if (!values_.erase(key))
        return false;
    for (auto i = keys_.begin(); i != keys_.end(); ++i) {
        if (*i == key) {
            keys_.erase(i);
            break;
        }
    }
    return true;
}

bool
PropertyMap::contains(const std::string& key) const
{
    return values_.find(key) != values_.end();
}

const JsonSchema*
PropertyMap::find(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return nullptr;
    return &it->second;
}

const JsonSchema&
PropertyMap::at(const std::string& key) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        abort();
    return it->second;
}

void
PropertyMap::reorder(const std::vector<std::string>& order)
{
    std::vector<std::string> keys;
    std::set<std::string> seen;
    keys.reserve(keys_.size());
    for (auto i = order.begin(); i != order.end(); ++i)
        if (values_.count(*i) && seen.insert(*i).second)
            keys.push_back(*i);
    for (auto i = keys_.begin(); i != keys_.end(); ++i)
        if (!seen.count(*i))
            keys.push_back(*i);
    keys_ = std::move(keys);
}

bool
PropertyMap::operator==(const PropertyMap& other) const
{
    return values_ == other.values_;
}

bool
SchemaAnnotations::sameAnnotations(const SchemaAnnotations& other) const
{
    return keywords == other.keywords && //
           (!has(kTitle) || title == other.title) &&
           (!has(kDescription) || description == other.description) &&
           (!has(kDefault) || default_value == other.default_value) &&
           (!has(kExamples) || examples == other.examples) &&
           (!has(kEnum) || enum_values == other.enum_values) &&
           (!has(kConst) || const_value == other.const_value);
}

bool
ObjectSchema::operator==(const ObjectSchema& other) const
{
    return sameAnnotations(other) && //
           properties == other.properties && //
           required == other.required &&
           (!has(kAdditionalProperties) ||
            additional_properties == other.additional_properties);
}

ArraySchema::ArraySchema()
{
}

ArraySchema::ArraySchema(const ArraySchema& other)
  : SchemaAnnotations(other),
    min_items(other.min_items),
    max_items(other.max_items),
    unique_items(other.unique_items)
{
    if (other.items_)
        items_.reset(new JsonSchema(*other.items_));
}

ArraySchema::ArraySchema(ArraySchema&& other) noexcept
  : SchemaAnnotations(std::move(other)),
    min_items(other.min_items),
    max_items(other.max_items),
    unique_items(other.unique_items),
    items_(std::move(other.items_))
{
}

ArraySchema::~ArraySchema()
{
}

ArraySchema&
ArraySchema::operator=(const ArraySchema& other)
{
    if (this != &other) {
        ArraySchema copy(other);
        *this = std::move(copy);
    }
    return *this;
}

ArraySchema&
ArraySchema::operator=(ArraySchema&& other) noexcept
{
    SchemaAnnotations::operator=(std::move(other));
    min_items = other.min_items;
    max_items = other.max_items;
    unique_items = other.unique_items;
    items_ = std::move(other.items_);
    return *this;
}

const JsonSchema&
ArraySchema::getItems() const
{
    if (!items_)
        abort();
    return *items_;
}

void
ArraySchema::setItems(const JsonSchema& schema)
{
    items_.reset(new JsonSchema(schema));
}

void
ArraySchema::clearItems()
{
    items_.reset();
}

bool
ArraySchema::operator==(const ArraySchema& other) const
{
    if (!sameAnnotations(other))
        return false;
    if (hasItems() != other.hasItems())
        return false;
    if (hasItems() && *items_ != *other.items_)
        return false;
    return (!has(kMinItems) || min_items == other.min_items) &&
           (!has(kMaxItems) || max_items == other.max_items) &&
           (!has(kUniqueItems) || unique_items == other.unique_items);
}

bool
StringSchema::operator==(const StringSchema& other) const
{
    return sameAnnotations(other) && //
           (!has(kMinLength) || min_length == other.min_length) &&
           (!has(kMaxLength) || max_length == other.max_length) &&
           (!has(kPattern) || pattern == other.pattern) &&
           (!has(kFormat) || format == other.format);
}

JsonSchema::JsonSchema() : type_(SchemaType::Empty)
{
}

JsonSchema::JsonSchema(const ObjectSchema& value)
  : type_(SchemaType::Object), object_value(value)
{
}

JsonSchema::JsonSchema(const ArraySchema& value)
  : type_(SchemaType::Array), array_value(value)
{
}

JsonSchema::JsonSchema(const StringSchema& value)
  : type_(SchemaType::String), string_value(value)
{
}

JsonSchema::JsonSchema(const NumberSchema& value)
  : type_(SchemaType::Number), number_value(value)
{
}

JsonSchema::JsonSchema(const IntegerSchema& value)
  : type_(SchemaType::Integer), integer_value(value)
{
}

JsonSchema::JsonSchema(const BooleanSchema& value)
  : type_(SchemaType::Boolean), boolean_value(value)
{
}

JsonSchema::JsonSchema(const JsonSchema& other) : type_(SchemaType::Empty)
{
    copy(other);
}

JsonSchema::JsonSchema(JsonSchema&& other) noexcept : type_(SchemaType::Empty)
{
    take(std::move(other));
}

JsonSchema::~JsonSchema()
{
    clear();
}

JsonSchema&
JsonSchema::operator=(const JsonSchema& other)
{
    if (this != &other) {
        // other may be owned by this schema.
        JsonSchema copy(other);
        *this = std::move(copy);
    }
    return *this;
}

JsonSchema&
JsonSchema::operator=(JsonSchema&& other) noexcept
{
    if (this != &other) {
        JsonSchema tmp;
        tmp.take(std::move(other));
        clear();
        take(std::move(tmp));
    }
    return *this;
}

void
JsonSchema::clear()
{
    switch (type_) {
        case SchemaType::Object:
            object_value.~ObjectSchema();
            break;
        case SchemaType::Array:
            array_value.~ArraySchema();
            break;
        case SchemaType::String:
            string_value.~StringSchema();
            break;
        case SchemaType::Number:
            number_value.~NumberSchema();
            break;
        case SchemaType::Integer:
            integer_value.~IntegerSchema();
            break;
        case SchemaType::Boolean:
            boolean_value.~BooleanSchema();
            break;
        case SchemaType::Reference:
            ref_value.~basic_string();
            break;
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            list_value.~vector();
            break;
        case SchemaType::Not:
            not_value.~unique_ptr();
            break;
        default:
            break;
    }
    type_ = SchemaType::Empty;
}

// Requires this to hold no payload.
void
JsonSchema::copy(const JsonSchema& other)
{
    switch (other.type_) {
        case SchemaType::Object:
            new (&object_value) ObjectSchema(other.object_value);
            break;
        case SchemaType::Array:
            new (&array_value) ArraySchema(other.array_value);
            break;
        case SchemaType::String:
            new (&string_value) StringSchema(other.string_value);
            break;
        case SchemaType::Number:
            new (&number_value) NumberSchema(other.number_value);
            break;
        case SchemaType::Integer:
            new (&integer_value) IntegerSchema(other.integer_value);
            break;
        case SchemaType::Boolean:
            new (&boolean_value) BooleanSchema(other.boolean_value);
            break;
        case SchemaType::Reference:
            new (&ref_value) std::string(other.ref_value);
            break;
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            new (&list_value) std::vector<JsonSchema>(other.list_value);
            break;
        case SchemaType::Not:
            new (&not_value) std::unique_ptr<JsonSchema>(new JsonSchema(*other.not_value));
            break;
        default:
            break;
    }
    type_ = other.type_;
}

// Requires this to hold no payload. Leaves other empty.
void
JsonSchema::take(JsonSchema&& other)
{
    switch (other.type_) {
        case SchemaType::Object:
            new (&object_value) ObjectSchema(std::move(other.object_value));
            break;
        case SchemaType::Array:
            new (&array_value) ArraySchema(std::move(other.array_value));
            break;
        case SchemaType::String:
            new (&string_value) StringSchema(std::move(other.string_value));
            break;
        case SchemaType::Number:
            new (&number_value) NumberSchema(std::move(other.number_value));
            break;
        case SchemaType::Integer:
            new (&integer_value) IntegerSchema(std::move(other.integer_value));
            break;
        case SchemaType::Boolean:
            new (&boolean_value) BooleanSchema(std::move(other.boolean_value));
            break;
        case SchemaType::Reference:
            new (&ref_value) std::string(std::move(other.ref_value));
            break;
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            new (&list_value) std::vector<JsonSchema>(std::move(other.list_value));
            break;
        case SchemaType::Not:
            new (&not_value) std::unique_ptr<JsonSchema>(std::move(other.not_value));
            break;
        default:
            break;
    }
    type_ = other.type_;
    other.clear();
}

JsonSchema
JsonSchema::object()
{
    return JsonSchema(ObjectSchema());
}

JsonSchema
JsonSchema::array()
{
    return JsonSchema(ArraySchema());
}

JsonSchema
JsonSchema::string()
{
    return JsonSchema(StringSchema());
}

JsonSchema
JsonSchema::number()
{
    return JsonSchema(NumberSchema());
}

JsonSchema
JsonSchema::integer()
{
    return JsonSchema(IntegerSchema());
}

JsonSchema
JsonSchema::boolean()
{
    return JsonSchema(BooleanSchema());
}

JsonSchema
JsonSchema::null()
{
    JsonSchema schema;
    schema.type_ = SchemaType::Null;
    return schema;
}

JsonSchema
JsonSchema::reference(const std::string& ref)
{
    JsonSchema schema;
    new (&schema.ref_value) std::string(ref);
    schema.type_ = SchemaType::Reference;
    return schema;
}

JsonSchema
JsonSchema::anyOf(std::vector<JsonSchema> schemas)
{
    JsonSchema schema;
    new (&schema.list_value) std::vector<JsonSchema>(std::move(schemas));
    schema.type_ = SchemaType::AnyOf;
    return schema;
}

JsonSchema
JsonSchema::allOf(std::vector<JsonSchema> schemas)
{
    JsonSchema schema;
    new (&schema.list_value) std::vector<JsonSchema>(std::move(schemas));
    schema.type_ = SchemaType::AllOf;
    return schema;
}

JsonSchema
JsonSchema::oneOf(std::vector<JsonSchema> schemas)
{
    JsonSchema schema;
    new (&schema.list_value) std::vector<JsonSchema>(std::move(schemas));
    schema.type_ = SchemaType::OneOf;
    return schema;
}

JsonSchema
JsonSchema::negate(const JsonSchema& operand)
{
    JsonSchema schema;
    new (&schema.not_value) std::unique_ptr<JsonSchema>(new JsonSchema(operand));
    schema.type_ = SchemaType::Not;
    return schema;
}

JsonSchema
JsonSchema::empty()
{
    return JsonSchema();
}

JsonSchema
JsonSchema::any()
{
    JsonSchema schema;
    schema.type_ = SchemaType::Any;
    return schema;
}

const ObjectSchema&
JsonSchema::getObject() const
{
    if (type_ != SchemaType::Object)
        abort();
    return object_value;
}

ObjectSchema&
JsonSchema::getObject()
{
    if (type_ != SchemaType::Object)
        abort();
    return object_value;
}

const ArraySchema&
JsonSchema::getArray() const
{
    if (type_ != SchemaType::Array)
        abort();
    return array_value;
}

ArraySchema&
JsonSchema::getArray()
{
    if (type_ != SchemaType::Array)
        abort();
    return array_value;
}

const StringSchema&
JsonSchema::getString() const
{
    if (type_ != SchemaType::String)
        abort();
    return string_value;
}

StringSchema&
JsonSchema::getString()
{
    if (type_ != SchemaType::String)
        abort();
    return string_value;
}

const NumberSchema&
JsonSchema::getNumber() const
{
    if (type_ != SchemaType::Number)
        abort();
    return number_value;
}

NumberSchema&
JsonSchema::getNumber()
{
    if (type_ != SchemaType::Number)
        abort();
    return number_value;
}

const IntegerSchema&
JsonSchema::getInteger() const
{
    if (type_ != SchemaType::Integer)
        abort();
    return integer_value;
}

IntegerSchema&
JsonSchema::getInteger()
{
    if (type_ != SchemaType::Integer)
        abort();
    return integer_value;
}

const BooleanSchema&
JsonSchema::getBoolean() const
{
    if (type_ != SchemaType::Boolean)
        abort();
    return boolean_value;
}

BooleanSchema&
JsonSchema::getBoolean()
{
    if (type_ != SchemaType::Boolean)
        abort();
    return boolean_value;
}

const std::string&
JsonSchema::getReference() const
{
    if (type_ != SchemaType::Reference)
        abort();
    return ref_value;
}

const std::vector<JsonSchema>&
JsonSchema::getSchemas() const
{
    switch (type_) {
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            return list_value;
        default:
            abort();
    }
}

const JsonSchema&
JsonSchema::getNegated() const
{
    if (type_ != SchemaType::Not)
        abort();
    return *not_value;
}

const SchemaAnnotations*
JsonSchema::getAnnotations() const
{
    switch (type_) {
        case SchemaType::Object:
            return &object_value;
        case SchemaType::Array:
            return &array_value;
        case SchemaType::String:
            return &string_value;
        case SchemaType::Number:
            return &number_value;
        case SchemaType::Integer:
            return &integer_value;
        case SchemaType::Boolean:
            return &boolean_value;
        default:
            return nullptr;
    }
}

bool
JsonSchema::operator==(const JsonSchema& other) const
{
    if (type_ != other.type_)
        return false;
    switch (type_) {
        case SchemaType::Object:
            return object_value == other.object_value;
        case SchemaType::Array:
            return array_value == other.array_value;
        case SchemaType::String:
            return string_value == other.string_value;
        case SchemaType::Number:
            return number_value == other.number_value;
        case SchemaType::Integer:
            return integer_value == other.integer_value;
        case SchemaType::Boolean:
            return boolean_value == other.boolean_value;
        case SchemaType::Reference:
            return ref_value == other.ref_value;
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            return list_value == other.list_value;
        case SchemaType::Not:
            return *not_value == *other.not_value;
        case SchemaType::Null:
        case SchemaType::Empty:
        case SchemaType::Any:
            return true;
        default:
            abort();
    }
}

////////////////////////////////////////////////////////////////////////////////
// encoding

namespace {

// Emits the members of one JSON object.
struct ObjectWriter
{
    std::string& b;
    bool pretty;
    int indent;
    bool once;

    ObjectWriter(std::string& b, bool pretty, int indent)
      : b(b), pretty(pretty), indent(indent), once(false)
    {
        b += '{';
    }

    void key(const std::string& name)
    {
        if (once)
            b += ',';
        once = true;
        if (pretty)
            Indent(b, indent + 1);
        Json::stringify(b, name);
        b += ':';
        if (pretty)
            b += ' ';
    }

    void close()
    {
        if (pretty && once)
            Indent(b, indent);
        b += '}';
    }
};

} // namespace

static void
Separate(std::string& b, bool pretty)
{
    b += ',';
    if (pretty)
        b += ' ';
}

static SchemaStatus
EncodeValue(ObjectWriter& w, const char* keyword, const Json& value)
{
    w.key(keyword);
    if (value.encode(w.b, w.pretty, w.indent + 1) != JsonStatus::success)
        return SchemaStatus::non_finite_number;
    return SchemaStatus::success;
}

static SchemaStatus
EncodeValues(ObjectWriter& w, const char* keyword, const std::vector<Json>& values)
{
    w.key(keyword);
    w.b += '[';
    for (auto i = values.begin(); i != values.end(); ++i) {
        if (i != values.begin())
            Separate(w.b, w.pretty);
        if (i->encode(w.b, w.pretty, w.indent + 1) != JsonStatus::success)
            return SchemaStatus::non_finite_number;
    }
    w.b += ']';
    return SchemaStatus::success;
}

static SchemaStatus
EncodeAnnotations(ObjectWriter& w, const SchemaAnnotations& schema)
{
    SchemaStatus status = SchemaStatus::success;
    if (schema.has(kTitle)) {
        w.key("title");
        Json::stringify(w.b, schema.title);
    }
    if (schema.has(kDescription)) {
        w.key("description");
        Json::stringify(w.b, schema.description);
    }
    if (schema.has(kDefault) &&
        (status = EncodeValue(w, "default", schema.default_value)) !=
          SchemaStatus::success)
        return status;
    if (schema.has(kExamples) &&
        (status = EncodeValues(w, "examples", schema.examples)) !=
          SchemaStatus::success)
        return status;
    if (schema.has(kEnum) &&
        (status = EncodeValues(w, "enum", schema.enum_values)) !=
          SchemaStatus::success)
        return status;
    if (schema.has(kConst) &&
        (status = EncodeValue(w, "const", schema.const_value)) !=
          SchemaStatus::success)
        return status;
    return SchemaStatus::success;
}

static bool
AppendNumber(std::string& b, double x)
{
    return Json::stringifyDouble(b, x);
}

static bool
AppendNumber(std::string& b, long long x)
{
    return Json(x).encode(b) == JsonStatus::success;
}

template<typename T>
struct NumericKeyword
{
    const char* name;
    SchemaKeyword keyword;
    T NumericSchema<T>::*field;
};

template<typename T>
static const NumericKeyword<T>*
GetNumericKeywords(size_t& n)
{
    static const NumericKeyword<T> kKeywords[] = {
        { "minimum", kMinimum, &NumericSchema<T>::minimum },
        { "maximum", kMaximum, &NumericSchema<T>::maximum },
        { "exclusiveMinimum", kExclusiveMinimum, &NumericSchema<T>::exclusive_minimum },
        { "exclusiveMaximum", kExclusiveMaximum, &NumericSchema<T>::exclusive_maximum },
        { "multipleOf", kMultipleOf, &NumericSchema<T>::multiple_of },
    };
    n = ARRAYLEN(kKeywords);
    return kKeywords;
}

template<typename T>
static SchemaStatus
EncodeNumeric(ObjectWriter& w, const NumericSchema<T>& schema)
{
    size_t n;
    const NumericKeyword<T>* table = GetNumericKeywords<T>(n);
    for (size_t i = 0; i < n; ++i) {
        if (!schema.has(table[i].keyword))
            continue;
        w.key(table[i].name);
        if (!AppendNumber(w.b, schema.*table[i].field))
            return SchemaStatus::non_finite_number;
    }
    return SchemaStatus::success;
}

SchemaStatus
JsonSchema::marshal(std::string& b, bool pretty, int indent) const
{
    SchemaStatus status;
    switch (type_) {
        case SchemaType::Any:
            b += "true";
            return SchemaStatus::success;
        case SchemaType::Empty:
            b += "{}";
            return SchemaStatus::success;
        default:
            break;
    }
    if (isFalse()) {
        b += "false";
        return SchemaStatus::success;
    }
    ObjectWriter w(b, pretty, indent);
    switch (type_) {
        case SchemaType::Reference:
            w.key("$ref");
            Json::stringify(b, ref_value);
            break;
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            w.key(TypeToString(type_));
            b += '[';
            for (auto i = list_value.begin(); i != list_value.end(); ++i) {
                if (i != list_value.begin())
                    Separate(b, pretty);
                if ((status = i->marshal(b, pretty, indent + 1)) !=
                    SchemaStatus::success)
                    return status;
            }
            b += ']';
            break;
        case SchemaType::Not:
            w.key("not");
            if ((status = not_value->marshal(b, pretty, indent + 1)) !=
                SchemaStatus::success)
                return status;
            break;
        default:
            w.key("type");
            Json::stringify(b, TypeToString(type_));
            if (type_ != SchemaType::Null &&
                (status = EncodeAnnotations(w, *getAnnotations())) !=
                  SchemaStatus::success)
                return status;
            break;
    }
    switch (type_) {
        case SchemaType::Object: {
            const ObjectSchema& schema = object_value;
            if (!schema.properties.empty()) {
                w.key("properties");
                ObjectWriter props(b, pretty, indent + 1);
                const std::vector<std::string>& keys = schema.properties.keys();
                for (auto i = keys.begin(); i != keys.end(); ++i) {
                    props.key(*i);
                    if ((status = schema.properties.at(*i).marshal(
                           b, pretty, indent + 2)) != SchemaStatus::success)
                        return status;
                }
                props.close();
            }
            if (!schema.required.empty()) {
                w.key("required");
                b += '[';
                for (auto i = schema.required.begin(); i != schema.required.end(); ++i) {
                    if (i != schema.required.begin())
                        Separate(b, pretty);
                    Json::stringify(b, *i);
                }
                b += ']';
            }
            if (schema.has(kAdditionalProperties)) {
                w.key("additionalProperties");
                const AdditionalProperties& ap = schema.additional_properties;
                if (ap.isBoolean()) {
                    b += ap.getBoolean() ? "true" : "false";
                } else if ((status = ap.getSchema().marshal(b, pretty, indent + 1)) !=
                           SchemaStatus::success) {
                    return status;
                }
            }
            break;
        }
        case SchemaType::Array: {
            const ArraySchema& schema = array_value;
            if (schema.hasItems()) {
                w.key("items");
                if ((status = schema.getItems().marshal(b, pretty, indent + 1)) !=
                    SchemaStatus::success)
                    return status;
            }
            if (schema.has(kMinItems)) {
                w.key("minItems");
                AppendNumber(b, schema.min_items);
            }
            if (schema.has(kMaxItems)) {
                w.key("maxItems");
                AppendNumber(b, schema.max_items);
            }
            if (schema.has(kUniqueItems)) {
                w.key("uniqueItems");
                b += schema.unique_items ? "true" : "false";
            }
            break;
        }
        case SchemaType::String: {
            const StringSchema& schema = string_value;
            if (schema.has(kMinLength)) {
                w.key("minLength");
                AppendNumber(b, schema.min_length);
            }
            if (schema.has(kMaxLength)) {
                w.key("maxLength");
                AppendNumber(b, schema.max_length);
            }
            if (schema.has(kPattern)) {
                w.key("pattern");
                Json::stringify(b, schema.pattern);
            }
            if (schema.has(kFormat)) {
                w.key("format");
                Json::stringify(b, schema.format.toString());
            }
            break;
        }
        case SchemaType::Number:
            if ((status = EncodeNumeric(w, number_value)) != SchemaStatus::success)
                return status;
            break;
        case SchemaType::Integer:
            if ((status = EncodeNumeric(w, integer_value)) != SchemaStatus::success)
                return status;
            break;
        default:
            break;
    }
    w.close();
    return SchemaStatus::success;
}

SchemaStatus
JsonSchema::encode(std::string& b, bool pretty, int indent) const
{
    return marshal(b, pretty, indent);
}

std::string
JsonSchema::toString() const
{
    std::string b;
    if (encode(b, false) != SchemaStatus::success)
        return std::string();
    return b;
}

std::string
JsonSchema::toStringPretty() const
{
    std::string b;
    if (encode(b, true) != SchemaStatus::success)
        return std::string();
    return b;
}

////////////////////////////////////////////////////////////////////////////////
// hashing

static size_t
HashCombine(size_t seed, size_t h)
{
    return seed ^ (h + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

static size_t
HashString(const std::string& s)
{
    return std::hash<std::string>()(s);
}

static size_t
HashNumber(double x)
{
    // 0.0 and -0.0 compare equal so they must hash alike.
    return std::hash<double>()(x == 0 ? 0.0 : x);
}

static size_t
HashNumber(long long x)
{
    return std::hash<long long>()(x);
}

static size_t
HashValues(size_t h, const std::vector<Json>& values)
{
    for (auto i = values.begin(); i != values.end(); ++i)
        h = HashCombine(h, i->hash());
    return h;
}

static size_t
HashAnnotations(size_t h, const SchemaAnnotations& schema)
{
    h = HashCombine(h, std::hash<unsigned>()(schema.keywords));
    if (schema.has(kTitle))
        h = HashCombine(h, HashString(schema.title));
    if (schema.has(kDescription))
        h = HashCombine(h, HashString(schema.description));
    if (schema.has(kDefault))
        h = HashCombine(h, schema.default_value.hash());
    if (schema.has(kExamples))
        h = HashValues(h, schema.examples);
    if (schema.has(kEnum))
        h = HashValues(h, schema.enum_values);
    if (schema.has(kConst))
        h = HashCombine(h, schema.const_value.hash());
    return h;
}

template<typename T>
static size_t
HashNumeric(size_t h, const NumericSchema<T>& schema)
{
    size_t n;
    const NumericKeyword<T>* table = GetNumericKeywords<T>(n);
    h = HashAnnotations(h, schema);
    for (size_t i = 0; i < n; ++i)
        if (schema.has(table[i].keyword))
            h = HashCombine(h, HashNumber(schema.*table[i].field));
    return h;
}

size_t
StringFormat::hash() const
{
    size_t h = std::hash<int>()(kind_);
    if (kind_ == Custom)
        h = HashCombine(h, HashString(custom_));
    return h;
}

size_t
AdditionalProperties::hash() const
{
    if (schema_)
        return HashCombine(std::hash<bool>()(true), schema_->hash());
    return std::hash<bool>()(allowed_);
}

size_t
PropertyMap::hash() const
{
    size_t h = 0;
    for (auto i = values_.begin(); i != values_.end(); ++i) {
        h = HashCombine(h, HashString(i->first));
        h = HashCombine(h, i->second.hash());
    }
    return h;
}

size_t
JsonSchema::hash() const
{
    size_t h = std::hash<int>()(static_cast<int>(type_));
    switch (type_) {
        case SchemaType::Object: {
            const ObjectSchema& schema = object_value;
            h = HashAnnotations(h, schema);
            h = HashCombine(h, schema.properties.hash());
            for (auto i = schema.required.begin(); i != schema.required.end(); ++i)
                h = HashCombine(h, HashString(*i));
            if (schema.has(kAdditionalProperties))
                h = HashCombine(h, schema.additional_properties.hash());
            return h;
        }
        case SchemaType::Array: {
            const ArraySchema& schema = array_value;
            h = HashAnnotations(h, schema);
            if (schema.hasItems())
                h = HashCombine(h, schema.getItems().hash());
            if (schema.has(kMinItems))
                h = HashCombine(h, HashNumber(schema.min_items));
            if (schema.has(kMaxItems))
                h = HashCombine(h, HashNumber(schema.max_items));
            if (schema.has(kUniqueItems))
                h = HashCombine(h, std::hash<bool>()(schema.unique_items));
            return h;
        }
        case SchemaType::String: {
            const StringSchema& schema = string_value;
            h = HashAnnotations(h, schema);
            if (schema.has(kMinLength))
                h = HashCombine(h, HashNumber(schema.min_length));
            if (schema.has(kMaxLength))
                h = HashCombine(h, HashNumber(schema.max_length));
            if (schema.has(kPattern))
                h = HashCombine(h, HashString(schema.pattern));
            if (schema.has(kFormat))
                h = HashCombine(h, schema.format.hash());
            return h;
        }
        case SchemaType::Number:
            return HashNumeric(h, number_value);
        case SchemaType::Integer:
            return HashNumeric(h, integer_value);
        case SchemaType::Boolean:
            return HashAnnotations(h, boolean_value);
        case SchemaType::Reference:
            return HashCombine(h, HashString(ref_value));
        case SchemaType::AnyOf:
        case SchemaType::AllOf:
        case SchemaType::OneOf:
            for (auto i = list_value.begin(); i != list_value.end(); ++i)
                h = HashCombine(h, i->hash());
            return h;
        case SchemaType::Not:
            return HashCombine(h, not_value->hash());
        case SchemaType::Null:
        case SchemaType::Empty:
        case SchemaType::Any:
            return h;
        default:
            abort();
    }
}

////////////////////////////////////////////////////////////////////////////////
// decoding

namespace {

struct DecodeState
{
    const DecodeContext& ctx;
    const char* end; // end of the source text when recovering its order
};

} // namespace

static SchemaError
DecodeSchema(const DecodeState&,
             const Json&,
             const std::string&,
             const char*,
             JsonSchema&);

// Escapes a key for use as a JSON pointer reference token.
static std::string
PointerToken(const std::string& key)
{
    std::string token;
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '~')
            token += "~0";
        else if (key[i] == '/')
            token += "~1";
        else
            token += key[i];
    }
    return token;
}

static SchemaError
MakeError(SchemaStatus status, const std::string& path, const std::string& message)
{
    SchemaError error;
    error.status = status;
    error.path = path;
    error.message = message;
    return error;
}

static SchemaError
WrongType(const std::string& path, const char* expected, const Json& got)
{
    return MakeError(SchemaStatus::wrong_keyword_type,
                     path,
                     std::string("expected ") + expected + ", got " +
                       Json::TypeToString(got.getType()));
}

// An explicit null reads as an absent keyword.
static const Json*
FindKeyword(const Json& json, const char* keyword)
{
    const Json* value = json.find(keyword);
    if (value && value->isNull())
        return nullptr;
    return value;
}

// Source text of member key of the object whose text starts at node, or
// nullptr if there's no text to go by.
static const char*
MemberText(const DecodeState& state, const char* node, const char* key)
{
    std::vector<SourceMember> members;
    if (!node || !scanObjectMembers(node, state.end, members))
        return nullptr;
    const char* value = nullptr;
    for (auto m = members.begin(); m != members.end(); ++m)
        if (m->key == key)
            value = m->value;
    return value;
}

static bool
ReadNumber(const Json& value, double& out)
{
    if (!value.isNumber())
        return false;
    out = value.getNumber();
    return true;
}

static bool
ReadNumber(const Json& value, long long& out)
{
    return value.isNumber() && value.asInt(out, false);
}

static const char*
NumberKind(double)
{
    return "number";
}

static const char*
NumberKind(long long)
{
    return "integer";
}

static SchemaError
DecodeString(const Json& json,
             const std::string& path,
             const char* keyword,
             std::string& out,
             bool& present)
{
    present = false;
    const Json* value = FindKeyword(json, keyword);
    if (!value)
        return SchemaError();
    if (!value->isString())
        return WrongType(path + "/" + keyword, "string", *value);
    out = value->getString();
    present = true;
    return SchemaError();
}

static SchemaError
DecodeCount(const Json& json,
            const std::string& path,
            const char* keyword,
            long long& out,
            bool& present)
{
    present = false;
    const Json* value = FindKeyword(json, keyword);
    if (!value)
        return SchemaError();
    if (!ReadNumber(*value, out))
        return WrongType(path + "/" + keyword, "integer", *value);
    present = true;
    return SchemaError();
}

static SchemaError
DecodeValues(const Json& json,
             const std::string& path,
             const char* keyword,
             std::vector<Json>& out,
             bool& present)
{
    present = false;
    const Json* value = FindKeyword(json, keyword);
    if (!value)
        return SchemaError();
    if (!value->isArray())
        return WrongType(path + "/" + keyword, "array", *value);
    out = value->getArray();
    present = true;
    return SchemaError();
}

static SchemaError
DecodeAnnotations(const Json& json, const std::string& path, SchemaAnnotations& schema)
{
    SchemaError error;
    bool present;
    std::string s;
    std::vector<Json> values;
    if (!(error = DecodeString(json, path, "title", s, present)).ok())
        return error;
    if (present)
        schema.setTitle(s);
    if (!(error = DecodeString(json, path, "description", s, present)).ok())
        return error;
    if (present)
        schema.setDescription(s);
    if (const Json* value = json.find("default"))
        schema.setDefault(*value);
    if (!(error = DecodeValues(json, path, "examples", values, present)).ok())
        return error;
    if (present)
        schema.setExamples(values);
    if (!(error = DecodeValues(json, path, "enum", values, present)).ok())
        return error;
    if (present)
        schema.setEnum(values);
    if (const Json* value = json.find("const"))
        schema.setConst(*value);
    return error;
}

template<typename T>
static SchemaError
DecodeNumeric(const Json& json, const std::string& path, NumericSchema<T>& schema)
{
    size_t n;
    const NumericKeyword<T>* table = GetNumericKeywords<T>(n);
    for (size_t i = 0; i < n; ++i) {
        const Json* value = FindKeyword(json, table[i].name);
        if (!value)
            continue;
        T x = 0;
        if (!ReadNumber(*value, x))
            return WrongType(path + "/" + table[i].name, NumberKind(x), *value);
        schema.*table[i].field = x;
        schema.keywords |= table[i].keyword;
    }
    return SchemaError();
}

static SchemaError
DecodeObject(const DecodeState& state,
             const Json& json,
             const std::string& path,
             const char* node,
             ObjectSchema& schema)
{
    SchemaError error;
    if (const Json* value = FindKeyword(json, "properties")) {
        if (!value->isObject())
            return WrongType(path + "/properties", "object", *value);
        std::vector<SourceMember> source;
        const char* text = MemberText(state, node, "properties");
        if (text && !scanObjectMembers(text, state.end, source))
            text = nullptr;
        std::map<std::string, const char*> texts;
        for (auto m = source.begin(); m != source.end(); ++m)
            texts[m->key] = m->value;
        const std::map<std::string, Json>& members = value->getObject();
        for (auto i = members.begin(); i != members.end(); ++i) {
            JsonSchema child;
            auto t = texts.find(i->first);
            if (!(error = DecodeSchema(state,
                                       i->second,
                                       path + "/properties/" + PointerToken(i->first),
                                       t != texts.end() ? t->second : nullptr,
                                       child))
                   .ok())
                return error;
            schema.properties.set(i->first, child);
        }
        if (text) {
            std::vector<std::string> order;
            for (auto m = source.begin(); m != source.end(); ++m)
                order.push_back(m->key);
            schema.properties.reorder(order);
        } else if (!state.ctx.property_order.empty()) {
            schema.properties.reorder(state.ctx.property_order);
        }
    }
    if (const Json* value = FindKeyword(json, "required")) {
        if (!value->isArray())
            return WrongType(path + "/required", "array", *value);
        const std::vector<Json>& names = value->getArray();
        for (size_t i = 0; i < names.size(); ++i) {
            if (!names[i].isString())
                return WrongType(path + "/required/" + std::to_string(i), "string", names[i]);
            schema.required.push_back(names[i].getString());
        }
    }
    if (const Json* value = FindKeyword(json, "additionalProperties")) {
        if (value->isBool()) {
            schema.setAdditionalProperties(AdditionalProperties(value->getBool()));
        } else {
            JsonSchema child;
            if (!(error = DecodeSchema(state,
                                       *value,
                                       path + "/additionalProperties",
                                       MemberText(state, node, "additionalProperties"),
                                       child))
                   .ok())
                return error;
            schema.setAdditionalProperties(AdditionalProperties(child));
        }
    }
    return error;
}

static SchemaError
DecodeArray(const DecodeState& state,
            const Json& json,
            const std::string& path,
            const char* node,
            ArraySchema& schema)
{
    SchemaError error;
    bool present;
    long long count;
    if (const Json* value = FindKeyword(json, "items")) {
        JsonSchema items;
        if (!(error = DecodeSchema(state,
                                   *value,
                                   path + "/items",
                                   MemberText(state, node, "items"),
                                   items))
               .ok())
            return error;
        schema.setItems(items);
    }
    if (!(error = DecodeCount(json, path, "minItems", count, present)).ok())
        return error;
    if (present)
        schema.setMinItems(count);
    if (!(error = DecodeCount(json, path, "maxItems", count, present)).ok())
        return error;
    if (present)
        schema.setMaxItems(count);
    if (const Json* value = FindKeyword(json, "uniqueItems")) {
        if (!value->isBool())
            return WrongType(path + "/uniqueItems", "boolean", *value);
        schema.setUniqueItems(value->getBool());
    }
    return error;
}

static SchemaError
DecodeStringSchema(const Json& json, const std::string& path, StringSchema& schema)
{
    SchemaError error;
    bool present;
    long long count;
    std::string s;
    if (!(error = DecodeCount(json, path, "minLength", count, present)).ok())
        return error;
    if (present)
        schema.setMinLength(count);
    if (!(error = DecodeCount(json, path, "maxLength", count, present)).ok())
        return error;
    if (present)
        schema.setMaxLength(count);
    if (!(error = DecodeString(json, path, "pattern", s, present)).ok())
        return error;
    if (present)
        schema.setPattern(s);
    if (!(error = DecodeString(json, path, "format", s, present)).ok())
        return error;
    if (present)
        schema.setFormat(StringFormat::fromString(s));
    return error;
}

static SchemaError
DecodeList(const DecodeState& state,
           const Json& list,
           const std::string& path,
           std::vector<JsonSchema>& out)
{
    if (!list.isArray())
        return WrongType(path, "array", list);
    const std::vector<Json>& items = list.getArray();
    for (size_t i = 0; i < items.size(); ++i) {
        JsonSchema schema;
        SchemaError error =
          DecodeSchema(state, items[i], path + "/" + std::to_string(i), nullptr, schema);
        if (!error.ok())
            return error;
        out.emplace_back(std::move(schema));
    }
    return SchemaError();
}

// Decodes the schema node json found at path. node is where json starts
// in the source text, or nullptr when its property order isn't recovered.
static SchemaError
DecodeSchema(const DecodeState& state,
             const Json& json,
             const std::string& path,
             const char* node,
             JsonSchema& out)
{
    SchemaError error;

    if (json.isBool()) {
        out = json.getBool() ? JsonSchema::any() : JsonSchema::negate(JsonSchema::any());
        return error;
    }
    if (!json.isObject())
        return MakeError(SchemaStatus::invalid_schema,
                         path,
                         std::string("expected boolean or object, got ") +
                           Json::TypeToString(json.getType()));

    if (const Json* ref = json.find("$ref")) {
        if (!ref->isString())
            return WrongType(path + "/$ref", "string", *ref);
        out = JsonSchema::reference(ref->getString());
        return error;
    }

    static const SchemaType kLists[] = {
        SchemaType::AnyOf,
        SchemaType::AllOf,
        SchemaType::OneOf,
    };
    for (size_t i = 0; i < ARRAYLEN(kLists); ++i) {
        const char* keyword = JsonSchema::TypeToString(kLists[i]);
        if (const Json* list = json.find(keyword)) {
            std::vector<JsonSchema> schemas;
            if (!(error = DecodeList(state, *list, path + "/" + keyword, schemas)).ok())
                return error;
            if (kLists[i] == SchemaType::AnyOf)
                out = JsonSchema::anyOf(std::move(schemas));
            else if (kLists[i] == SchemaType::AllOf)
                out = JsonSchema::allOf(std::move(schemas));
            else
                out = JsonSchema::oneOf(std::move(schemas));
            return error;
        }
    }

    if (const Json* operand = json.find("not")) {
        JsonSchema schema;
        if (!(error = DecodeSchema(state,
                                   *operand,
                                   path + "/not",
                                   MemberText(state, node, "not"),
                                   schema))
               .ok())
            return error;
        out = JsonSchema::negate(schema);
        return error;
    }

    const Json* type = json.find("type");
    if (!type) {
        // Keywords without a type aren't modeled; such schemas accept anything.
        out = json.size() ? JsonSchema::any() : JsonSchema::empty();
        return error;
    }
    if (!type->isString())
        return WrongType(path + "/type", "string", *type);
    SchemaType kind = SchemaType::Empty;
    for (size_t i = 0; i < ARRAYLEN(kPrimitiveTypes); ++i)
        if (type->getString() == JsonSchema::TypeToString(kPrimitiveTypes[i]))
            kind = kPrimitiveTypes[i];
    if (kind == SchemaType::Empty)
        return MakeError(SchemaStatus::unknown_type,
                         path + "/type",
                         "Unknown schema type: " + type->getString());

    switch (kind) {
        case SchemaType::Object: {
            ObjectSchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            if (!(error = DecodeObject(state, json, path, node, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::Array: {
            ArraySchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            if (!(error = DecodeArray(state, json, path, node, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::String: {
            StringSchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            if (!(error = DecodeStringSchema(json, path, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::Number: {
            NumberSchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            if (!(error = DecodeNumeric(json, path, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::Integer: {
            IntegerSchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            if (!(error = DecodeNumeric(json, path, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::Boolean: {
            BooleanSchema schema;
            if (!(error = DecodeAnnotations(json, path, schema)).ok())
                return error;
            out = JsonSchema(schema);
            break;
        }
        case SchemaType::Null: {
            // Annotations are checked but a null schema doesn't keep them.
            BooleanSchema scratch;
            if (!(error = DecodeAnnotations(json, path, scratch)).ok())
                return error;
            out = JsonSchema::null();
            break;
        }
        default:
            abort();
    }
    return error;
}

std::pair<SchemaError, JsonSchema>
JsonSchema::parse(const DecodeContext& ctx, const char* s, size_t len)
{
    std::pair<SchemaError, JsonSchema> res;
    size_t offset = 0;
    std::pair<JsonStatus, Json> json = Json::parse(s, len, &offset);
    if (json.first != JsonStatus::success) {
        res.first = MakeError(SchemaStatus::invalid_json,
                              "",
                              std::string(Json::StatusToString(json.first)) +
                                " at offset " + std::to_string(offset));
        return res;
    }
    DecodeState state = { ctx, s + len };
    res.first = DecodeSchema(
      state, json.second, "", ctx.preserve_source_order ? s : nullptr, res.second);
    if (!res.first.ok())
        res.second = JsonSchema();
    return res;
}

std::pair<SchemaError, JsonSchema>
JsonSchema::parse(const DecodeContext& ctx, const std::string& s)
{
    return parse(ctx, s.data(), s.size());
}

std::pair<SchemaError, JsonSchema>
JsonSchema::parse(const std::string& s)
{
    return parse(DecodeContext(), s.data(), s.size());
}

SchemaError
JsonSchema::decode(const DecodeContext& ctx, const Json& json, JsonSchema& schema)
{
    DecodeState state = { ctx, nullptr };
    JsonSchema result;
    SchemaError error = DecodeSchema(state, json, "", nullptr, result);
    if (error.ok())
        schema = std::move(result);
    return error;
}

const char*
JsonSchema::TypeToString(SchemaType type)
{
    switch (type) {
        case SchemaType::Object:
            return "object";
        case SchemaType::Array:
            return "array";
        case SchemaType::String:
            return "string";
        case SchemaType::Number:
            return "number";
        case SchemaType::Integer:
            return "integer";
        case SchemaType::Boolean:
            return "boolean";
        case SchemaType::Null:
            return "null";
        case SchemaType::Reference:
            return "reference";
        case SchemaType::AnyOf:
            return "anyOf";
        case SchemaType::AllOf:
            return "allOf";
        case SchemaType::OneOf:
            return "oneOf";
        case SchemaType::Not:
            return "not";
        case SchemaType::Empty:
            return "empty";
        case SchemaType::Any:
            return "any";
        default:
            abort();
    }
}

const char*
JsonSchema::StatusToString(SchemaStatus status)
{
    switch (status) {
        case SchemaStatus::success:
            return "success";
        case SchemaStatus::invalid_json:
            return "invalid_json";
        case SchemaStatus::invalid_schema:
            return "invalid_schema";
        case SchemaStatus::unknown_type:
            return "unknown_type";
        case SchemaStatus::wrong_keyword_type:
            return "wrong_keyword_type";
        case SchemaStatus::non_finite_number:
            return "non_finite_number";
        default:
            abort();
    }
}

} // namespace jschema
