// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// schema.cpp - Schema inference, validation and textual form

#include <tagwire/schema.h>
#include <tagwire/builders.h>
#include <tagwire/errors.h>
#include <tagwire/json.h>
#include <tagwire/type_tag.h>

namespace tagwire {

namespace {

const std::string object_name = "object";
const std::string array_name = "array";

const TypeDescriptor& catch_all() {
    static const TypeDescriptor instance;
    return instance;
}

// Nested descriptors use the tagged {"type": ...} form
Value descriptor_to_value(const TypeDescriptor& descriptor) {
    switch (descriptor.kind()) {
        case TypeDescriptor::Kind::Scalar:
            return Value{descriptor.type_name()};

        case TypeDescriptor::Kind::Array:
            return ObjectBuilder()
                .set("type", array_name)
                .set("elementType", descriptor_to_value(descriptor.element()))
                .finish();

        case TypeDescriptor::Kind::Object: {
            ObjectBuilder properties;
            for (const auto& property : descriptor.properties()) {
                properties.set(property.name, descriptor_to_value(property.type));
            }
            return ObjectBuilder()
                .set("type", object_name)
                .set("properties", properties.finish())
                .finish();
        }
    }
    return Value{object_name};
}

std::vector<SchemaProperty> properties_from_value(const ValueObject& fields);

// Anything that is neither a type name nor a well-formed container
// descriptor degrades to the catch-all
TypeDescriptor descriptor_from_value(const Value& value) {
    if (auto* name = value.get_if<std::string>()) {
        return TypeDescriptor::scalar(*name);
    }

    auto* fields = value.get_if<ValueObject>();
    if (!fields) return TypeDescriptor{};

    std::string type;
    if (auto* tag = fields->find("type")) type = (*tag)->as_string();
    if (type == array_name) {
        auto* element = fields->find("elementType");
        return TypeDescriptor::array(element ? descriptor_from_value(**element) : TypeDescriptor{});
    }
    if (type == object_name) {
        auto* properties = fields->find("properties");
        if (properties && (*properties)->is_object()) {
            return TypeDescriptor::object(properties_from_value((*properties)->as_object()));
        }
    }
    return TypeDescriptor{};
}

std::vector<SchemaProperty> properties_from_value(const ValueObject& fields) {
    std::vector<SchemaProperty> properties;
    properties.reserve(fields.size());
    for (const auto& entry : fields) {
        properties.push_back(SchemaProperty{entry.key, descriptor_from_value(*entry.value)});
    }
    return properties;
}

} // anonymous namespace

// ============================================================
// TypeDescriptor
// ============================================================

TypeDescriptor::TypeDescriptor() : kind_(Kind::Scalar), name_(object_name) {}

TypeDescriptor TypeDescriptor::scalar(std::string type_name) {
    TypeDescriptor d;
    d.name_ = std::move(type_name);
    return d;
}

TypeDescriptor TypeDescriptor::array(TypeDescriptor element) {
    TypeDescriptor d;
    d.kind_ = Kind::Array;
    d.name_ = array_name;
    d.element_ = std::make_shared<const TypeDescriptor>(std::move(element));
    return d;
}

TypeDescriptor TypeDescriptor::object(std::vector<SchemaProperty> properties) {
    TypeDescriptor d;
    d.kind_ = Kind::Object;
    d.name_ = object_name;
    d.properties_ = std::move(properties);
    return d;
}

const TypeDescriptor& TypeDescriptor::element() const {
    return element_ ? *element_ : catch_all();
}

const TypeDescriptor* TypeDescriptor::find(std::string_view name) const {
    for (const auto& property : properties_) {
        if (property.name == name) return &property.type;
    }
    return nullptr;
}

bool operator==(const TypeDescriptor& a, const TypeDescriptor& b) {
    if (a.kind_ != b.kind_ || a.name_ != b.name_) return false;
    if (a.kind_ == TypeDescriptor::Kind::Array) return a.element() == b.element();
    return a.properties_ == b.properties_;
}

// ============================================================
// Inference
// ============================================================

TypeDescriptor infer(const ValueObject& fields) {
    std::vector<SchemaProperty> properties;
    properties.reserve(fields.size());
    for (const auto& entry : fields) {
        properties.push_back(SchemaProperty{entry.key, infer(*entry.value)});
    }
    return TypeDescriptor::object(std::move(properties));
}

TypeDescriptor infer(const Value& value) {
    if (auto* items = value.get_if<ValueArray>()) {
        return TypeDescriptor::array(items->empty() ? TypeDescriptor{} : infer(*items->front()));
    }
    if (auto* fields = value.get_if<ValueObject>()) {
        return infer(*fields);
    }
    return TypeDescriptor::scalar(std::string{type_name_of(value)});
}

// ============================================================
// Validation
// ============================================================

bool matches(const Value& value, const TypeDescriptor& descriptor) noexcept {
    if (value.is_null()) {
        return descriptor.is_scalar() && descriptor.type_name() == "null";
    }
    if (!descriptor.is_scalar()) return true;

    auto expected = kind_from_name(descriptor.type_name());
    // "object" and unknown names accept any non-null value
    if (!expected) return true;
    return value.kind() == *expected;
}

void validate(const ValueObject& data, const TypeDescriptor& schema) {
    for (const auto& property : schema.properties()) {
        auto* actual = data.find(property.name);
        if (!actual) {
            throw SchemaValidationError(property.name,
                "Schema validation failed: missing required field '" + property.name + "'");
        }
        if (!matches(**actual, property.type)) {
            throw SchemaValidationError(property.name,
                "Schema validation failed: field '" + property.name + "' has invalid type");
        }
    }
}

// ============================================================
// Textual form
// ============================================================

std::string schema_to_json(const TypeDescriptor& schema) {
    ObjectBuilder root;
    for (const auto& property : schema.properties()) {
        root.set(property.name, descriptor_to_value(property.type));
    }
    return to_json(root.finish());
}

TypeDescriptor schema_from_json(std::string_view text) {
    std::string error;
    Value parsed = from_json(text, &error);
    if (!error.empty()) {
        throw FramingError("Invalid binary format: malformed schema block (" + error + ")");
    }
    auto* fields = parsed.get_if<ValueObject>();
    if (!fields) {
        throw FramingError("Invalid binary format: schema block is not a JSON object");
    }
    return TypeDescriptor::object(properties_from_value(*fields));
}

} // namespace tagwire
