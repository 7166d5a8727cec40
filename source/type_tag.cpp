// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// type_tag.cpp - Kind <-> tag byte <-> canonical name registry

#include <tagwire/type_tag.h>

namespace tagwire {

TypeTag tag_for(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null:      return TypeTag::Null;
        case ValueKind::String:    return TypeTag::String;
        case ValueKind::Int32:     return TypeTag::Int32;
        case ValueKind::Int64:     return TypeTag::Int64;
        case ValueKind::Double:    return TypeTag::Double;
        case ValueKind::Bool:      return TypeTag::Bool;
        case ValueKind::Timestamp: return TypeTag::Timestamp;
        case ValueKind::Guid:      return TypeTag::Guid;
        case ValueKind::Bytes:     return TypeTag::Bytes;
        case ValueKind::Array:     return TypeTag::Array;
        case ValueKind::Object:    return TypeTag::Object;
        case ValueKind::Opaque:    return TypeTag::Opaque;
    }
    return TypeTag::Opaque;
}

TypeTag tag_for(const Value& value) noexcept {
    return tag_for(value.kind());
}

std::optional<ValueKind> kind_for_tag(uint8_t tag) noexcept {
    switch (static_cast<TypeTag>(tag)) {
        case TypeTag::Null:      return ValueKind::Null;
        case TypeTag::String:    return ValueKind::String;
        case TypeTag::Int32:     return ValueKind::Int32;
        case TypeTag::Int64:     return ValueKind::Int64;
        case TypeTag::Double:    return ValueKind::Double;
        case TypeTag::Bool:      return ValueKind::Bool;
        case TypeTag::Timestamp: return ValueKind::Timestamp;
        case TypeTag::Guid:      return ValueKind::Guid;
        case TypeTag::Bytes:     return ValueKind::Bytes;
        case TypeTag::Array:     return ValueKind::Array;
        case TypeTag::Object:    return ValueKind::Object;
        case TypeTag::Opaque:    return ValueKind::Opaque;
    }
    return std::nullopt;
}

bool is_registered(uint8_t tag) noexcept {
    return kind_for_tag(tag).has_value();
}

std::string_view type_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null:      return "null";
        case ValueKind::String:    return "string";
        case ValueKind::Int32:     return "int";
        case ValueKind::Int64:     return "long";
        case ValueKind::Double:    return "double";
        case ValueKind::Bool:      return "bool";
        case ValueKind::Timestamp: return "datetime";
        case ValueKind::Guid:      return "guid";
        case ValueKind::Bytes:     return "bytes";
        case ValueKind::Array:
        case ValueKind::Object:
        case ValueKind::Opaque:    return "object";
    }
    return "object";
}

std::string_view type_name_of(const Value& value) noexcept {
    return type_name(value.kind());
}

std::optional<ValueKind> kind_from_name(std::string_view name) noexcept {
    if (name == "null")     return ValueKind::Null;
    if (name == "string")   return ValueKind::String;
    if (name == "int")      return ValueKind::Int32;
    if (name == "long")     return ValueKind::Int64;
    if (name == "double")   return ValueKind::Double;
    if (name == "bool")     return ValueKind::Bool;
    if (name == "datetime") return ValueKind::Timestamp;
    if (name == "guid")     return ValueKind::Guid;
    if (name == "bytes")    return ValueKind::Bytes;
    return std::nullopt;
}

} // namespace tagwire
