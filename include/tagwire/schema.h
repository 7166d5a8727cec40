// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Type schema inferred from a field map and validated on decode.
///
/// A TypeDescriptor is either
///   - a scalar: one of the canonical type names ("string", "int", "long",
///     "double", "bool", "datetime", "guid", "bytes", "null") or the
///     catch-all "object",
///   - an array descriptor carrying the descriptor of its first element, or
///   - an object descriptor carrying an ordered list of named properties.
///
/// Validation is leaf-strict and container-permissive: only the top-level
/// properties are checked, scalar descriptors must match the value kind
/// exactly, and container descriptors accept any non-null value.
///
/// Textual form (envelope schema block):
/// @code
///   {"name":"string","age":"int",
///    "tags":{"type":"array","elementType":"string"},
///    "address":{"type":"object","properties":{"city":"string"}}}
/// @endcode

#pragma once

#include "api.h"
#include "value_fwd.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tagwire {

struct SchemaProperty;

class TAGWIRE_API TypeDescriptor {
public:
    enum class Kind : uint8_t { Scalar, Array, Object };

    /// Catch-all "object" scalar
    TypeDescriptor();

    [[nodiscard]] static TypeDescriptor scalar(std::string type_name);
    [[nodiscard]] static TypeDescriptor array(TypeDescriptor element);
    [[nodiscard]] static TypeDescriptor object(std::vector<SchemaProperty> properties);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_scalar() const noexcept { return kind_ == Kind::Scalar; }

    /// Scalar type name, or "array" / "object" for containers
    [[nodiscard]] const std::string& type_name() const noexcept { return name_; }

    /// Element descriptor of an array descriptor; "object" for anything else
    [[nodiscard]] const TypeDescriptor& element() const;

    /// Properties of an object descriptor; empty for anything else
    [[nodiscard]] const std::vector<SchemaProperty>& properties() const noexcept { return properties_; }

    /// Property descriptor by name, nullptr when absent
    [[nodiscard]] const TypeDescriptor* find(std::string_view name) const;

    friend TAGWIRE_API bool operator==(const TypeDescriptor& a, const TypeDescriptor& b);

private:
    Kind kind_ = Kind::Scalar;
    std::string name_;
    std::shared_ptr<const TypeDescriptor> element_;
    std::vector<SchemaProperty> properties_;
};

struct SchemaProperty {
    std::string name;
    TypeDescriptor type;

    bool operator==(const SchemaProperty&) const = default;
};

// ============================================================
// Inference
// ============================================================

/// Descriptor of a single value. Opaque values infer as "object"; an empty
/// array infers element "object".
[[nodiscard]] TAGWIRE_API TypeDescriptor infer(const Value& value);

/// Object descriptor of a field map
[[nodiscard]] TAGWIRE_API TypeDescriptor infer(const ValueObject& fields);

// ============================================================
// Validation
// ============================================================

/// Whether `value` satisfies `descriptor` at the leaf level
[[nodiscard]] TAGWIRE_API bool matches(const Value& value, const TypeDescriptor& descriptor) noexcept;

/// Checks every top-level property of `schema` against `data`
/// @throws SchemaValidationError naming the first missing or mismatched field
TAGWIRE_API void validate(const ValueObject& data, const TypeDescriptor& schema);

// ============================================================
// Textual form
// ============================================================

/// JSON text of a root object descriptor (flat property map)
[[nodiscard]] TAGWIRE_API std::string schema_to_json(const TypeDescriptor& schema);

/// Parses the schema block text
/// @throws FramingError when the text is not a JSON object
[[nodiscard]] TAGWIRE_API TypeDescriptor schema_from_json(std::string_view text);

} // namespace tagwire
