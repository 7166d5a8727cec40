// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_tag.h
/// @brief One-byte tags and canonical type names of the Value kinds.
///
/// The registry is closed: every ValueKind has exactly one tag and one
/// canonical name. Opaque values use the reserved tag 0xFF.

#pragma once

#include "value.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace tagwire {

enum class TypeTag : uint8_t {
    Null      = 0x00,
    String    = 0x01,
    Int32     = 0x02,
    Int64     = 0x03,
    Double    = 0x04,
    Bool      = 0x05,
    Timestamp = 0x06,
    Guid      = 0x07,
    Bytes     = 0x08,
    Array     = 0x09,
    Object    = 0x0A,
    Opaque    = 0xFF,
};

/// Tag of the value's exact kind
[[nodiscard]] TAGWIRE_API TypeTag tag_for(const Value& value) noexcept;
[[nodiscard]] TAGWIRE_API TypeTag tag_for(ValueKind kind) noexcept;

/// Kind read back from a tag byte; std::nullopt for unknown bytes
[[nodiscard]] TAGWIRE_API std::optional<ValueKind> kind_for_tag(uint8_t tag) noexcept;

[[nodiscard]] TAGWIRE_API bool is_registered(uint8_t tag) noexcept;

/// Canonical type name ("string", "int", "long", ...); Opaque, Array and
/// Object kinds all report "object"
[[nodiscard]] TAGWIRE_API std::string_view type_name(ValueKind kind) noexcept;

/// Canonical type name of the value's kind
[[nodiscard]] TAGWIRE_API std::string_view type_name_of(const Value& value) noexcept;

/// Scalar kind named by a canonical type name. "object" has no single kind
/// and yields std::nullopt, as do unknown names.
[[nodiscard]] TAGWIRE_API std::optional<ValueKind> kind_from_name(std::string_view name) noexcept;

} // namespace tagwire
