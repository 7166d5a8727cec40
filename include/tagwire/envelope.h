// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file envelope.h
/// @brief Self-describing binary envelope around a field map.
///
/// Layout (multi-byte integers little-endian):
/// @code
///   +----------------------------------------------------------+
///   | magic      4 bytes   'T' 'U' 'S' 'K'                     |
///   | version    1 byte    1                                   |
///   | flags      1 byte    bit0 schema, bit1 compressed,       |
///   |                      bit2 encrypted                      |
///   | timestamp  8 bytes   int64 ticks (100 ns since 0001-01-01)|
///   | schema     4 + N     int32 length + UTF-8 JSON (optional)|
///   | data       4 + ...   int32 count, (key, tagged value)*   |
///   +----------------------------------------------------------+
/// @endcode
///
/// Keys are written as int32 length + UTF-8 bytes. Tagged values start with
/// their TypeTag byte:
///   0x00 null, 0x01 string, 0x02 int32, 0x03 int64, 0x04 double,
///   0x05 bool (1 byte), 0x06 timestamp (int64), 0x07 guid (16 bytes),
///   0x08 bytes (int32 length + bytes), 0x09 array (int32 count + values),
///   0x0A object (int32 count + entries),
///   0xFF opaque (type name + fallback text, both length-prefixed)
///
/// The envelope codec works on untransformed bytes; compression and
/// encryption are applied around it by the Serializer.

#pragma once

#include "api.h"
#include "options.h"
#include "schema.h"
#include "value.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace tagwire {

inline constexpr std::array<uint8_t, 4> envelope_magic{0x54, 0x55, 0x53, 0x4B};
inline constexpr uint8_t envelope_version = 1;
/// magic + version + flags + timestamp
inline constexpr std::size_t envelope_header_size = 14;

struct EnvelopeHeader {
    uint8_t version = envelope_version;
    uint8_t flags = 0;
    Timestamp timestamp;

    [[nodiscard]] bool has_schema() const noexcept { return (flags & envelope_flags::has_schema) != 0; }
    [[nodiscard]] bool was_compressed() const noexcept { return (flags & envelope_flags::compressed) != 0; }
    [[nodiscard]] bool was_encrypted() const noexcept { return (flags & envelope_flags::encrypted) != 0; }
};

struct Envelope {
    EnvelopeHeader header;
    std::optional<TypeDescriptor> schema;
    ValueObject data;
};

/// Appends the envelope of `fields` to `out`
TAGWIRE_API void encode_envelope_to(ByteBuffer& out, const ValueObject& fields,
                                    const SerializationOptions& options);

[[nodiscard]] TAGWIRE_API ByteBuffer encode_envelope(const ValueObject& fields,
                                                     const SerializationOptions& options);

/// Parses an untransformed envelope. Validates the data against the schema
/// block when `options.validate_schema` is set and a schema is present.
/// @throws FramingError, TruncationError, SchemaValidationError
[[nodiscard]] TAGWIRE_API Envelope decode_envelope(std::span<const uint8_t> bytes,
                                                   const SerializationOptions& options);

/// Reads only the fixed-size header of an untransformed envelope
/// @throws FramingError, TruncationError
[[nodiscard]] TAGWIRE_API EnvelopeHeader read_header(std::span<const uint8_t> bytes);

/// True when `bytes` begins with the envelope magic
[[nodiscard]] TAGWIRE_API bool has_envelope_magic(std::span<const uint8_t> bytes) noexcept;

} // namespace tagwire
