// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Per-call options of the serializer.
///
/// Options are not persisted in the envelope beyond the header flags. The
/// same option values used to encode must be supplied to decode; a mismatch
/// between the flags and the options is reported as a TransformError.

#pragma once

#include "api.h"

#include <cstdint>
#include <optional>
#include <string>

namespace tagwire {

/// gzip compression levels (zlib levels 1, 6 and 9)
enum class CompressionLevel : uint8_t {
    None,
    Fastest,
    Optimal,
    SmallestSize,
};

/// How decode treats the fallback text of an Opaque value
enum class OpaqueMode : uint8_t {
    Parse,     ///< parse the text as JSON into a generic Value; keep Opaque if it is not JSON
    Preserve,  ///< always keep the Opaque value
};

/// Header flag bits
namespace envelope_flags {
inline constexpr uint8_t has_schema = 0x01;
inline constexpr uint8_t compressed = 0x02;
inline constexpr uint8_t encrypted  = 0x04;
} // namespace envelope_flags

struct SerializationOptions {
    bool include_schema = true;
    bool validate_schema = true;
    CompressionLevel compression = CompressionLevel::Optimal;
    bool encrypt = false;
    /// Password for the encryption stage; required when `encrypt` is set
    std::optional<std::string> encryption_key;
    OpaqueMode opaque_mode = OpaqueMode::Parse;

    [[nodiscard]] static SerializationOptions defaults() { return {}; }

    /// No schema block, no compression, no encryption
    [[nodiscard]] static SerializationOptions plain() {
        SerializationOptions options;
        options.include_schema = false;
        options.compression = CompressionLevel::None;
        return options;
    }

    [[nodiscard]] bool compressed() const noexcept { return compression != CompressionLevel::None; }

    /// Header flags written for these options
    [[nodiscard]] uint8_t flags() const noexcept {
        uint8_t f = 0;
        if (include_schema) f |= envelope_flags::has_schema;
        if (compressed()) f |= envelope_flags::compressed;
        if (encrypt) f |= envelope_flags::encrypted;
        return f;
    }
};

} // namespace tagwire
