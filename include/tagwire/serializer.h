// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serializer.h
/// @brief Envelope codec with the compression and encryption stages.
///
/// Encode: field map -> envelope -> compress? -> encrypt? -> bytes
/// Decode: bytes -> decrypt? -> decompress? -> envelope -> validate? -> field map
///
/// Usage:
/// @code
///   #include <tagwire/serializer.h>
///
///   SerializationOptions options;             // schema + gzip (Optimal)
///   options.encrypt = true;
///   options.encryption_key = "secret";
///
///   Serializer serializer(options);
///   ByteBuffer bytes = serializer.encode(Value::object({{"name", "Ann"}, {"age", 30}}));
///   ValueObject fields = serializer.decode(bytes);
/// @endcode
///
/// The decode pipeline is selected by the options, not by the header flags.
/// After parsing, the flags are compared with the options and any mismatch
/// is a TransformError, so a caller cannot silently read an envelope with the
/// wrong transform settings.

#pragma once

#include "api.h"
#include "envelope.h"
#include "options.h"
#include "value.h"

#include <cstdint>
#include <span>

namespace tagwire {

class TAGWIRE_API Serializer {
public:
    explicit Serializer(SerializationOptions options = {});

    [[nodiscard]] const SerializationOptions& options() const noexcept { return options_; }

    /// @throws TransformError when a transform stage fails or the key is missing
    [[nodiscard]] ByteBuffer encode(const ValueObject& fields) const;
    [[nodiscard]] ByteBuffer encode(const ValueObject& fields, const SerializationOptions& options) const;

    /// @throws FramingError when `fields` is not an Object value
    [[nodiscard]] ByteBuffer encode(const Value& fields) const;
    [[nodiscard]] ByteBuffer encode(const Value& fields, const SerializationOptions& options) const;

    /// @throws FramingError, TruncationError, SchemaValidationError, TransformError
    [[nodiscard]] ValueObject decode(std::span<const uint8_t> bytes) const;
    [[nodiscard]] ValueObject decode(std::span<const uint8_t> bytes, const SerializationOptions& options) const;

    /// Like decode(), also returning the header and the schema block
    [[nodiscard]] Envelope decode_envelope(std::span<const uint8_t> bytes) const;
    [[nodiscard]] Envelope decode_envelope(std::span<const uint8_t> bytes, const SerializationOptions& options) const;

private:
    SerializationOptions options_;
};

} // namespace tagwire
