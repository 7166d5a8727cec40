// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// errors.cpp - Codec exception types

#include <tagwire/errors.h>

namespace tagwire {

std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Framing:          return "framing";
        case ErrorKind::Truncation:       return "truncation";
        case ErrorKind::SchemaValidation: return "schema validation";
        case ErrorKind::Transform:        return "transform";
        case ErrorKind::Json:             return "json";
    }
    return "unknown";
}

TruncationError::TruncationError(std::size_t needed, std::size_t offset, std::size_t size)
    : SerializationError(ErrorKind::Truncation,
                         "Invalid binary format: unexpected end of buffer (needed " +
                             std::to_string(needed) + " bytes at offset " + std::to_string(offset) +
                             ", buffer size " + std::to_string(size) + ")"),
      offset_(offset) {}

} // namespace tagwire
