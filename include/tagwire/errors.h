// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by the envelope codec and the transform stages.
///
/// Every failure is fatal for the call that raised it: nothing is retried
/// internally and decode never returns a partially decoded value.
///
/// | Exception              | Raised for                                        |
/// |------------------------|---------------------------------------------------|
/// | FramingError           | bad magic/version, unknown tag, negative length,  |
/// |                        | nesting deeper than TAGWIRE_MAX_NESTING_DEPTH      |
/// | TruncationError        | buffer ends in the middle of a structure          |
/// | SchemaValidationError  | missing required field or leaf type mismatch      |
/// | TransformError         | compression/encryption failure or options that do |
/// |                        | not match the transforms applied at encode time   |
/// | JsonError              | malformed JSON handed to the streaming parser     |

#pragma once

#include "api.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tagwire {

enum class ErrorKind : std::uint8_t {
    Framing,
    Truncation,
    SchemaValidation,
    Transform,
    Json,
};

[[nodiscard]] TAGWIRE_API std::string_view error_kind_name(ErrorKind kind) noexcept;

/// Base class of all codec errors
class TAGWIRE_API SerializationError : public std::runtime_error {
public:
    SerializationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class TAGWIRE_API FramingError : public SerializationError {
public:
    explicit FramingError(const std::string& message)
        : SerializationError(ErrorKind::Framing, message) {}
};

class TAGWIRE_API TruncationError : public SerializationError {
public:
    /// @param needed Bytes the reader tried to consume
    /// @param offset Position of the read within the buffer
    /// @param size   Total buffer size
    TruncationError(std::size_t needed, std::size_t offset, std::size_t size);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class TAGWIRE_API SchemaValidationError : public SerializationError {
public:
    SchemaValidationError(std::string field, const std::string& message)
        : SerializationError(ErrorKind::SchemaValidation, message), field_(std::move(field)) {}

    /// Name of the offending field
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class TAGWIRE_API TransformError : public SerializationError {
public:
    explicit TransformError(const std::string& message)
        : SerializationError(ErrorKind::Transform, message) {}
};

class TAGWIRE_API JsonError : public SerializationError {
public:
    explicit JsonError(const std::string& message)
        : SerializationError(ErrorKind::Json, message) {}
};

} // namespace tagwire
