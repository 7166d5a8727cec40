// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json.h
/// @brief JSON text encoding of Value.
///
/// Used for the envelope schema block, the Opaque fallback text and for
/// debugging output.
///
/// Usage:
/// @code
///   #include <tagwire/json.h>
///
///   Value data = Value::object({{"name", "Ann"}, {"age", 30}});
///   std::string text = to_json(data);          // {"name":"Ann","age":30}
///   Value parsed = from_json(text);
/// @endcode
///
/// Kind mapping:
///   - Int32/Int64/Double: JSON numbers. Doubles always carry a '.' or an
///     exponent so that they read back as Double; integers read back as Int32
///     when they fit, else Int64.
///   - Timestamp: ISO-8601 string; Guid: canonical string; Bytes: base64 string
///   - Opaque: its fallback text verbatim when that text is valid JSON
///   - Object: field order is preserved in both directions

#pragma once

#include "api.h"
#include "value.h"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace tagwire {

/// Convert Value to JSON text
/// @param compact If false, pretty-print with two-space indentation
[[nodiscard]] TAGWIRE_API std::string to_json(const Value& val, bool compact = true);

/// Parse JSON text to Value
/// @param error_out If provided, receives the error message on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] TAGWIRE_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

/// Parse JSON text; std::nullopt when the text is not a single JSON value
[[nodiscard]] TAGWIRE_API std::optional<Value> try_parse_json(std::string_view json_str);

/// Prints the compact JSON form (used by test frameworks for diagnostics)
TAGWIRE_API std::ostream& operator<<(std::ostream& os, const Value& val);

/// Pull-style JSON reader over an in-memory text.
///
/// Reads one value at a time so that callers can walk a large top-level
/// array element by element. Every syntax error throws JsonError.
class TAGWIRE_API JsonReader {
public:
    explicit JsonReader(std::string_view text) noexcept : text_(text) {}

    /// Parses the next complete value
    [[nodiscard]] Value parse_value();

    /// Skips whitespace, then consumes `c` if it is the next character
    bool consume_if(char c) noexcept;
    /// Skips whitespace, then requires `c`
    void expect(char c);

    /// True once only whitespace remains
    [[nodiscard]] bool at_end() noexcept;
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    [[nodiscard]] char peek() const noexcept;
    char consume() noexcept;
    void skip_whitespace() noexcept;
    [[noreturn]] void fail(const std::string& message) const;

    Value parse_object();
    Value parse_array();
    Value parse_number();
    Value parse_literal();
    std::string parse_string_raw();
    void append_escape(std::string& out);
    unsigned parse_hex4();
};

} // namespace tagwire
