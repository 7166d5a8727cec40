// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json.cpp - JSON text encoding of Value

#include <tagwire/json.h>
#include <tagwire/builders.h>
#include <tagwire/errors.h>

#include <charconv>
#include <cstdio>
#include <limits>
#include <ostream>
#include <sstream>

namespace tagwire {

namespace {

// ============================================================
// Writer
// ============================================================

std::string json_escape_string(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

std::string base64_encode(const ByteBuffer& bytes) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (uint32_t{bytes[i]} << 16) | (uint32_t{bytes[i + 1]} << 8) | bytes[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }
    if (i < bytes.size()) {
        uint32_t n = uint32_t{bytes[i]} << 16;
        bool two = i + 1 < bytes.size();
        if (two) n |= uint32_t{bytes[i + 1]} << 8;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += two ? alphabet[(n >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << detail::format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            oss << "\"" << arg.to_iso8601() << "\"";
        } else if constexpr (std::is_same_v<T, Guid>) {
            oss << "\"" << arg.to_string() << "\"";
        } else if constexpr (std::is_same_v<T, ValueBytes>) {
            oss << "\"" << base64_encode(arg.get()) << "\"";
        } else if constexpr (std::is_same_v<T, Opaque>) {
            if (try_parse_json(arg.text)) {
                oss << arg.text;
            } else {
                oss << "\"" << json_escape_string(arg.text) << "\"";
            }
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            if (arg.empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& entry : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(entry.key) << "\":" << space_after_colon;
                    to_json_impl(*entry.value, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        }
    }, val.data);
}

void append_utf8(std::string& out, unsigned codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool is_json_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

// ============================================================
// JsonReader
// ============================================================

char JsonReader::peek() const noexcept {
    return pos_ < text_.size() ? text_[pos_] : '\0';
}

char JsonReader::consume() noexcept {
    return pos_ < text_.size() ? text_[pos_++] : '\0';
}

void JsonReader::skip_whitespace() noexcept {
    while (pos_ < text_.size() && is_json_space(text_[pos_])) {
        ++pos_;
    }
}

void JsonReader::fail(const std::string& message) const {
    throw JsonError("Invalid JSON: " + message + " at position " + std::to_string(pos_));
}

bool JsonReader::consume_if(char c) noexcept {
    skip_whitespace();
    if (peek() == c && pos_ < text_.size()) {
        ++pos_;
        return true;
    }
    return false;
}

void JsonReader::expect(char c) {
    skip_whitespace();
    if (pos_ >= text_.size() || consume() != c) {
        fail(std::string("expected '") + c + "'");
    }
}

bool JsonReader::at_end() noexcept {
    skip_whitespace();
    return pos_ >= text_.size();
}

Value JsonReader::parse_value() {
    skip_whitespace();
    if (pos_ >= text_.size()) fail("unexpected end of input");

    char c = peek();
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return Value{parse_string_raw()};
    if (c == 't' || c == 'f' || c == 'n') return parse_literal();
    if (c == '-' || is_digit(c)) return parse_number();

    fail("unexpected character '" + std::string(1, c) + "'");
}

Value JsonReader::parse_object() {
    if (++depth_ > TAGWIRE_MAX_NESTING_DEPTH) fail("nesting too deep");
    expect('{');

    ObjectBuilder builder;
    if (!consume_if('}')) {
        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            builder.set(key, parse_value());

            if (consume_if('}')) break;
            expect(',');
        }
    }

    --depth_;
    return builder.finish();
}

Value JsonReader::parse_array() {
    if (++depth_ > TAGWIRE_MAX_NESTING_DEPTH) fail("nesting too deep");
    expect('[');

    ArrayBuilder builder;
    if (!consume_if(']')) {
        while (true) {
            builder.push_back(parse_value());

            if (consume_if(']')) break;
            expect(',');
        }
    }

    --depth_;
    return builder.finish();
}

unsigned JsonReader::parse_hex4() {
    if (pos_ + 4 > text_.size()) fail("invalid unicode escape");
    unsigned value = 0;
    const char* first = text_.data() + pos_;
    auto [end, ec] = std::from_chars(first, first + 4, value, 16);
    if (ec != std::errc{} || end != first + 4) fail("invalid unicode escape");
    pos_ += 4;
    return value;
}

void JsonReader::append_escape(std::string& out) {
    if (pos_ >= text_.size()) fail("unexpected end of string escape");

    char escaped = consume();
    switch (escaped) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
            unsigned codepoint = parse_hex4();
            // Surrogate pair
            if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                text_.substr(pos_, 2) == "\\u") {
                pos_ += 2;
                unsigned low = parse_hex4();
                if (low < 0xDC00 || low > 0xDFFF) fail("invalid surrogate pair");
                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(out, codepoint);
            break;
        }
        default:
            fail("invalid escape sequence \\" + std::string(1, escaped));
    }
}

std::string JsonReader::parse_string_raw() {
    expect('"');
    std::string result;

    while (pos_ < text_.size()) {
        char c = consume();
        if (c == '"') {
            return result;
        }
        if (c == '\\') {
            append_escape(result);
        } else {
            result += c;
        }
    }

    fail("unterminated string");
}

Value JsonReader::parse_number() {
    std::size_t start = pos_;
    bool is_integer = true;

    if (peek() == '-') consume();
    if (!is_digit(peek())) fail("invalid number");
    while (is_digit(peek())) consume();

    if (peek() == '.') {
        is_integer = false;
        consume();
        if (!is_digit(peek())) fail("invalid number");
        while (is_digit(peek())) consume();
    }
    if (peek() == 'e' || peek() == 'E') {
        is_integer = false;
        consume();
        if (peek() == '+' || peek() == '-') consume();
        if (!is_digit(peek())) fail("invalid number");
        while (is_digit(peek())) consume();
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;

    if (is_integer) {
        int64_t v = 0;
        auto [end, ec] = std::from_chars(first, last, v);
        if (ec == std::errc{} && end == last) {
            if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
                return Value{static_cast<int32_t>(v)};
            }
            return Value{v};
        }
        // Out of int64 range: fall through to double
    }

    double d = 0.0;
    auto [end, ec] = std::from_chars(first, last, d);
    if (ec != std::errc{} || end != last) {
        if (ec != std::errc::result_out_of_range) fail("invalid number");
    }
    return Value{d};
}

Value JsonReader::parse_literal() {
    if (text_.substr(pos_, 4) == "true") {
        pos_ += 4;
        return Value{true};
    }
    if (text_.substr(pos_, 5) == "false") {
        pos_ += 5;
        return Value{false};
    }
    if (text_.substr(pos_, 4) == "null") {
        pos_ += 4;
        return Value{};
    }
    fail("expected 'true', 'false' or 'null'");
}

// ============================================================
// Free functions
// ============================================================

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out) {
    try {
        JsonReader reader(json_str);
        if (reader.at_end()) {
            if (error_out) *error_out = "Empty JSON input";
            return Value{};
        }
        Value result = reader.parse_value();
        if (!reader.at_end()) {
            if (error_out) *error_out = "Trailing characters after JSON value at position " +
                                        std::to_string(reader.position());
            return Value{};
        }
        return result;
    } catch (const JsonError& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

std::optional<Value> try_parse_json(std::string_view json_str) {
    std::string error;
    Value result = from_json(json_str, &error);
    if (!error.empty()) return std::nullopt;
    return result;
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    return os << to_json(val);
}

} // namespace tagwire
