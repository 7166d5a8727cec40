// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// envelope.cpp - Envelope header, schema block and tagged value tree

#include <tagwire/envelope.h>
#include <tagwire/builders.h>
#include <tagwire/byte_io.h>
#include <tagwire/errors.h>
#include <tagwire/json.h>
#include <tagwire/type_tag.h>

#include <algorithm>

namespace tagwire {

namespace {

void write_tag(ByteWriter& w, TypeTag tag) {
    w.write_u8(static_cast<uint8_t>(tag));
}

void write_fields(ByteWriter& w, const ValueObject& fields);

void write_value(ByteWriter& w, const Value& val) {
    write_tag(w, tag_for(val));

    std::visit([&w](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // tag only
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_string(arg);
        } else if constexpr (std::is_same_v<T, int32_t>) {
            w.write_i32(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            w.write_i64(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_f64(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            w.write_u8(arg ? 0x01 : 0x00);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            w.write_i64(arg.ticks);
        } else if constexpr (std::is_same_v<T, Guid>) {
            w.write_raw(arg.bytes.data(), arg.bytes.size());
        } else if constexpr (std::is_same_v<T, ValueBytes>) {
            w.write_blob(arg.get());
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            w.write_length(arg.size());
            for (const auto& v : arg) {
                write_value(w, *v);
            }
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            write_fields(w, arg);
        } else if constexpr (std::is_same_v<T, Opaque>) {
            w.write_string(arg.type_name);
            w.write_string(arg.text);
        }
    }, val.data);
}

void write_fields(ByteWriter& w, const ValueObject& fields) {
    w.write_length(fields.size());
    for (const auto& entry : fields) {
        w.write_string(entry.key);
        write_value(w, *entry.value);
    }
}

class EnvelopeReader {
public:
    EnvelopeReader(ByteReader& r, OpaqueMode mode) : r_(r), mode_(mode) {}

    ValueObject read_fields() {
        std::size_t count = r_.read_length();
        enter();
        ObjectBuilder builder;
        for (std::size_t i = 0; i < count; ++i) {
            std::string key = r_.read_string();
            builder.set(key, read_value());
        }
        leave();
        return builder.finish_object();
    }

    Value read_value() {
        std::size_t at = r_.position();
        uint8_t tag = r_.read_u8();
        auto kind = kind_for_tag(tag);
        if (!kind) {
            throw FramingError("Invalid binary format: unknown type tag 0x" + hex(tag) +
                               " at offset " + std::to_string(at));
        }

        switch (*kind) {
            case ValueKind::Null:
                return Value{};

            case ValueKind::String:
                return Value{r_.read_string()};

            case ValueKind::Int32:
                return Value{r_.read_i32()};

            case ValueKind::Int64:
                return Value{r_.read_i64()};

            case ValueKind::Double:
                return Value{r_.read_f64()};

            case ValueKind::Bool:
                return Value{r_.read_u8() != 0};

            case ValueKind::Timestamp:
                return Value{Timestamp{r_.read_i64()}};

            case ValueKind::Guid: {
                auto raw = r_.read_span(16);
                Guid guid;
                std::copy(raw.begin(), raw.end(), guid.bytes.begin());
                return Value{guid};
            }

            case ValueKind::Bytes:
                return Value{r_.read_blob()};

            case ValueKind::Array: {
                std::size_t count = r_.read_length();
                enter();
                ArrayBuilder builder;
                for (std::size_t i = 0; i < count; ++i) {
                    builder.push_back(read_value());
                }
                leave();
                return builder.finish();
            }

            case ValueKind::Object:
                return Value{read_fields()};

            case ValueKind::Opaque:
                return read_opaque();
        }
        throw FramingError("Invalid binary format: unknown type tag 0x" + hex(tag));
    }

private:
    ByteReader& r_;
    OpaqueMode mode_;
    std::size_t depth_ = 0;

    static std::string hex(uint8_t v) {
        static constexpr char digits[] = "0123456789ABCDEF";
        return {digits[v >> 4], digits[v & 0x0F]};
    }

    void enter() {
        if (++depth_ > TAGWIRE_MAX_NESTING_DEPTH) {
            throw FramingError("Invalid binary format: nesting deeper than " +
                               std::to_string(TAGWIRE_MAX_NESTING_DEPTH) + " levels");
        }
    }

    void leave() noexcept { --depth_; }

    Value read_opaque() {
        std::string type_name = r_.read_string();
        std::string text = r_.read_string();
        if (mode_ == OpaqueMode::Parse) {
            if (auto parsed = try_parse_json(text)) return std::move(*parsed);
        }
        return Value::opaque(std::move(type_name), std::move(text));
    }
};

EnvelopeHeader read_header(ByteReader& r) {
    auto magic = r.read_span(envelope_magic.size());
    if (!std::equal(magic.begin(), magic.end(), envelope_magic.begin())) {
        throw FramingError("Invalid binary format: magic number mismatch");
    }

    EnvelopeHeader header;
    header.version = r.read_u8();
    if (header.version != envelope_version) {
        throw FramingError("Unsupported version: " + std::to_string(header.version));
    }
    header.flags = r.read_u8();
    header.timestamp = Timestamp{r.read_i64()};
    return header;
}

} // anonymous namespace

// ============================================================
// Encode
// ============================================================

void encode_envelope_to(ByteBuffer& out, const ValueObject& fields, const SerializationOptions& options) {
    ByteWriter w(out);

    w.write_raw(envelope_magic.data(), envelope_magic.size());
    w.write_u8(envelope_version);
    w.write_u8(options.flags());
    w.write_i64(Timestamp::now().ticks);

    if (options.include_schema) {
        w.write_string(schema_to_json(infer(fields)));
    }

    write_fields(w, fields);
}

ByteBuffer encode_envelope(const ValueObject& fields, const SerializationOptions& options) {
    ByteBuffer out;
    encode_envelope_to(out, fields, options);
    return out;
}

// ============================================================
// Decode
// ============================================================

Envelope decode_envelope(std::span<const uint8_t> bytes, const SerializationOptions& options) {
    ByteReader r(bytes);

    Envelope envelope;
    envelope.header = read_header(r);

    if (envelope.header.has_schema()) {
        envelope.schema = schema_from_json(r.read_string());
    }

    EnvelopeReader reader(r, options.opaque_mode);
    envelope.data = reader.read_fields();

    if (envelope.schema && options.validate_schema) {
        validate(envelope.data, *envelope.schema);
    }
    return envelope;
}

EnvelopeHeader read_header(std::span<const uint8_t> bytes) {
    ByteReader r(bytes);
    return read_header(r);
}

bool has_envelope_magic(std::span<const uint8_t> bytes) noexcept {
    return bytes.size() >= envelope_magic.size() &&
           std::equal(envelope_magic.begin(), envelope_magic.end(), bytes.begin());
}

} // namespace tagwire
