// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// serializer.cpp - envelope codec + transform pipeline

#include <tagwire/serializer.h>
#include <tagwire/buffer_pool.h>
#include <tagwire/compression.h>
#include <tagwire/encryption.h>
#include <tagwire/errors.h>
#include <tagwire/log.h>

#include <string>
#include <utility>

namespace tagwire {

namespace {

const std::string& require_key(const SerializationOptions& options, const char* stage) {
    if (!options.encryption_key) {
        throw TransformError(std::string(stage) + " failed: encryption is enabled but no encryption key was supplied");
    }
    return *options.encryption_key;
}

const ValueObject& require_object(const Value& fields) {
    const auto* obj = fields.get_if<ValueObject>();
    if (!obj) {
        throw FramingError("Invalid field map: top-level value must be an object");
    }
    return *obj;
}

std::string describe_flags(uint8_t flags) {
    std::string s;
    s += (flags & envelope_flags::compressed) ? "compressed" : "uncompressed";
    s += (flags & envelope_flags::encrypted) ? ", encrypted" : ", unencrypted";
    return s;
}

void check_transform_flags(const EnvelopeHeader& header, const SerializationOptions& options) {
    constexpr uint8_t transform_mask = envelope_flags::compressed | envelope_flags::encrypted;
    uint8_t written = header.flags & transform_mask;
    uint8_t requested = options.flags() & transform_mask;
    if (written != requested) {
        throw TransformError("Transform mismatch: envelope was written " + describe_flags(written) +
                             " but decode was requested " + describe_flags(requested));
    }
}

/// Undoes the transform stages selected by `options`. The result either
/// aliases `bytes` or points into `storage`.
std::span<const uint8_t> untransform(std::span<const uint8_t> bytes, const SerializationOptions& options,
                                     ByteBuffer& storage) {
    std::span<const uint8_t> current = bytes;

    if (options.encrypt) {
        storage = decrypt(current, require_key(options, "Decryption"));
        current = storage;
    }

    if (options.compressed()) {
        if (!has_gzip_signature(current)) {
            throw TransformError(options.encrypt
                                     ? "Decompression failed: decrypted data is not a gzip stream (wrong key?)"
                                     : "Decompression failed: input is not a gzip stream (was it compressed?)");
        }
        storage = decompress(current);
        current = storage;
    } else if (has_gzip_signature(current)) {
        throw TransformError("Transform mismatch: input is a gzip stream but decompression was not requested");
    }

    if (options.encrypt && !has_envelope_magic(current)) {
        throw TransformError("Decryption failed: decrypted data is not an envelope (wrong key?)");
    }

    // A damaged magic keeps its version byte; ciphertext almost never does
    if (!options.encrypt && !options.compressed() && !has_envelope_magic(current) &&
        current.size() > envelope_magic.size() && current[envelope_magic.size()] != envelope_version) {
        throw TransformError("Transform mismatch: input is not an envelope (was it encrypted?)");
    }
    return current;
}

} // anonymous namespace

Serializer::Serializer(SerializationOptions options)
    : options_(std::move(options)) {}

// ============================================================
// Encode
// ============================================================

ByteBuffer Serializer::encode(const ValueObject& fields) const {
    return encode(fields, options_);
}

ByteBuffer Serializer::encode(const ValueObject& fields, const SerializationOptions& options) const {
    try {
        if (options.encrypt) {
            require_key(options, "Encryption");
        }

        auto scratch = default_buffer_pool().acquire();
        encode_envelope_to(*scratch, fields, options);
        std::span<const uint8_t> raw(*scratch);

        ByteBuffer result;
        if (options.compressed()) {
            result = compress(raw, options.compression);
        }
        if (options.encrypt) {
            std::span<const uint8_t> plain = options.compressed() ? std::span<const uint8_t>(result) : raw;
            result = encrypt(plain, *options.encryption_key);
        }
        if (!options.compressed() && !options.encrypt) {
            result.assign(raw.begin(), raw.end());
        }

        detail::log_debug("Serializer::encode",
                          std::to_string(fields.size()) + " fields, envelope " + std::to_string(raw.size()) +
                          " bytes, output " + std::to_string(result.size()) + " bytes");
        return result;
    } catch (const SerializationError& e) {
        detail::log_error("Serializer::encode", e.what());
        throw;
    }
}

ByteBuffer Serializer::encode(const Value& fields) const {
    return encode(require_object(fields), options_);
}

ByteBuffer Serializer::encode(const Value& fields, const SerializationOptions& options) const {
    return encode(require_object(fields), options);
}

// ============================================================
// Decode
// ============================================================

ValueObject Serializer::decode(std::span<const uint8_t> bytes) const {
    return decode_envelope(bytes, options_).data;
}

ValueObject Serializer::decode(std::span<const uint8_t> bytes, const SerializationOptions& options) const {
    return decode_envelope(bytes, options).data;
}

Envelope Serializer::decode_envelope(std::span<const uint8_t> bytes) const {
    return decode_envelope(bytes, options_);
}

Envelope Serializer::decode_envelope(std::span<const uint8_t> bytes, const SerializationOptions& options) const {
    try {
        ByteBuffer storage;
        std::span<const uint8_t> raw = untransform(bytes, options, storage);

        Envelope envelope = tagwire::decode_envelope(raw, options);
        check_transform_flags(envelope.header, options);

        detail::log_debug("Serializer::decode",
                          std::to_string(bytes.size()) + " bytes in, envelope " + std::to_string(raw.size()) +
                          " bytes, " + std::to_string(envelope.data.size()) + " fields");
        return envelope;
    } catch (const SerializationError& e) {
        detail::log_error("Serializer::decode", e.what());
        throw;
    }
}

} // namespace tagwire
