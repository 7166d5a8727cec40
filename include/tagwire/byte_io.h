// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file byte_io.h
/// @brief Little-endian primitive writer/reader used by the envelope codec.
///
/// All multi-byte integers and doubles are stored little-endian regardless of
/// the host byte order. Lengths are signed 32-bit integers; the reader rejects
/// negative lengths with a FramingError and any read past the end of the
/// buffer with a TruncationError.

#pragma once

#include "api.h"
#include "value_fwd.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace tagwire {

class TAGWIRE_API ByteWriter {
public:
    ByteWriter() = default;
    /// Appends to an existing buffer (e.g. a pooled scratch buffer)
    explicit ByteWriter(ByteBuffer& target) : out_(&target) {}

    ByteWriter(const ByteWriter&) = delete;
    ByteWriter& operator=(const ByteWriter&) = delete;

    void write_u8(uint8_t v);
    void write_i32(int32_t v);
    void write_i64(int64_t v);
    void write_f64(double v);
    void write_raw(const uint8_t* data, std::size_t size);

    /// int32 length prefix followed by the UTF-8 bytes
    void write_string(std::string_view s);
    /// int32 length prefix followed by the raw bytes
    void write_blob(std::span<const uint8_t> bytes);

    [[nodiscard]] std::size_t size() const noexcept { return out_->size(); }
    [[nodiscard]] ByteBuffer& buffer() noexcept { return *out_; }

    /// Moves the owned buffer out; only meaningful for the default constructor
    [[nodiscard]] ByteBuffer release() { return std::move(owned_); }

private:
    ByteBuffer owned_;
    ByteBuffer* out_ = &owned_;

    void write_length(std::size_t len);
};

class TAGWIRE_API ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t size) noexcept : data_(data), size_(size) {}
    explicit ByteReader(std::span<const uint8_t> bytes) noexcept
        : data_(bytes.data()), size_(bytes.size()) {}

    [[nodiscard]] bool has_bytes(std::size_t n) const noexcept { return n <= size_ - pos_; }
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return size_ - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ == size_; }

    uint8_t read_u8();
    int32_t read_i32();
    int64_t read_i64();
    double read_f64();

    /// Reads an int32 length; negative values are a FramingError
    std::size_t read_length();
    std::string read_string();
    ByteBuffer read_blob();
    /// Borrows the next n bytes without copying
    std::span<const uint8_t> read_span(std::size_t n);

private:
    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;

    void require(std::size_t n) const;
};

} // namespace tagwire
