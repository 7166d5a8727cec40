// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// byte_io.cpp - Little-endian primitive writer/reader

#include <tagwire/byte_io.h>
#include <tagwire/errors.h>

#include <boost/endian/conversion.hpp>

#include <bit>
#include <cstring>
#include <limits>

namespace tagwire {

namespace {

template <typename T>
void append_le(ByteBuffer& out, T v) {
    boost::endian::native_to_little_inplace(v);
    std::size_t old_size = out.size();
    out.resize(old_size + sizeof(v));
    std::memcpy(out.data() + old_size, &v, sizeof(v));
}

template <typename T>
T load_le(const uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(v));
    boost::endian::little_to_native_inplace(v);
    return v;
}

} // anonymous namespace

// ============================================================
// ByteWriter
// ============================================================

void ByteWriter::write_u8(uint8_t v) {
    out_->push_back(v);
}

void ByteWriter::write_i32(int32_t v) {
    append_le(*out_, v);
}

void ByteWriter::write_i64(int64_t v) {
    append_le(*out_, v);
}

void ByteWriter::write_f64(double v) {
    append_le(*out_, std::bit_cast<uint64_t>(v));
}

void ByteWriter::write_raw(const uint8_t* data, std::size_t size) {
    if (size == 0) return;
    std::size_t old_size = out_->size();
    out_->resize(old_size + size);
    std::memcpy(out_->data() + old_size, data, size);
}

void ByteWriter::write_length(std::size_t len) {
    if (len > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw FramingError("Invalid binary format: length " + std::to_string(len) +
                           " exceeds the int32 range");
    }
    write_i32(static_cast<int32_t>(len));
}

void ByteWriter::write_string(std::string_view s) {
    write_length(s.size());
    write_raw(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void ByteWriter::write_blob(std::span<const uint8_t> bytes) {
    write_length(bytes.size());
    write_raw(bytes.data(), bytes.size());
}

// ============================================================
// ByteReader
// ============================================================

void ByteReader::require(std::size_t n) const {
    if (!has_bytes(n)) throw TruncationError(n, pos_, size_);
}

uint8_t ByteReader::read_u8() {
    require(1);
    return data_[pos_++];
}

int32_t ByteReader::read_i32() {
    require(sizeof(int32_t));
    auto v = load_le<int32_t>(data_ + pos_);
    pos_ += sizeof(v);
    return v;
}

int64_t ByteReader::read_i64() {
    require(sizeof(int64_t));
    auto v = load_le<int64_t>(data_ + pos_);
    pos_ += sizeof(v);
    return v;
}

double ByteReader::read_f64() {
    require(sizeof(uint64_t));
    auto bits = load_le<uint64_t>(data_ + pos_);
    pos_ += sizeof(bits);
    return std::bit_cast<double>(bits);
}

std::size_t ByteReader::read_length() {
    std::size_t at = pos_;
    int32_t len = read_i32();
    if (len < 0) {
        throw FramingError("Invalid binary format: negative length " + std::to_string(len) +
                           " at offset " + std::to_string(at));
    }
    return static_cast<std::size_t>(len);
}

std::span<const uint8_t> ByteReader::read_span(std::size_t n) {
    require(n);
    std::span<const uint8_t> out{data_ + pos_, n};
    pos_ += n;
    return out;
}

std::string ByteReader::read_string() {
    auto bytes = read_span(read_length());
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

ByteBuffer ByteReader::read_blob() {
    auto bytes = read_span(read_length());
    return ByteBuffer(bytes.begin(), bytes.end());
}

} // namespace tagwire
