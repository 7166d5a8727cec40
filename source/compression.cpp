// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// compression.cpp - gzip stage (zlib)

#include <tagwire/compression.h>
#include <tagwire/buffer_pool.h>
#include <tagwire/errors.h>
#include <tagwire/log.h>

#include <zlib.h>

#include <limits>
#include <string>

namespace tagwire {

namespace {

// windowBits 15 + 16 selects the gzip wrapper
constexpr int gzip_window_bits = 15 + 16;
constexpr int default_mem_level = 8;

std::string zlib_message(const z_stream& zs, int rc) {
    return zs.msg ? std::string(zs.msg) : "zlib error " + std::to_string(rc);
}

class DeflateStream {
public:
    explicit DeflateStream(int level) {
        int rc = deflateInit2(&zs_, level, Z_DEFLATED, gzip_window_bits, default_mem_level, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw TransformError("Compression failed: " + zlib_message(zs_, rc));
        }
    }

    ~DeflateStream() { deflateEnd(&zs_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    void run(std::span<const uint8_t> input, ByteBuffer& chunk, ByteBuffer& out) {
        zs_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
        zs_.avail_in = static_cast<uInt>(input.size());

        int rc = Z_OK;
        do {
            zs_.next_out = reinterpret_cast<Bytef*>(chunk.data());
            zs_.avail_out = static_cast<uInt>(chunk.size());
            rc = deflate(&zs_, Z_FINISH);
            if (rc == Z_STREAM_ERROR) {
                throw TransformError("Compression failed: " + zlib_message(zs_, rc));
            }
            out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs_.avail_out));
        } while (rc != Z_STREAM_END);
    }

private:
    z_stream zs_{};
};

class InflateStream {
public:
    InflateStream() {
        int rc = inflateInit2(&zs_, gzip_window_bits);
        if (rc != Z_OK) {
            throw TransformError("Decompression failed: " + zlib_message(zs_, rc));
        }
    }

    ~InflateStream() { inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    void run(std::span<const uint8_t> input, ByteBuffer& chunk, ByteBuffer& out) {
        zs_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
        zs_.avail_in = static_cast<uInt>(input.size());

        while (true) {
            zs_.next_out = reinterpret_cast<Bytef*>(chunk.data());
            zs_.avail_out = static_cast<uInt>(chunk.size());
            int rc = inflate(&zs_, Z_NO_FLUSH);

            switch (rc) {
                case Z_OK:
                case Z_BUF_ERROR:
                case Z_STREAM_END:
                    break;
                default:
                    throw TransformError("Decompression failed: " + zlib_message(zs_, rc));
            }
            out.insert(out.end(), chunk.begin(), chunk.begin() + (chunk.size() - zs_.avail_out));

            if (rc == Z_STREAM_END) {
                // Another gzip member may follow
                if (zs_.avail_in == 0) return;
                inflateReset(&zs_);
                continue;
            }
            if (zs_.avail_in == 0 && zs_.avail_out != 0) {
                throw TransformError("Decompression failed: truncated gzip stream");
            }
        }
    }

private:
    z_stream zs_{};
};

void check_input_size(std::span<const uint8_t> input, const char* stage) {
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw TransformError(std::string(stage) + " failed: input of " + std::to_string(input.size()) +
                             " bytes exceeds the zlib limit");
    }
}

} // anonymous namespace

int zlib_level(CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::None:         return Z_NO_COMPRESSION;
        case CompressionLevel::Fastest:      return Z_BEST_SPEED;
        case CompressionLevel::Optimal:      return 6;
        case CompressionLevel::SmallestSize: return Z_BEST_COMPRESSION;
    }
    return 6;
}

ByteBuffer compress(std::span<const uint8_t> input, CompressionLevel level) {
    check_input_size(input, "Compression");

    auto chunk = default_buffer_pool().acquire();
    chunk->resize(TAGWIRE_SCRATCH_BUFFER_SIZE);

    ByteBuffer out;
    out.reserve(input.size() / 2 + 32);

    DeflateStream stream(zlib_level(level));
    stream.run(input, *chunk, out);

    detail::log_size_change("compress", "compressed", input.size(), out.size());
    return out;
}

ByteBuffer decompress(std::span<const uint8_t> input) {
    if (!has_gzip_signature(input)) {
        throw TransformError("Decompression failed: input is not a gzip stream");
    }
    check_input_size(input, "Decompression");

    auto chunk = default_buffer_pool().acquire();
    chunk->resize(TAGWIRE_SCRATCH_BUFFER_SIZE);

    ByteBuffer out;
    out.reserve(input.size() * 2);

    InflateStream stream;
    stream.run(input, *chunk, out);

    detail::log_size_change("decompress", "decompressed", input.size(), out.size());
    return out;
}

bool has_gzip_signature(std::span<const uint8_t> bytes) noexcept {
    return bytes.size() >= 2 && bytes[0] == 0x1F && bytes[1] == 0x8B;
}

ByteBuffer compress_fast(std::span<const uint8_t> input) {
    return compress(input, CompressionLevel::Fastest);
}

ByteBuffer decompress_fast(std::span<const uint8_t> input) {
    return decompress(input);
}

} // namespace tagwire
