// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file compression.h
/// @brief gzip compression stage of the transform pipeline (zlib).
///
/// The output is a single gzip member (RFC 1952). Levels map to zlib levels:
///
/// | CompressionLevel | zlib level |
/// |------------------|------------|
/// | None             | 0 (stored) |
/// | Fastest          | 1          |
/// | Optimal          | 6          |
/// | SmallestSize     | 9          |

#pragma once

#include "api.h"
#include "options.h"
#include "value_fwd.h"

#include <cstdint>
#include <span>

namespace tagwire {

[[nodiscard]] TAGWIRE_API int zlib_level(CompressionLevel level) noexcept;

/// @throws TransformError when zlib fails
[[nodiscard]] TAGWIRE_API ByteBuffer compress(std::span<const uint8_t> input,
                                              CompressionLevel level = CompressionLevel::Optimal);

/// Inflates one or more concatenated gzip members
/// @throws TransformError on corrupt or truncated input
[[nodiscard]] TAGWIRE_API ByteBuffer decompress(std::span<const uint8_t> input);

/// True when `bytes` begins with the gzip signature 1F 8B
[[nodiscard]] TAGWIRE_API bool has_gzip_signature(std::span<const uint8_t> bytes) noexcept;

/// Legacy "fast" entry point: the same compressor at CompressionLevel::Fastest
[[nodiscard]] TAGWIRE_DEPRECATED("use compress(input, CompressionLevel::Fastest)") TAGWIRE_API ByteBuffer compress_fast(std::span<const uint8_t> input);

[[nodiscard]] TAGWIRE_DEPRECATED("use decompress(input)") TAGWIRE_API ByteBuffer decompress_fast(std::span<const uint8_t> input);

} // namespace tagwire
