// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file encryption.h
/// @brief Password-based encryption stage of the transform pipeline (OpenSSL).
///
/// AES-256-CBC with PKCS#7 padding. Every call draws a fresh random 16-byte
/// IV; the output is `[IV][ciphertext]`.
///
/// The key is PBKDF2-HMAC-SHA256(password, salt = 16 zero bytes,
/// 10000 iterations, 32 bytes). The fixed salt means equal passwords always
/// derive equal keys. It is kept so that existing envelopes stay readable.

#pragma once

#include "api.h"
#include "value_fwd.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace tagwire {

inline constexpr std::size_t aes_key_size = 32;
inline constexpr std::size_t aes_block_size = 16;
inline constexpr int pbkdf2_iterations = 10000;

using AesKey = std::array<uint8_t, aes_key_size>;

/// @throws TransformError when the key derivation fails
[[nodiscard]] TAGWIRE_API AesKey derive_key(std::string_view password);

/// @throws TransformError when the cipher fails
[[nodiscard]] TAGWIRE_API ByteBuffer encrypt(std::span<const uint8_t> plain, std::string_view password);

/// @throws TransformError on a wrong password, bad padding or input shorter
///         than one IV plus one block
[[nodiscard]] TAGWIRE_API ByteBuffer decrypt(std::span<const uint8_t> data, std::string_view password);

} // namespace tagwire
