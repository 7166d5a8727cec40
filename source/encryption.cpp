// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// encryption.cpp - AES-256-CBC stage (OpenSSL libcrypto)

#include <tagwire/encryption.h>
#include <tagwire/errors.h>
#include <tagwire/log.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <memory>
#include <string>

namespace tagwire {

namespace {

constexpr std::array<uint8_t, 16> kdf_salt{};

class CipherContext {
public:
    enum class Direction { Encrypt, Decrypt };

    CipherContext(Direction direction, const AesKey& key, const uint8_t* iv)
        : ctx_(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free), direction_(direction) {
        if (!ctx_) {
            throw TransformError("Encryption failed: cipher context allocation failed");
        }
        int enc = direction_ == Direction::Encrypt ? 1 : 0;
        if (EVP_CipherInit_ex(ctx_.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv, enc) != 1) {
            throw TransformError(stage() + " failed: cipher init failed");
        }
        // PKCS#7 padding
        EVP_CIPHER_CTX_set_padding(ctx_.get(), 1);
    }

    /// Appends the transformed input to `out`
    void run(std::span<const uint8_t> input, ByteBuffer& out) {
        std::size_t offset = out.size();
        out.resize(offset + input.size() + aes_block_size);

        int out_len = 0;
        if (EVP_CipherUpdate(ctx_.get(), out.data() + offset, &out_len, input.data(), static_cast<int>(input.size())) != 1) {
            throw TransformError(stage() + " failed: cipher update failed");
        }
        offset += static_cast<std::size_t>(out_len);

        int final_len = 0;
        if (EVP_CipherFinal_ex(ctx_.get(), out.data() + offset, &final_len) != 1) {
            throw TransformError(direction_ == Direction::Decrypt
                                     ? "Decryption failed: bad padding (wrong key or corrupt data)"
                                     : "Encryption failed: cipher final failed");
        }
        out.resize(offset + static_cast<std::size_t>(final_len));
    }

private:
    std::string stage() const {
        return direction_ == Direction::Encrypt ? "Encryption" : "Decryption";
    }

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx_;
    Direction direction_;
};

void check_input_size(std::span<const uint8_t> input) {
    if (input.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() - static_cast<int>(aes_block_size))) {
        throw TransformError("Encryption failed: input of " + std::to_string(input.size()) + " bytes is too large");
    }
}

} // anonymous namespace

AesKey derive_key(std::string_view password) {
    AesKey key{};
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          kdf_salt.data(), static_cast<int>(kdf_salt.size()),
                          pbkdf2_iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw TransformError("Encryption failed: key derivation failed");
    }
    return key;
}

ByteBuffer encrypt(std::span<const uint8_t> plain, std::string_view password) {
    check_input_size(plain);

    ByteBuffer out(aes_block_size);
    if (RAND_bytes(out.data(), static_cast<int>(aes_block_size)) != 1) {
        throw TransformError("Encryption failed: random IV generation failed");
    }

    CipherContext cipher(CipherContext::Direction::Encrypt, derive_key(password), out.data());
    cipher.run(plain, out);

    detail::log_size_change("encrypt", "encrypted", plain.size(), out.size());
    return out;
}

ByteBuffer decrypt(std::span<const uint8_t> data, std::string_view password) {
    if (data.size() < 2 * aes_block_size || (data.size() - aes_block_size) % aes_block_size != 0) {
        throw TransformError("Decryption failed: input of " + std::to_string(data.size()) +
                             " bytes is not an IV followed by whole cipher blocks");
    }
    check_input_size(data);

    ByteBuffer out;
    out.reserve(data.size());

    CipherContext cipher(CipherContext::Direction::Decrypt, derive_key(password), data.data());
    cipher.run(data.subspan(aes_block_size), out);

    detail::log_size_change("decrypt", "decrypted", data.size(), out.size());
    return out;
}

} // namespace tagwire
