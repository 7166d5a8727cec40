// test_encryption.cpp - Tests for the AES-256-CBC password stage

#include <catch2/catch_all.hpp>
#include <tagwire/encryption.h>
#include <tagwire/errors.h>

#include <algorithm>
#include <string>

using namespace tagwire;

namespace {

ByteBuffer text_bytes(const std::string& s) {
    return ByteBuffer(s.begin(), s.end());
}

} // namespace

TEST_CASE("derive_key is deterministic", "[encryption][kdf]") {
    AesKey a = derive_key("secret");
    AesKey b = derive_key("secret");
    AesKey c = derive_key("Secret");

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a.size() == aes_key_size);
}

TEST_CASE("encrypt frames IV and ciphertext", "[encryption][framing]") {
    ByteBuffer plain = text_bytes("hello, envelope");

    ByteBuffer sealed = encrypt(plain, "secret");
    // 15 bytes of plaintext pad to one block
    REQUIRE(sealed.size() == aes_block_size + aes_block_size);

    SECTION("a whole block of plaintext gains a padding block") {
        ByteBuffer block(aes_block_size, 0x41);
        REQUIRE(encrypt(block, "secret").size() == aes_block_size + 2 * aes_block_size);
    }

    SECTION("every call draws a fresh IV") {
        ByteBuffer again = encrypt(plain, "secret");
        REQUIRE_FALSE(std::equal(sealed.begin(), sealed.begin() + aes_block_size, again.begin()));
        REQUIRE(decrypt(again, "secret") == plain);
    }
}

TEST_CASE("decrypt recovers the plaintext", "[encryption][roundtrip]") {
    ByteBuffer plain = GENERATE(ByteBuffer{}, ByteBuffer{0x00}, ByteBuffer(1000, 0x7F));
    REQUIRE(decrypt(encrypt(plain, "pw"), "pw") == plain);
}

TEST_CASE("decrypt rejects wrong keys and bad input", "[encryption][errors]") {
    ByteBuffer plain = text_bytes(std::string(100, 'z'));
    ByteBuffer sealed = encrypt(plain, "right");

    SECTION("wrong password") {
        // A wrong key yields bad padding, or by chance a padding-valid garbage block
        bool rejected = false;
        try {
            rejected = decrypt(sealed, "wrong") != plain;
        } catch (const TransformError&) {
            rejected = true;
        }
        REQUIRE(rejected);
    }

    SECTION("shorter than IV plus one block") {
        ByteBuffer short_input(aes_block_size + 3, 0);
        REQUIRE_THROWS_AS(decrypt(short_input, "right"), TransformError);
    }

    SECTION("not block aligned") {
        ByteBuffer unaligned(sealed.begin(), sealed.end() - 1);
        REQUIRE_THROWS_AS(decrypt(unaligned, "right"), TransformError);
    }
}
