// test_compression.cpp - Tests for the gzip stage

#include <catch2/catch_all.hpp>
#include <tagwire/compression.h>
#include <tagwire/errors.h>

#include <string>

using namespace tagwire;

namespace {

ByteBuffer repetitive(std::size_t size) {
    const std::string pattern = "tagwire envelope payload ";
    ByteBuffer out;
    out.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(static_cast<uint8_t>(pattern[i % pattern.size()]));
    }
    return out;
}

} // namespace

TEST_CASE("zlib level mapping", "[compression][levels]") {
    REQUIRE(zlib_level(CompressionLevel::None) == 0);
    REQUIRE(zlib_level(CompressionLevel::Fastest) == 1);
    REQUIRE(zlib_level(CompressionLevel::Optimal) == 6);
    REQUIRE(zlib_level(CompressionLevel::SmallestSize) == 9);
}

TEST_CASE("compress produces a gzip member", "[compression][gzip]") {
    ByteBuffer input = repetitive(10000);
    ByteBuffer packed = compress(input);

    REQUIRE(has_gzip_signature(packed));
    REQUIRE(packed.size() < input.size() / 10);
    REQUIRE(decompress(packed) == input);
}

TEST_CASE("compress at every level", "[compression][levels]") {
    ByteBuffer input = repetitive(50000);

    auto level = GENERATE(CompressionLevel::None, CompressionLevel::Fastest,
                          CompressionLevel::Optimal, CompressionLevel::SmallestSize);
    ByteBuffer packed = compress(input, level);
    REQUIRE(has_gzip_signature(packed));
    REQUIRE(decompress(packed) == input);
}

TEST_CASE("compress handles empty and large inputs", "[compression][sizes]") {
    SECTION("empty") {
        ByteBuffer packed = compress(ByteBuffer{});
        REQUIRE(has_gzip_signature(packed));
        REQUIRE(decompress(packed).empty());
    }

    SECTION("larger than the scratch chunk") {
        ByteBuffer input;
        input.reserve(3 * TAGWIRE_SCRATCH_BUFFER_SIZE);
        uint32_t state = 12345;
        for (std::size_t i = 0; i < 3 * TAGWIRE_SCRATCH_BUFFER_SIZE; ++i) {
            state = state * 1103515245u + 12345u;
            input.push_back(static_cast<uint8_t>(state >> 24));
        }
        REQUIRE(decompress(compress(input, CompressionLevel::Fastest)) == input);
    }
}

TEST_CASE("decompress accepts concatenated members", "[compression][gzip]") {
    ByteBuffer a = repetitive(100);
    ByteBuffer b{1, 2, 3};

    ByteBuffer joined = compress(a);
    ByteBuffer second = compress(b);
    joined.insert(joined.end(), second.begin(), second.end());

    ByteBuffer expected = a;
    expected.insert(expected.end(), b.begin(), b.end());
    REQUIRE(decompress(joined) == expected);
}

TEST_CASE("decompress rejects bad input", "[compression][errors]") {
    SECTION("no gzip signature") {
        ByteBuffer input{'T', 'U', 'S', 'K', 1, 0};
        REQUIRE_THROWS_WITH(decompress(input), "Decompression failed: input is not a gzip stream");
    }

    SECTION("truncated stream") {
        ByteBuffer packed = compress(repetitive(1000));
        packed.resize(packed.size() / 2);
        REQUIRE_THROWS_AS(decompress(packed), TransformError);
    }

    SECTION("corrupted body") {
        ByteBuffer packed = compress(repetitive(1000));
        for (std::size_t i = 10; i < packed.size(); ++i) {
            packed[i] = static_cast<uint8_t>(packed[i] ^ 0x5A);
        }
        REQUIRE_THROWS_AS(decompress(packed), TransformError);
    }
}

TEST_CASE("Legacy fast entry points", "[compression][legacy]") {
    ByteBuffer input = repetitive(4096);

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
    ByteBuffer fast = compress_fast(input);
    REQUIRE(fast == compress(input, CompressionLevel::Fastest));
    REQUIRE(decompress_fast(fast) == input);
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
}
