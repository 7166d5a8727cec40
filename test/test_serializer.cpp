// test_serializer.cpp - Tests for the Serializer pipeline (envelope + gzip + AES)

#include <catch2/catch_all.hpp>
#include <tagwire/builders.h>
#include <tagwire/compression.h>
#include <tagwire/errors.h>
#include <tagwire/serializer.h>

#include <string>
#include <utility>

using namespace tagwire;

namespace {

Value ann() {
    return Value::object({{"name", "Ann"}, {"age", 30}, {"tags", Value::array({"x", "y"})}});
}

SerializationOptions with(CompressionLevel level, bool encrypt, std::string key = "secret") {
    SerializationOptions options;
    options.compression = level;
    options.encrypt = encrypt;
    if (encrypt) options.encryption_key = std::move(key);
    return options;
}

} // namespace

// ============================================================
// Round trip
// ============================================================

TEST_CASE("Serializer round-trips the Ann record", "[serializer][roundtrip]") {
    Serializer serializer;
    ByteBuffer bytes = serializer.encode(ann());
    ValueObject decoded = serializer.decode(bytes);

    REQUIRE(Value{decoded} == ann());
    REQUIRE(decoded.find("age")->get().kind() == ValueKind::Int32);
    REQUIRE(decoded.find("age")->get().as_int32() == 30);
    REQUIRE(decoded.find("tags")->get().at(1).as_string() == "y");
}

TEST_CASE("Serializer composes the transform stages", "[serializer][pipeline]") {
    auto level = GENERATE(CompressionLevel::None, CompressionLevel::Fastest,
                          CompressionLevel::Optimal, CompressionLevel::SmallestSize);
    bool encrypt = GENERATE(false, true);
    bool include_schema = GENERATE(false, true);

    SerializationOptions options = with(level, encrypt);
    options.include_schema = include_schema;

    Serializer serializer(options);
    ByteBuffer bytes = serializer.encode(ann());

    INFO("level " << static_cast<int>(level) << ", encrypt " << encrypt << ", schema " << include_schema);
    REQUIRE(Value{serializer.decode(bytes)} == ann());

    if (!encrypt) {
        REQUIRE(has_gzip_signature(bytes) == (level != CompressionLevel::None));
        REQUIRE(has_envelope_magic(bytes) == (level == CompressionLevel::None));
    }
}

TEST_CASE("Serializer plain output is the raw envelope", "[serializer][pipeline]") {
    Serializer serializer(SerializationOptions::plain());
    ByteBuffer bytes = serializer.encode(ann());

    REQUIRE(has_envelope_magic(bytes));
    EnvelopeHeader header = read_header(bytes);
    REQUIRE(header.flags == 0);
}

TEST_CASE("Serializer decode_envelope exposes header and schema", "[serializer][envelope]") {
    SerializationOptions options = with(CompressionLevel::Optimal, true);
    Serializer serializer(options);

    Envelope envelope = serializer.decode_envelope(serializer.encode(ann()));
    REQUIRE(envelope.header.has_schema());
    REQUIRE(envelope.header.was_compressed());
    REQUIRE(envelope.header.was_encrypted());
    REQUIRE(envelope.schema.has_value());
    REQUIRE(envelope.schema->find("tags")->kind() == TypeDescriptor::Kind::Array);
}

TEST_CASE("Serializer per-call options override the defaults", "[serializer][options]") {
    Serializer serializer;
    SerializationOptions plain = SerializationOptions::plain();

    ByteBuffer bytes = serializer.encode(ann(), plain);
    REQUIRE(has_envelope_magic(bytes));
    REQUIRE(Value{serializer.decode(bytes, plain)} == ann());
}

TEST_CASE("Serializer rejects non-object field maps", "[serializer][errors]") {
    Serializer serializer;
    REQUIRE_THROWS_AS(serializer.encode(Value::array({1})), FramingError);
    REQUIRE_THROWS_AS(serializer.encode(Value{"text"}), FramingError);
}

// ============================================================
// Option mismatches
// ============================================================

TEST_CASE("Serializer requires a key when encrypting", "[serializer][errors]") {
    SerializationOptions options;
    options.encrypt = true;

    Serializer serializer(options);
    REQUIRE_THROWS_AS(serializer.encode(ann()), TransformError);

    ByteBuffer sealed = Serializer(with(CompressionLevel::Optimal, true)).encode(ann());
    REQUIRE_THROWS_AS(serializer.decode(sealed), TransformError);
}

TEST_CASE("Serializer reports mismatched transform options", "[serializer][errors]") {
    SECTION("wrong key") {
        ByteBuffer sealed = Serializer(with(CompressionLevel::Optimal, true, "right")).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::Optimal, true, "wrong")).decode(sealed),
                          TransformError);
    }

    SECTION("wrong key without compression") {
        ByteBuffer sealed = Serializer(with(CompressionLevel::None, true, "right")).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::None, true, "wrong")).decode(sealed),
                          TransformError);
    }

    SECTION("decompression omitted") {
        ByteBuffer packed = Serializer(with(CompressionLevel::Optimal, false)).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::None, false)).decode(packed), TransformError);
    }

    SECTION("decryption omitted when compression is on") {
        ByteBuffer sealed = Serializer(with(CompressionLevel::Optimal, true)).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::Optimal, false)).decode(sealed), TransformError);
    }

    SECTION("decryption omitted without compression") {
        Serializer sealer(with(CompressionLevel::None, true));
        ByteBuffer sealed = sealer.encode(ann());
        // The random IV lands on the version byte one time in 256
        while (sealed[envelope_magic.size()] == envelope_version) {
            sealed = sealer.encode(ann());
        }
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::None, false)).decode(sealed), TransformError);
        REQUIRE_THROWS_WITH(Serializer(with(CompressionLevel::None, false)).decode(sealed),
                            Catch::Matchers::StartsWith("Transform mismatch"));
    }

    SECTION("compression requested but never applied") {
        ByteBuffer raw = Serializer(with(CompressionLevel::None, false)).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::Optimal, false)).decode(raw), TransformError);
    }

    SECTION("encryption requested but never applied") {
        ByteBuffer packed = Serializer(with(CompressionLevel::Optimal, false)).encode(ann());
        REQUIRE_THROWS_AS(Serializer(with(CompressionLevel::Optimal, true)).decode(packed), TransformError);
    }

    SECTION("header flags disagree with the options") {
        // Flags claim compression but the envelope was never compressed
        ByteBuffer raw = encode_envelope(ann().as_object(), SerializationOptions{});
        REQUIRE_THROWS_WITH(Serializer(SerializationOptions::plain()).decode(raw),
                            Catch::Matchers::StartsWith("Transform mismatch"));
    }
}

TEST_CASE("Serializer surfaces framing errors", "[serializer][errors]") {
    Serializer serializer(SerializationOptions::plain());

    SECTION("corrupted magic") {
        ByteBuffer bytes = serializer.encode(ann());
        bytes[1] = 0;
        REQUIRE_THROWS_AS(serializer.decode(bytes), FramingError);
    }

    SECTION("truncated envelope") {
        ByteBuffer bytes = serializer.encode(ann());
        bytes.resize(bytes.size() - 3);
        REQUIRE_THROWS_AS(serializer.decode(bytes), TruncationError);
    }

    SECTION("every error derives from SerializationError") {
        ByteBuffer junk{1, 2, 3};
        REQUIRE_THROWS_AS(serializer.decode(junk), SerializationError);
    }
}
