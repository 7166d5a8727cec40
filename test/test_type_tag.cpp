// test_type_tag.cpp - Tests for the kind <-> tag byte registry and type names

#include <catch2/catch_all.hpp>
#include <tagwire/type_tag.h>
#include <tagwire/value.h>

using namespace tagwire;

TEST_CASE("tag_for maps exact kinds", "[type_tag][mapping]") {
    REQUIRE(tag_for(Value{}) == TypeTag::Null);
    REQUIRE(tag_for(Value{"s"}) == TypeTag::String);
    REQUIRE(tag_for(Value{1}) == TypeTag::Int32);
    REQUIRE(tag_for(Value{int64_t{1}}) == TypeTag::Int64);
    REQUIRE(tag_for(Value{1.0}) == TypeTag::Double);
    REQUIRE(tag_for(Value{false}) == TypeTag::Bool);
    REQUIRE(tag_for(Value{Timestamp{}}) == TypeTag::Timestamp);
    REQUIRE(tag_for(Value{Guid{}}) == TypeTag::Guid);
    REQUIRE(tag_for(Value::bytes({})) == TypeTag::Bytes);
    REQUIRE(tag_for(Value::array({})) == TypeTag::Array);
    REQUIRE(tag_for(Value::object({})) == TypeTag::Object);
}

TEST_CASE("tag_for falls back to opaque", "[type_tag][opaque]") {
    REQUIRE(tag_for(Value{int16_t{7}}) == TypeTag::Opaque);
    REQUIRE(tag_for(Value{uint32_t{7}}) == TypeTag::Opaque);
    REQUIRE(tag_for(Value{7.0f}) == TypeTag::Opaque);
    REQUIRE(static_cast<uint8_t>(TypeTag::Opaque) == 0xFF);
}

TEST_CASE("kind_for_tag reads tag bytes back", "[type_tag][mapping]") {
    for (uint8_t b = 0x00; b <= 0x0A; ++b) {
        auto kind = kind_for_tag(b);
        REQUIRE(kind.has_value());
        REQUIRE(static_cast<uint8_t>(tag_for(*kind)) == b);
        REQUIRE(is_registered(b));
    }
    REQUIRE(kind_for_tag(0xFF) == ValueKind::Opaque);
    REQUIRE(is_registered(0xFF));

    SECTION("unknown bytes") {
        REQUIRE_FALSE(kind_for_tag(0x0B).has_value());
        REQUIRE_FALSE(kind_for_tag(0x80).has_value());
        REQUIRE_FALSE(is_registered(0xFE));
    }
}

TEST_CASE("Canonical type names", "[type_tag][names]") {
    REQUIRE(type_name(ValueKind::String) == "string");
    REQUIRE(type_name(ValueKind::Int32) == "int");
    REQUIRE(type_name(ValueKind::Int64) == "long");
    REQUIRE(type_name(ValueKind::Double) == "double");
    REQUIRE(type_name(ValueKind::Bool) == "bool");
    REQUIRE(type_name(ValueKind::Timestamp) == "datetime");
    REQUIRE(type_name(ValueKind::Guid) == "guid");
    REQUIRE(type_name(ValueKind::Bytes) == "bytes");
    REQUIRE(type_name(ValueKind::Null) == "null");
    REQUIRE(type_name(ValueKind::Opaque) == "object");
    REQUIRE(type_name_of(Value::array({1})) == "object");

    SECTION("kind_from_name") {
        REQUIRE(kind_from_name("int") == ValueKind::Int32);
        REQUIRE(kind_from_name("datetime") == ValueKind::Timestamp);
        REQUIRE_FALSE(kind_from_name("object").has_value());
        REQUIRE_FALSE(kind_from_name("decimal").has_value());
    }
}
