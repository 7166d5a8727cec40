// test_projection.cpp - Tests for record <-> field map projection and the record codec

#include <catch2/catch_all.hpp>
#include <tagwire/projection.h>
#include <tagwire/type_tag.h>

#include <boost/hana/adapt_struct.hpp>
#include <boost/hana/define_struct.hpp>

#include <string>

using namespace tagwire;

namespace projection_test {

struct Address {
    BOOST_HANA_DEFINE_STRUCT(Address,
        (std::string, city),
        (int32_t, zip)
    );
};

struct Person {
    BOOST_HANA_DEFINE_STRUCT(Person,
        (std::string, name),
        (int32_t, age),
        (int16_t, level),
        (double, score),
        (Address, home)
    );
};

struct Metrics {
    int64_t total;
    float ratio;
    uint32_t hits;
    bool enabled;
    std::string label;
};

Person sample_person() {
    return Person{"Ann", 30, int16_t{7}, 4.5, Address{"Oslo", 150}};
}

} // namespace projection_test

BOOST_HANA_ADAPT_STRUCT(projection_test::Metrics, total, ratio, hits, enabled, label);

using projection_test::Address;
using projection_test::Metrics;
using projection_test::Person;

// ============================================================
// to_field_map
// ============================================================

TEST_CASE("to_field_map projects members in declaration order", "[projection][to_field_map]") {
    ValueObject fields = to_field_map(projection_test::sample_person());

    REQUIRE(fields.size() == 5);
    REQUIRE(fields.entries()[0].key == "name");
    REQUIRE(fields.entries()[4].key == "home");

    REQUIRE(fields.find("name")->get().as_string() == "Ann");
    REQUIRE(fields.find("age")->get().kind() == ValueKind::Int32);
    REQUIRE(fields.find("score")->get().kind() == ValueKind::Double);
}

TEST_CASE("to_field_map keeps foreign members opaque", "[projection][opaque]") {
    ValueObject fields = to_field_map(projection_test::sample_person());

    SECTION("int16_t member") {
        const Value& level = fields.find("level")->get();
        REQUIRE(level.is_opaque());
        REQUIRE(level.get_if<Opaque>()->type_name == "short");
        REQUIRE(level.get_if<Opaque>()->text == "7");
    }

    SECTION("nested record member") {
        const Value& home = fields.find("home")->get();
        REQUIRE(home.is_opaque());
        REQUIRE_THAT(home.get_if<Opaque>()->type_name, Catch::Matchers::ContainsSubstring("Address"));
        REQUIRE(home.get_if<Opaque>()->text == R"({"city":"Oslo","zip":150})");
    }

    SECTION("records convert to opaque values directly") {
        Value v{Address{"Bergen", 5003}};
        REQUIRE(v.is_opaque());
        REQUIRE(tag_for(v) == TypeTag::Opaque);
    }
}

TEST_CASE("to_field_map leaves a field map unchanged", "[projection][to_field_map]") {
    ValueObject fields = Value::object({{"a", 1}, {"b", "two"}}).as_object();
    REQUIRE(to_field_map(fields) == fields);
}

// ============================================================
// from_field_map
// ============================================================

TEST_CASE("from_field_map assigns matching members", "[projection][from_field_map]") {
    ValueObject fields = Value::object({
        {"name", "Bob"},
        {"age", 41},
        {"level", 3},
        {"score", 1.25},
        {"home", Value::object({{"city", "Bergen"}, {"zip", 5003}})},
    }).as_object();

    Person p = from_field_map<Person>(fields);
    REQUIRE(p.name == "Bob");
    REQUIRE(p.age == 41);
    REQUIRE(p.level == 3);
    REQUIRE(p.score == 1.25);
    REQUIRE(p.home.city == "Bergen");
    REQUIRE(p.home.zip == 5003);
}

TEST_CASE("from_field_map converts on a best-effort basis", "[projection][from_field_map]") {
    ValueObject fields = Value::object({
        {"total", 5},
        {"ratio", 0.25},
        {"hits", "42"},
        {"enabled", "true"},
        {"label", 12},
    }).as_object();

    Metrics m = from_field_map<Metrics>(fields);
    REQUIRE(m.total == 5);
    REQUIRE(m.ratio == 0.25f);
    REQUIRE(m.hits == 42u);
    REQUIRE(m.enabled);
    REQUIRE(m.label == "12");
}

TEST_CASE("from_field_map skips what it cannot convert", "[projection][from_field_map]") {
    SECTION("missing fields keep their defaults") {
        Person p = from_field_map<Person>(Value::object({{"name", "Cid"}}).as_object());
        REQUIRE(p.name == "Cid");
        REQUIRE(p.age == 0);
        REQUIRE(p.home.city.empty());
    }

    SECTION("unconvertible values are ignored") {
        ValueObject fields = Value::object({
            {"total", "many"},
            {"hits", -1},
            {"enabled", 3.5},
            {"label", Value::array({1})},
        }).as_object();

        Metrics m = from_field_map<Metrics>(fields);
        REQUIRE(m.total == 0);
        REQUIRE(m.hits == 0u);
        REQUIRE_FALSE(m.enabled);
        REQUIRE(m.label.empty());
    }

    SECTION("out-of-range narrowing is skipped") {
        Person p = from_field_map<Person>(Value::object({{"level", 100000}}).as_object());
        REQUIRE(p.level == 0);
    }

    SECTION("unknown fields are ignored") {
        Person p = from_field_map<Person>(Value::object({{"nickname", "A"}, {"age", 9}}).as_object());
        REQUIRE(p.age == 9);
    }
}

// ============================================================
// Record codec
// ============================================================

TEST_CASE("encode_record and decode_record round-trip", "[projection][codec]") {
    Person original = projection_test::sample_person();

    auto check = [&](const Person& p) {
        REQUIRE(p.name == original.name);
        REQUIRE(p.age == original.age);
        REQUIRE(p.level == original.level);
        REQUIRE(p.score == original.score);
        REQUIRE(p.home.city == original.home.city);
        REQUIRE(p.home.zip == original.home.zip);
    };

    SECTION("default options") {
        check(decode_record<Person>(encode_record(original)));
    }

    SECTION("opaque values preserved") {
        SerializationOptions options;
        options.opaque_mode = OpaqueMode::Preserve;
        check(decode_record<Person>(encode_record(original, options), options));
    }

    SECTION("compressed and encrypted") {
        SerializationOptions options;
        options.compression = CompressionLevel::SmallestSize;
        options.encrypt = true;
        options.encryption_key = "hunter2";
        check(decode_record<Person>(encode_record(original, options), options));
    }
}

TEST_CASE("encode_record writes opaque members with tag 0xFF", "[projection][codec]") {
    ByteBuffer bytes = encode_record(projection_test::sample_person(), SerializationOptions::plain());

    SerializationOptions preserve = SerializationOptions::plain();
    preserve.opaque_mode = OpaqueMode::Preserve;
    ValueObject fields = Serializer(preserve).decode(bytes);

    REQUIRE(fields.find("level")->get() == Value::opaque("short", "7"));
    REQUIRE(fields.find("home")->get().is_opaque());

    SECTION("parse mode yields generic values") {
        ValueObject parsed = Serializer(SerializationOptions::plain()).decode(bytes);
        REQUIRE(parsed.find("level")->get() == Value{7});
        REQUIRE(parsed.find("home")->get().at("city").as_string() == "Oslo");
    }
}

TEST_CASE("encode_record schema infers opaque members as object", "[projection][schema]") {
    ByteBuffer bytes = encode_record(projection_test::sample_person());
    Envelope envelope = Serializer().decode_envelope(bytes);

    REQUIRE(envelope.schema.has_value());
    REQUIRE(envelope.schema->find("age")->type_name() == "int");
    REQUIRE(envelope.schema->find("level")->type_name() == "object");
    REQUIRE(envelope.schema->find("home")->type_name() == "object");
}
