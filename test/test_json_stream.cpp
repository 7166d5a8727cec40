// test_json_stream.cpp - Tests for JsonStreamParser (array-of-records ingestion)

#include <catch2/catch_all.hpp>
#include <tagwire/buffer_pool.h>
#include <tagwire/errors.h>
#include <tagwire/json_stream.h>

#include <sstream>
#include <vector>

using namespace tagwire;

namespace {

const char* people = R"([
    {"name": "Ann", "age": 30},
    {"name": "Bob", "age": 41},
    {"name": "Cid", "age": 25}
])";

} // namespace

TEST_CASE("JsonStreamParser delivers every record", "[json_stream][parse]") {
    JsonStreamParser parser;
    std::istringstream in(people);

    std::vector<std::string> names;
    std::size_t count = parser.parse_stream(in, [&](const Value& item) {
        names.push_back(item.at("name").as_string());
        return true;
    });

    REQUIRE(count == 3);
    REQUIRE(names == std::vector<std::string>{"Ann", "Bob", "Cid"});
}

TEST_CASE("JsonStreamParser callback stops early", "[json_stream][parse]") {
    JsonStreamParser parser;
    int seen = 0;
    std::size_t count = parser.parse_stream(std::string_view{people}, [&](const Value&) {
        return ++seen < 2;
    });
    REQUIRE(count == 2);
    REQUIRE(seen == 2);
}

TEST_CASE("JsonStreamParser reads in small chunks", "[json_stream][chunks]") {
    BufferPool pool(2, 16);
    JsonStreamParser parser(7, pool);
    std::istringstream in(people);

    REQUIRE(parser.count_items(in) == 3);
    REQUIRE(pool.stats().created == 1);
}

TEST_CASE("JsonStreamParser empty array", "[json_stream][parse]") {
    JsonStreamParser parser;
    std::istringstream in("  [ ]  ");
    REQUIRE(parser.count_items(in) == 0);
}

TEST_CASE("JsonStreamParser count_items accepts any element", "[json_stream][count]") {
    JsonStreamParser parser;
    std::istringstream in(R"([1, "two", {"three": 3}, [4]])");
    REQUIRE(parser.count_items(in) == 4);
}

TEST_CASE("JsonStreamParser parse_partial", "[json_stream][partial]") {
    JsonStreamParser parser;

    SECTION("fewer items than available") {
        std::istringstream in(people);
        auto result = parser.parse_partial(in, 2);
        REQUIRE(result.count == 2);
        REQUIRE(result.items.size() == 2);
        REQUIRE(result.has_more);
        REQUIRE(result.items[1].at("name").as_string() == "Bob");
    }

    SECTION("more items requested than available") {
        std::istringstream in(people);
        auto result = parser.parse_partial(in, 10);
        REQUIRE(result.count == 3);
        REQUIRE_FALSE(result.has_more);
    }

    SECTION("exactly the available count reports has_more") {
        std::istringstream in(people);
        auto result = parser.parse_partial(in, 3);
        REQUIRE(result.count == 3);
        REQUIRE(result.has_more);
    }

    SECTION("zero items") {
        std::istringstream in(people);
        auto result = parser.parse_partial(in, 0);
        REQUIRE(result.count == 0);
        REQUIRE(result.items.empty());
        REQUIRE(result.has_more);
    }
}

TEST_CASE("JsonStreamParser rejects malformed input", "[json_stream][errors]") {
    JsonStreamParser parser;
    auto accept = [](const Value&) { return true; };

    SECTION("not an array") {
        REQUIRE_THROWS_AS(parser.parse_stream(std::string_view{R"({"a":1})"}, accept), JsonError);
    }

    SECTION("non-object element") {
        REQUIRE_THROWS_WITH(parser.parse_stream(std::string_view{R"([{"a":1}, 2])"}, accept),
                            Catch::Matchers::ContainsSubstring("array element 1 is not an object"));
    }

    SECTION("unterminated array") {
        std::istringstream in(R"([{"a":1},)");
        REQUIRE_THROWS_AS(parser.count_items(in), JsonError);
    }

    SECTION("trailing characters") {
        REQUIRE_THROWS_AS(parser.parse_stream(std::string_view{"[] []"}, accept), JsonError);
    }

    SECTION("JsonError is a SerializationError") {
        REQUIRE_THROWS_AS(parser.parse_stream(std::string_view{"nope"}, accept), SerializationError);
    }
}
