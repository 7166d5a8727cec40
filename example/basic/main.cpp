// main.cpp
// tagwire Example - Encoding field maps and records into envelopes
//
// This example walks through the codec end to end:
//
// Step 1: Build a field map and encode it with the default options
// Step 2: Inspect the header of a plain envelope
// Step 3: Compose compression and encryption
// Step 4: Round-trip a Boost.Hana record with foreign member types
// Step 5: Stream records out of a JSON array
// Step 6: See what a mismatched decode reports

#include <tagwire/builders.h>
#include <tagwire/errors.h>
#include <tagwire/json.h>
#include <tagwire/json_stream.h>
#include <tagwire/projection.h>
#include <tagwire/serializer.h>

#include <boost/hana/define_struct.hpp>

#include <iostream>
#include <sstream>
#include <string>

using namespace tagwire;

// ============================================================
// Domain record
// ============================================================

struct Sensor
{
    BOOST_HANA_DEFINE_STRUCT(Sensor,
        (std::string, id),
        (int32_t, reading),
        (int16_t, channel),
        (float, gain)
    );
};

// ============================================================
// Helpers
// ============================================================

static void print_step(const char* title)
{
    std::cout << "\n=== " << title << " ===\n";
}

static void print_size(const char* label, const ByteBuffer& bytes)
{
    std::cout << "  " << label << ": " << bytes.size() << " bytes\n";
}

// ============================================================
// Steps
// ============================================================

static void demo_default_options()
{
    print_step("Step 1: default options (schema + gzip)");

    Value person = ObjectBuilder()
        .set("name", "Ann")
        .set("age", 30)
        .set("tags", ArrayBuilder().push_back("x").push_back("y").finish())
        .finish();

    Serializer serializer;
    ByteBuffer bytes = serializer.encode(person);
    print_size("encoded", bytes);

    ValueObject decoded = serializer.decode(bytes);
    std::cout << "  decoded: " << Value{decoded} << "\n";
}

static void demo_header()
{
    print_step("Step 2: header of a plain envelope");

    Serializer serializer(SerializationOptions::plain());
    ByteBuffer bytes = serializer.encode(Value::object({{"id", Guid::generate()}}));

    EnvelopeHeader header = read_header(bytes);
    std::cout << "  version: " << static_cast<int>(header.version) << "\n"
              << "  schema: " << std::boolalpha << header.has_schema() << "\n"
              << "  written at: " << header.timestamp.to_iso8601() << "\n";
}

static void demo_transforms()
{
    print_step("Step 3: compression and encryption");

    ArrayBuilder samples;
    for (int i = 0; i < 200; ++i) {
        samples.push_back(i % 7);
    }
    Value payload = Value::object({{"samples", samples.finish()}});

    SerializationOptions options = SerializationOptions::plain();
    print_size("plain", Serializer(options).encode(payload));

    options.compression = CompressionLevel::SmallestSize;
    print_size("gzip", Serializer(options).encode(payload));

    options.encrypt = true;
    options.encryption_key = "correct horse battery staple";
    ByteBuffer sealed = Serializer(options).encode(payload);
    print_size("gzip + aes", sealed);

    ValueObject opened = Serializer(options).decode(sealed);
    std::cout << "  samples after decode: " << opened.find("samples")->get().size() << "\n";
}

static void demo_records()
{
    print_step("Step 4: Boost.Hana record");

    Sensor sensor{"probe-7", 1234, int16_t{3}, 0.5f};
    ByteBuffer bytes = encode_record(sensor);
    print_size("encoded", bytes);

    std::cout << "  field map: " << Value{to_field_map(sensor)} << "\n";

    Sensor back = decode_record<Sensor>(bytes);
    std::cout << "  decoded: id=" << back.id << " reading=" << back.reading
              << " channel=" << back.channel << " gain=" << back.gain << "\n";
}

static void demo_stream()
{
    print_step("Step 5: streaming JSON array");

    std::istringstream in(R"([{"id":"a","reading":1},{"id":"b","reading":2},{"id":"c","reading":3}])");
    JsonStreamParser parser;
    auto partial = parser.parse_partial(in, 2);

    std::cout << "  first " << partial.count << " items, more: " << std::boolalpha << partial.has_more << "\n";
    for (const auto& item : partial.items) {
        Sensor s = from_field_map<Sensor>(item.as_object());
        std::cout << "    " << s.id << " -> " << s.reading << "\n";
    }
}

static void demo_mismatch()
{
    print_step("Step 6: decoding with the wrong options");

    ByteBuffer packed = Serializer().encode(Value::object({{"k", 1}}));
    try {
        (void)Serializer(SerializationOptions::plain()).decode(packed);
    } catch (const SerializationError& e) {
        std::cout << "  " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
    }
}

int main()
{
    std::cout << "=== tagwire Example ===\n";

    demo_default_options();
    demo_header();
    demo_transforms();
    demo_records();
    demo_stream();
    demo_mismatch();

    return 0;
}
