// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json_stream.cpp - JSON array ingestion

#include <tagwire/json_stream.h>
#include <tagwire/errors.h>
#include <tagwire/json.h>
#include <tagwire/log.h>

#include <istream>

namespace tagwire {

namespace {

// Walks a top-level array; `visit` returns false to stop
template <typename Visit>
std::size_t walk_array(std::string_view text, bool objects_only, Visit&& visit) {
    JsonReader reader(text);
    reader.expect('[');

    std::size_t count = 0;
    if (reader.consume_if(']')) {
        if (!reader.at_end()) throw JsonError("Invalid JSON: trailing characters after array");
        return count;
    }

    while (true) {
        Value item = reader.parse_value();
        if (objects_only && !item.is_object()) {
            throw JsonError("Invalid JSON: array element " + std::to_string(count) +
                            " is not an object");
        }
        ++count;
        if (!visit(item)) return count;

        if (reader.consume_if(']')) break;
        reader.expect(',');
    }

    if (!reader.at_end()) throw JsonError("Invalid JSON: trailing characters after array");
    return count;
}

} // anonymous namespace

JsonStreamParser::JsonStreamParser(std::size_t chunk_size, BufferPool& pool)
    : chunk_size_(chunk_size == 0 ? TAGWIRE_SCRATCH_BUFFER_SIZE : chunk_size), pool_(&pool) {}

std::string JsonStreamParser::read_all(std::istream& in) const {
    auto chunk = pool_->acquire();
    chunk->resize(chunk_size_);

    std::string text;
    while (in) {
        in.read(reinterpret_cast<char*>(chunk->data()), static_cast<std::streamsize>(chunk->size()));
        text.append(reinterpret_cast<const char*>(chunk->data()), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw JsonError("Failed to read JSON stream");
    }
    return text;
}

std::size_t JsonStreamParser::parse_stream(std::string_view text, const ItemCallback& on_item) const {
    try {
        std::size_t count = walk_array(text, true, on_item);
        detail::log_debug("JsonStreamParser::parse_stream", "delivered " + std::to_string(count) + " items");
        return count;
    } catch (const JsonError& e) {
        detail::log_error("JsonStreamParser::parse_stream", e.what());
        throw;
    }
}

std::size_t JsonStreamParser::parse_stream(std::istream& in, const ItemCallback& on_item) const {
    return parse_stream(std::string_view{read_all(in)}, on_item);
}

std::size_t JsonStreamParser::count_items(std::istream& in) const {
    try {
        std::size_t count = walk_array(read_all(in), false, [](const Value&) { return true; });
        detail::log_debug("JsonStreamParser::count_items", "counted " + std::to_string(count) + " items");
        return count;
    } catch (const JsonError& e) {
        detail::log_error("JsonStreamParser::count_items", e.what());
        throw;
    }
}

JsonStreamParser::PartialResult JsonStreamParser::parse_partial(std::istream& in, std::size_t max_items) const {
    PartialResult result;
    if (max_items == 0) {
        result.has_more = true;
        return result;
    }

    parse_stream(in, [&](const Value& item) {
        result.items.push_back(item);
        return result.items.size() < max_items;
    });

    result.count = result.items.size();
    result.has_more = result.count == max_items;
    return result;
}

} // namespace tagwire
