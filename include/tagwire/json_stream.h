// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_stream.h
/// @brief Ingestion of a JSON array of records from a stream.
///
/// The input is a top-level JSON array whose elements are objects. Each
/// element is delivered as a field map (an Object Value) ready to be handed
/// to Serializer::encode.
///
/// Usage:
/// @code
///   std::ifstream file("records.json");
///   JsonStreamParser parser;
///   parser.parse_stream(file, [&](const Value& record) {
///       out.push_back(serializer.encode(record));
///       return true;                 // false stops the walk early
///   });
/// @endcode

#pragma once

#include "api.h"
#include "buffer_pool.h"
#include "value.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace tagwire {

class TAGWIRE_API JsonStreamParser {
public:
    /// Receives each record; return false to stop
    using ItemCallback = std::function<bool(const Value&)>;

    struct PartialResult {
        std::vector<Value> items;
        std::size_t count = 0;
        /// count == max_items; may be true even when the input held exactly max_items
        bool has_more = false;
    };

    /// @param chunk_size Bytes read from the stream per step
    /// @param pool       Pool supplying the read buffer
    explicit JsonStreamParser(std::size_t chunk_size = TAGWIRE_SCRATCH_BUFFER_SIZE,
                              BufferPool& pool = default_buffer_pool());

    /// Walks the array, calling `on_item` for each element
    /// @return Number of elements delivered
    /// @throws JsonError on malformed input or a non-object element
    std::size_t parse_stream(std::istream& in, const ItemCallback& on_item) const;
    std::size_t parse_stream(std::string_view text, const ItemCallback& on_item) const;

    /// Number of elements in the array
    [[nodiscard]] std::size_t count_items(std::istream& in) const;

    /// First `max_items` elements
    [[nodiscard]] PartialResult parse_partial(std::istream& in, std::size_t max_items) const;

private:
    std::string read_all(std::istream& in) const;

    std::size_t chunk_size_;
    BufferPool* pool_;
};

} // namespace tagwire
