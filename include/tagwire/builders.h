// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// This file provides transient-based builders:
/// - ObjectBuilder: Build an insertion-ordered field map
/// - ArrayBuilder: Build an array
///
/// Usage:
/// @code
///   #include <tagwire/builders.h>
///
///   Value record = ObjectBuilder()
///       .set("name", "Ann")
///       .set("age", 30)
///       .set("tags", ArrayBuilder().push_back("x").push_back("y").finish())
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace tagwire {

/// Builder for an insertion-ordered field map
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_object = BasicValueObject<MemoryPolicy>;
    using transient_type = typename value_object::transient_type;

    BasicObjectBuilder() : transient_(value_object{}.transient()) {}
    explicit BasicObjectBuilder(const value_object& existing) : transient_(existing.transient()) {}

    /// Setting a key twice keeps its original position
    template <typename T>
    BasicObjectBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_type{std::forward<T>(val)});
        return *this;
    }

    BasicObjectBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, std::move(val));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return transient_.contains(key); }
    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_object finish_object() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for an array of values
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_array = BasicValueArray<MemoryPolicy>;
    using transient_type = typename value_array::transient_type;

    BasicArrayBuilder() : transient_(value_array{}.transient()) {}

    template <typename T>
    BasicArrayBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicArrayBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_array finish_array() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

extern template class BasicObjectBuilder<thread_safe_memory_policy>;
extern template class BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace tagwire
