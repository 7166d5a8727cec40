// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamically-typed Value carried by the tagwire envelope.
///
/// This file defines the closed set of kinds the envelope codec understands:
/// - Null (std::monostate)
/// - Scalars: string, int32, int64, double, bool, Timestamp, Guid
/// - Bytes (boxed byte buffer)
/// - Containers: Array (immer::vector) and Object (insertion-ordered map)
/// - Opaque: runtime type name plus a textual (JSON) fallback encoding
///
/// Values of any other C++ type are never coerced to a near kind. Types with
/// an OpaqueTraits specialization convert implicitly to an Opaque value.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include "value_fwd.h"
#include "api.h"
#include "log.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <boost/core/demangle.hpp>

#include <array>
#include <chrono>
#include <compare>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

namespace tagwire {

// ============================================================
// Scalar types without a standard library counterpart
// ============================================================

/// Point in time as 100-nanosecond ticks since 0001-01-01T00:00:00 UTC
struct TAGWIRE_API Timestamp {
    static constexpr int64_t ticks_per_second = 10'000'000;
    /// Ticks at 1970-01-01T00:00:00 UTC
    static constexpr int64_t unix_epoch_ticks = 621'355'968'000'000'000;
    /// Ticks at 9999-12-31T23:59:59.9999999 UTC
    static constexpr int64_t max_ticks = 3'155'378'975'999'999'999;

    int64_t ticks = 0;

    /// True when the tick count lies in years 0001..9999
    [[nodiscard]] constexpr bool is_representable() const noexcept {
        return ticks >= 0 && ticks <= max_ticks;
    }

    [[nodiscard]] static Timestamp now();
    [[nodiscard]] static Timestamp from_time_point(std::chrono::system_clock::time_point tp);
    /// @throws std::out_of_range if the instant does not fit system_clock
    [[nodiscard]] std::chrono::system_clock::time_point to_time_point() const;

    /// "YYYY-MM-DDTHH:MM:SS.fffffffZ", or the decimal tick count when
    /// the timestamp is not representable
    [[nodiscard]] std::string to_iso8601() const;
    [[nodiscard]] static std::optional<Timestamp> parse_iso8601(std::string_view text);

    auto operator<=>(const Timestamp&) const = default;
};

/// 16 opaque bytes, stored in the order they appear on the wire
struct TAGWIRE_API Guid {
    std::array<uint8_t, 16> bytes{};

    /// Random (version 4) identifier
    [[nodiscard]] static Guid generate();
    /// Accepts the canonical 8-4-4-4-12 hex form, with or without braces
    [[nodiscard]] static std::optional<Guid> parse(std::string_view text);
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] bool is_nil() const noexcept;

    auto operator<=>(const Guid&) const = default;
};

/// A value whose C++ type has no registered kind
struct Opaque {
    std::string type_name;
    std::string text;  ///< JSON encoding of the original value

    bool operator==(const Opaque&) const = default;
};

// ============================================================
// Opaque conversion
//
// OpaqueTraits<T> describes how a foreign type is turned into an Opaque
// value: the runtime type name and the JSON fallback text. Arithmetic types
// without a registered kind are covered here; adapted records are covered
// in projection.h.
// ============================================================

template <typename T>
inline constexpr bool is_registered_scalar_v =
    std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t> ||
    std::is_same_v<T, double> || std::is_same_v<T, bool>;

template <typename T, typename Enable = void>
struct OpaqueTraits;

namespace detail {

/// Shortest JSON number text that reads back to the same value. Always
/// contains a '.' or an exponent; non-finite values yield "null".
[[nodiscard]] TAGWIRE_API std::string format_number(double value);
[[nodiscard]] TAGWIRE_API std::string format_number(float value);

template <typename T>
[[nodiscard]] std::string runtime_type_name() {
    return boost::core::demangle(typeid(T).name());
}

} // namespace detail

template <typename T>
struct OpaqueTraits<T, std::enable_if_t<std::is_arithmetic_v<T> && !is_registered_scalar_v<T>>> {
    static std::string type_name() { return detail::runtime_type_name<T>(); }

    static std::string to_text(T v) {
        if constexpr (std::is_same_v<T, float>) {
            return detail::format_number(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            return detail::format_number(static_cast<double>(v));
        } else if constexpr (std::is_signed_v<T>) {
            return std::to_string(static_cast<long long>(v));
        } else {
            return std::to_string(static_cast<unsigned long long>(v));
        }
    }
};

template <typename T>
concept OpaqueConvertible = requires(const T& v) {
    { OpaqueTraits<T>::type_name() } -> std::convertible_to<std::string>;
    { OpaqueTraits<T>::to_text(v) } -> std::convertible_to<std::string>;
};

template <OpaqueConvertible T>
[[nodiscard]] Opaque make_opaque(const T& v) {
    return Opaque{OpaqueTraits<T>::type_name(), OpaqueTraits<T>::to_text(v)};
}

// ============================================================
// Kinds
//
// The enumerator order matches the alternative order of BasicValue::data.
// ============================================================

enum class ValueKind : uint8_t {
    Null,
    String,
    Int32,
    Int64,
    Double,
    Bool,
    Timestamp,
    Guid,
    Bytes,
    Array,
    Object,
    Opaque,
};

// ============================================================
// Container types
// ============================================================

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueBytes = immer::box<ByteBuffer, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicObjectEntry {
    std::string key;
    BasicValueBox<MemoryPolicy> value;

    bool operator==(const BasicObjectEntry& other) const {
        return key == other.key && value == other.value;
    }

    bool operator!=(const BasicObjectEntry& other) const {
        return !(*this == other);
    }
};

/// Field map that keeps the order in which fields were first inserted.
///
/// Entries live in an immer::vector; a hash index maps each key to its slot.
/// Setting an existing key replaces the entry in place.
template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using entry_type = BasicObjectEntry<MemoryPolicy>;
    using entries_type = immer::vector<entry_type, MemoryPolicy>;
    using index_type = immer::map<std::string, std::size_t,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;
    using const_iterator = typename entries_type::const_iterator;

    class transient_type {
    public:
        transient_type() = default;
        transient_type(const entries_type& entries, const index_type& index)
            : entries_(entries.transient()), index_(index.transient()) {}

        void set(const std::string& key, value_type val) {
            if (auto* pos = index_.find(key)) {
                entries_.set(*pos, entry_type{key, value_box{std::move(val)}});
                return;
            }
            index_.set(key, entries_.size());
            entries_.push_back(entry_type{key, value_box{std::move(val)}});
        }

        [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }
        [[nodiscard]] std::size_t size() const { return entries_.size(); }

        [[nodiscard]] BasicValueObject persistent() {
            return BasicValueObject{entries_.persistent(), index_.persistent()};
        }

    private:
        typename entries_type::transient_type entries_;
        typename index_type::transient_type index_;
    };

    BasicValueObject() = default;

    [[nodiscard]] const value_box* find(const std::string& key) const {
        if (auto* pos = index_.find(key)) return &entries_[*pos].value;
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] BasicValueObject set(const std::string& key, value_type val) const {
        if (auto* pos = index_.find(key)) {
            return BasicValueObject{entries_.set(*pos, entry_type{key, value_box{std::move(val)}}), index_};
        }
        return BasicValueObject{entries_.push_back(entry_type{key, value_box{std::move(val)}}),
                                index_.set(key, entries_.size())};
    }

    [[nodiscard]] transient_type transient() const { return transient_type{entries_, index_}; }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }
    [[nodiscard]] const entries_type& entries() const noexcept { return entries_; }

    /// Field order is significant
    friend bool operator==(const BasicValueObject& a, const BasicValueObject& b) {
        return a.entries_ == b.entries_;
    }

private:
    BasicValueObject(entries_type entries, index_type index)
        : entries_(std::move(entries)), index_(std::move(index)) {}

    entries_type entries_;
    index_type index_;
};

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using value_bytes   = BasicValueBytes<MemoryPolicy>;
    using object_entry  = BasicObjectEntry<MemoryPolicy>;

    std::variant<std::monostate,
                 std::string,
                 int32_t,
                 int64_t,
                 double,
                 bool,
                 Timestamp,
                 Guid,
                 value_bytes,
                 value_array,
                 value_object,
                 Opaque>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(int32_t v) noexcept : data(std::in_place_type<int32_t>, v) {}
    BasicValue(int64_t v) noexcept : data(std::in_place_type<int64_t>, v) {}
    BasicValue(double v) noexcept : data(std::in_place_type<double>, v) {}
    BasicValue(bool v) noexcept : data(std::in_place_type<bool>, v) {}
    BasicValue(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(Timestamp v) noexcept : data(v) {}
    BasicValue(const Guid& v) noexcept : data(v) {}
    BasicValue(ByteBuffer v) : data(value_bytes{std::move(v)}) {}
    BasicValue(value_bytes v) : data(std::move(v)) {}
    BasicValue(value_array v) : data(std::move(v)) {}
    BasicValue(value_object v) : data(std::move(v)) {}
    BasicValue(Opaque v) : data(std::move(v)) {}

    /// Foreign types become Opaque values
    template <OpaqueConvertible T>
    BasicValue(const T& v) : data(make_opaque(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_object{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, val);
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue bytes(ByteBuffer b) {
        return BasicValue{value_bytes{std::move(b)}};
    }

    static BasicValue opaque(std::string type_name, std::string text) {
        return BasicValue{Opaque{std::move(type_name), std::move(text)}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_opaque() const noexcept { return is<Opaque>(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return found->get();
        }
        detail::log_debug("Value::at", "key '" + key + "' not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_debug("Value::at", "index " + std::to_string(index) + " out of range or type mismatch");
        return BasicValue{};
    }

    template <typename T>
    [[nodiscard]] T get_or(T default_val = T{}) const {
        if (auto* ptr = get_if<T>()) return *ptr;
        return default_val;
    }

    [[nodiscard]] int32_t as_int32(int32_t default_val = 0) const { return get_or<int32_t>(default_val); }
    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const { return get_or<int64_t>(default_val); }
    [[nodiscard]] double as_double(double default_val = 0.0) const { return get_or<double>(default_val); }
    [[nodiscard]] bool as_bool(bool default_val = false) const { return get_or<bool>(default_val); }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] Timestamp as_timestamp(Timestamp default_val = {}) const { return get_or<Timestamp>(default_val); }
    [[nodiscard]] Guid as_guid(Guid default_val = {}) const { return get_or<Guid>(default_val); }

    [[nodiscard]] ByteBuffer as_bytes() const {
        if (auto* p = get_if<value_bytes>()) return p->get();
        return {};
    }

    [[nodiscard]] value_array as_array(value_array default_val = {}) const { return get_or<value_array>(std::move(default_val)); }
    [[nodiscard]] value_object as_object(value_object default_val = {}) const { return get_or<value_object>(std::move(default_val)); }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<value_object>()) return o->contains(key);
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* o = get_if<value_object>()) return o->set(key, std::move(val));
        detail::log_debug("Value::set", "cannot set key '" + key + "' on non-object value");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* a = get_if<value_array>()) return a->push_back(value_box{std::move(val)});
        detail::log_debug("Value::push_back", "cannot append to non-array value");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* a = get_if<value_array>()) return a->size();
        if (auto* b = get_if<value_bytes>()) return b->get().size();
        return 0;
    }
};

/// Structural equality; object field order is significant
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Type aliases for the thread-safe policy
// ============================================================

using ValueBox    = BasicValueBox<thread_safe_memory_policy>;
using ValueArray  = BasicValueArray<thread_safe_memory_policy>;
using ValueBytes  = BasicValueBytes<thread_safe_memory_policy>;
using ObjectEntry = BasicObjectEntry<thread_safe_memory_policy>;

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

extern template struct BasicValue<thread_safe_memory_policy>;
extern template class BasicValueObject<thread_safe_memory_policy>;
extern template struct BasicObjectEntry<thread_safe_memory_policy>;

} // namespace tagwire
