// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file projection.h
/// @brief Mapping between C++ records and field maps (Boost.Hana).
///
/// A record is any struct adapted with BOOST_HANA_ADAPT_STRUCT or declared
/// with BOOST_HANA_DEFINE_STRUCT. Projection is one level deep:
/// - members of a registered kind become that kind
/// - members of any other type (int16_t, float, nested records, ...) become
///   Opaque values carrying their JSON text
///
/// Usage:
/// @code
///   struct Person {
///       BOOST_HANA_DEFINE_STRUCT(Person,
///           (std::string, name),
///           (int32_t, age),
///           (int16_t, level)
///       );
///   };
///
///   ByteBuffer bytes = encode_record(Person{"Ann", 30, 7});
///   Person p = decode_record<Person>(bytes);
/// @endcode
///
/// from_field_map() is best-effort: a member whose field is absent or cannot
/// be converted keeps its default-constructed value.

#pragma once

#include "builders.h"
#include "json.h"
#include "log.h"
#include "options.h"
#include "serializer.h"
#include "value.h"

#include <boost/hana/accessors.hpp>
#include <boost/hana/concept/struct.hpp>
#include <boost/hana/core/to.hpp>
#include <boost/hana/first.hpp>
#include <boost/hana/for_each.hpp>
#include <boost/hana/second.hpp>
#include <boost/hana/string.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <type_traits>

namespace tagwire {

template <typename T>
concept Record = boost::hana::Struct<std::remove_cvref_t<T>>::value;

template <Record T>
[[nodiscard]] ValueObject to_field_map(const T& record);

template <Record T>
[[nodiscard]] T from_field_map(const ValueObject& fields);

/// Records nested inside a record are carried as Opaque values
template <typename T>
struct OpaqueTraits<T, std::enable_if_t<boost::hana::Struct<T>::value>> {
    static std::string type_name() { return detail::runtime_type_name<T>(); }
    static std::string to_text(const T& record) { return to_json(Value{to_field_map(record)}); }
};

namespace detail {

template <typename M>
std::optional<M> convert_to(const Value& value);

template <typename M>
std::optional<M> convert_number(const Value& value) {
    try {
        if (auto* i = value.get_if<int32_t>()) return boost::numeric_cast<M>(*i);
        if (auto* l = value.get_if<int64_t>()) return boost::numeric_cast<M>(*l);
        if (auto* d = value.get_if<double>()) {
            if (std::is_integral_v<M> && !std::isfinite(*d)) return std::nullopt;
            return boost::numeric_cast<M>(*d);
        }
    } catch (const boost::numeric::bad_numeric_cast&) {
        return std::nullopt;
    }
    if (auto* b = value.get_if<bool>()) return static_cast<M>(*b ? 1 : 0);

    const std::string* text = value.get_if<std::string>();
    if (auto* o = value.get_if<Opaque>()) text = &o->text;
    if (text) {
        M out{};
        if (boost::conversion::try_lexical_convert(*text, out)) return out;
    }
    return std::nullopt;
}

inline std::optional<bool> convert_bool(const Value& value) {
    if (auto* b = value.get_if<bool>()) return *b;
    if (auto* s = value.get_if<std::string>()) {
        if (*s == "true" || *s == "True") return true;
        if (*s == "false" || *s == "False") return false;
    }
    return std::nullopt;
}

inline std::optional<std::string> convert_string(const Value& value) {
    switch (value.kind()) {
        case ValueKind::String:    return *value.get_if<std::string>();
        case ValueKind::Opaque:    return value.get_if<Opaque>()->text;
        case ValueKind::Timestamp: return value.get_if<Timestamp>()->to_iso8601();
        case ValueKind::Guid:      return value.get_if<Guid>()->to_string();
        case ValueKind::Int32:
        case ValueKind::Int64:
        case ValueKind::Double:
        case ValueKind::Bool:      return to_json(value);
        default:                   return std::nullopt;
    }
}

template <Record M>
std::optional<M> convert_record(const Value& value) {
    if (auto* obj = value.get_if<ValueObject>()) return from_field_map<M>(*obj);
    // Opaque text kept as-is (OpaqueMode::Preserve)
    if (auto* o = value.get_if<Opaque>()) {
        if (auto parsed = try_parse_json(o->text)) {
            if (auto* obj = parsed->get_if<ValueObject>()) return from_field_map<M>(*obj);
        }
    }
    return std::nullopt;
}

/// Best-effort conversion of a field value to a member of type M
template <typename M>
std::optional<M> convert_to(const Value& value) {
    if constexpr (std::is_same_v<M, Value>) {
        return value;
    } else if constexpr (Record<M>) {
        return convert_record<M>(value);
    } else if constexpr (std::is_same_v<M, bool>) {
        return convert_bool(value);
    } else if constexpr (std::is_arithmetic_v<M>) {
        return convert_number<M>(value);
    } else if constexpr (std::is_same_v<M, std::string>) {
        return convert_string(value);
    } else if constexpr (std::is_same_v<M, Timestamp>) {
        if (auto* t = value.get_if<Timestamp>()) return *t;
        if (auto* l = value.get_if<int64_t>()) return Timestamp{*l};
        if (auto* s = value.get_if<std::string>()) return Timestamp::parse_iso8601(*s);
        return std::nullopt;
    } else if constexpr (std::is_same_v<M, Guid>) {
        if (auto* g = value.get_if<Guid>()) return *g;
        if (auto* s = value.get_if<std::string>()) return Guid::parse(*s);
        return std::nullopt;
    } else if constexpr (std::is_same_v<M, ByteBuffer>) {
        if (auto* b = value.get_if<ValueBytes>()) return b->get();
        return std::nullopt;
    } else if constexpr (std::is_same_v<M, ValueArray> || std::is_same_v<M, ValueObject> ||
                         std::is_same_v<M, Opaque>) {
        if (auto* p = value.get_if<M>()) return *p;
        return std::nullopt;
    } else {
        return std::nullopt;
    }
}

} // namespace detail

// ============================================================
// Record <-> field map
// ============================================================

template <Record T>
ValueObject to_field_map(const T& record) {
    ObjectBuilder builder;
    boost::hana::for_each(boost::hana::accessors<T>(), [&](auto accessor) {
        using Member = std::remove_cvref_t<decltype(boost::hana::second(accessor)(record))>;
        static_assert(std::is_constructible_v<Value, const Member&>,
                      "record member type has neither a registered kind nor an OpaqueTraits specialization");
        builder.set(boost::hana::to<char const*>(boost::hana::first(accessor)),
                    Value{boost::hana::second(accessor)(record)});
    });
    return builder.finish_object();
}

/// A field map projects to itself
[[nodiscard]] inline ValueObject to_field_map(const ValueObject& fields) {
    return fields;
}

template <Record T>
T from_field_map(const ValueObject& fields) {
    T record{};
    boost::hana::for_each(boost::hana::accessors<T>(), [&](auto accessor) {
        const char* name = boost::hana::to<char const*>(boost::hana::first(accessor));
        const auto* box = fields.find(name);
        if (!box) return;

        auto& member = boost::hana::second(accessor)(record);
        using Member = std::remove_cvref_t<decltype(member)>;
        if (auto converted = detail::convert_to<Member>(box->get())) {
            member = std::move(*converted);
        } else {
            detail::log_debug("from_field_map", std::string("field '") + name + "' skipped: not convertible to " +
                                                    detail::runtime_type_name<Member>());
        }
    });
    return record;
}

// ============================================================
// Record-typed codec
// ============================================================

template <Record T>
[[nodiscard]] ByteBuffer encode_record(const T& record, const SerializationOptions& options = {}) {
    return Serializer(options).encode(to_field_map(record));
}

template <Record T>
[[nodiscard]] T decode_record(std::span<const uint8_t> bytes, const SerializationOptions& options = {}) {
    return from_field_map<T>(Serializer(options).decode(bytes));
}

} // namespace tagwire
