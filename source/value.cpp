// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Timestamp/Guid helpers and explicit template instantiations

#include <tagwire/value.h>
#include <tagwire/builders.h>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace tagwire {

namespace {

using tick_duration = std::chrono::duration<int64_t, std::ratio<1, Timestamp::ticks_per_second>>;

template <typename Float>
std::string format_shortest(Float value) {
    if (!std::isfinite(value)) return "null";

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) return "null";

    std::string result(buf, end);
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

// Reads exactly `width` decimal digits
bool read_digits(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size()) return false;
    const char* first = text.data() + pos;
    auto [end, ec] = std::from_chars(first, first + width, out);
    if (ec != std::errc{} || end != first + width) return false;
    pos += width;
    return true;
}

bool expect_char(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // anonymous namespace

namespace detail {

std::string format_number(double value) {
    return format_shortest(value);
}

std::string format_number(float value) {
    return format_shortest(value);
}

} // namespace detail

// ============================================================
// Timestamp
// ============================================================

Timestamp Timestamp::now() {
    return from_time_point(std::chrono::system_clock::now());
}

Timestamp Timestamp::from_time_point(std::chrono::system_clock::time_point tp) {
    auto since_unix = std::chrono::floor<tick_duration>(tp.time_since_epoch());
    return Timestamp{unix_epoch_ticks + since_unix.count()};
}

std::chrono::system_clock::time_point Timestamp::to_time_point() const {
    using clock_duration = std::chrono::system_clock::duration;

    constexpr auto lowest = std::chrono::ceil<tick_duration>(clock_duration::min());
    constexpr auto highest = std::chrono::floor<tick_duration>(clock_duration::max());
    if (!is_representable()) {
        throw std::out_of_range("Timestamp out of range: " + std::to_string(ticks) + " ticks");
    }
    tick_duration since_unix{ticks - unix_epoch_ticks};
    if (since_unix < lowest || since_unix > highest) {
        throw std::out_of_range("Timestamp out of range for system_clock: " + to_iso8601());
    }
    return std::chrono::system_clock::time_point{
        std::chrono::floor<std::chrono::system_clock::duration>(since_unix)};
}

std::string Timestamp::to_iso8601() const {
    using namespace std::chrono;

    if (!is_representable()) {
        return std::to_string(ticks);
    }
    tick_duration since_unix{ticks - unix_epoch_ticks};
    auto day_count = floor<days>(since_unix);
    year_month_day ymd{sys_days{day_count}};
    hh_mm_ss<tick_duration> tod{since_unix - day_count};

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%07lldZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<long long>(tod.subseconds().count()));
    return buf;
}

std::optional<Timestamp> Timestamp::parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    std::size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, pos, 4, y) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, mo) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, d)) {
        return std::nullopt;
    }
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!read_digits(text, pos, 2, h) || !expect_char(text, pos, ':') ||
            !read_digits(text, pos, 2, mi) || !expect_char(text, pos, ':') ||
            !read_digits(text, pos, 2, s)) {
            return std::nullopt;
        }
    }

    int64_t fraction = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 7) {
                fraction = fraction * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 7; ++digits) fraction *= 10;
    }

    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (text.substr(pos) == "+00:00") {
        pos += 6;
    }
    if (pos != text.size()) return std::nullopt;

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || y < 1 || h > 23 || mi > 59 || s > 59) return std::nullopt;

    auto since_unix = duration_cast<tick_duration>(sys_days{ymd}.time_since_epoch()) +
                      duration_cast<tick_duration>(hours{h} + minutes{mi} + seconds{s}) +
                      tick_duration{fraction};
    return Timestamp{unix_epoch_ticks + since_unix.count()};
}

// ============================================================
// Guid
// ============================================================

Guid Guid::generate() {
    thread_local boost::uuids::random_generator generator;
    boost::uuids::uuid id = generator();
    Guid result;
    std::copy(id.begin(), id.end(), result.bytes.begin());
    return result;
}

std::optional<Guid> Guid::parse(std::string_view text) {
    boost::uuids::uuid id;
    try {
        id = boost::uuids::string_generator{}(text.begin(), text.end());
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    Guid result;
    std::copy(id.begin(), id.end(), result.bytes.begin());
    return result;
}

std::string Guid::to_string() const {
    boost::uuids::uuid id;
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return boost::uuids::to_string(id);
}

bool Guid::is_nil() const noexcept {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the code for the templated classes that
// are declared with 'extern template' in value.h and builders.h.
// ============================================================

template struct BasicValue<thread_safe_memory_policy>;
template class BasicValueObject<thread_safe_memory_policy>;
template struct BasicObjectEntry<thread_safe_memory_policy>;
template class BasicObjectBuilder<thread_safe_memory_policy>;
template class BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace tagwire
