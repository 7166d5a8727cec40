// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging used by the codec and the transform stages.
///
/// ============================================================
/// Verbose Logging Configuration
///
/// When TAGWIRE_VERBOSE_LOG is non-zero:
///   - encode/decode report buffer sizes at debug level
///   - every failure is reported before the exception propagates
///
/// By default, verbose logging is DISABLED in release builds
/// and ENABLED in debug builds.
///
/// To explicitly enable: #define TAGWIRE_VERBOSE_LOG 1
/// To explicitly disable: #define TAGWIRE_VERBOSE_LOG 0
/// ============================================================

#pragma once

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

#ifndef TAGWIRE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define TAGWIRE_VERBOSE_LOG 0
#  else
#    define TAGWIRE_VERBOSE_LOG 1
#  endif
#endif

namespace tagwire {

namespace detail {

inline void log_debug(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TAGWIRE_VERBOSE_LOG
    std::clog << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TAGWIRE_VERBOSE_LOG
    std::cerr << "[" << func << "] error: " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_size_change(
    std::string_view func,
    std::string_view what,
    std::size_t from,
    std::size_t to,
    std::source_location loc = std::source_location::current()) noexcept
{
#if TAGWIRE_VERBOSE_LOG
    std::clog << "[" << func << "] " << what << " " << from << " bytes to " << to << " bytes"
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)what;
    (void)from;
    (void)to;
    (void)loc;
#endif
}

} // namespace detail

} // namespace tagwire
