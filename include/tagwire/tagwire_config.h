// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tagwire_config.h
/// @brief Centralized configuration for tagwire and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by tagwire:
///   - immer: Persistent containers backing Value arrays and objects
///   - boost: Hana (record projection), Lockfree (buffer pool), Endian, Uuid
///
/// and the codec limits that are fixed at build time.
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All tagwire public headers already include this file, so users who only use
/// tagwire headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================
// Ensure this file is included before any immer header

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(TAGWIRE_CONFIGURED)
#error "immer headers were included before tagwire/tagwire_config.h. " \
       "Please include tagwire headers before any direct immer includes."
#endif

#define TAGWIRE_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep atomic reference counting enabled
///
/// Encode and decode may run concurrently on different threads, and decoded
/// value trees are routinely handed to other threads, so Value relies on
/// immer's default (thread-safe) memory policy.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking (MSVC). tagwire only uses header-only
/// Boost libraries.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Codec Limits
// ============================================================

/// @brief Maximum nesting depth of arrays/objects accepted by the decoder
///
/// Deeper input is rejected with a FramingError instead of recursing until
/// the stack is exhausted.
#ifndef TAGWIRE_MAX_NESTING_DEPTH
#define TAGWIRE_MAX_NESTING_DEPTH 256
#endif

/// @brief Number of idle scratch buffers retained by a BufferPool
#ifndef TAGWIRE_POOL_CAPACITY
#define TAGWIRE_POOL_CAPACITY 16
#endif

/// @brief Initial capacity of a scratch buffer, also the chunk size used by
/// the compression stage
#ifndef TAGWIRE_SCRATCH_BUFFER_SIZE
#define TAGWIRE_SCRATCH_BUFFER_SIZE 8192
#endif

/// @brief Buffers that grew beyond this capacity are freed instead of pooled
#ifndef TAGWIRE_MAX_RETAINED_BUFFER
#define TAGWIRE_MAX_RETAINED_BUFFER (4u * 1024u * 1024u)
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef TAGWIRE_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("tagwire: immer thread safety DISABLED (Value must not cross threads)")
#else
#pragma message("tagwire: immer thread safety ENABLED")
#endif

#if BOOST_ALL_NO_LIB
#pragma message("tagwire: Boost auto-linking DISABLED")
#endif
#endif // TAGWIRE_CONFIG_VERBOSE
