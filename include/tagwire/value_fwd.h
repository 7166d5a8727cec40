// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value and Builder types
///
/// This header lets other headers declare functions taking or returning Value
/// without pulling in immer through value.h.
///
/// Usage:
/// @code
///   // In header file:
///   #include <tagwire/value_fwd.h>
///   TypeDescriptor infer(const Value& value);     // forward declaration is enough
///
///   // In implementation file:
///   #include <tagwire/value.h>
/// @endcode

#pragma once

#include "tagwire_config.h"

#include <immer/memory_policy.hpp>

#include <cstdint>
#include <vector>

namespace tagwire {

/// Atomic refcount + thread-safe free list; Value trees may cross threads
using thread_safe_memory_policy = immer::default_memory_policy;

/// Byte buffer type used for envelopes and Bytes values
using ByteBuffer = std::vector<std::uint8_t>;

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
class BasicValueObject;

using Value = BasicValue<thread_safe_memory_policy>;
using ValueObject = BasicValueObject<thread_safe_memory_policy>;

template <typename MemoryPolicy>
class BasicObjectBuilder;
template <typename MemoryPolicy>
class BasicArrayBuilder;

using ObjectBuilder = BasicObjectBuilder<thread_safe_memory_policy>;
using ArrayBuilder = BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace tagwire
