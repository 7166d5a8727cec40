// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// api.h - DLL export/import macros for tagwire

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the tagwire library.
///
/// Usage:
/// - When building tagwire as a SHARED library:
///   - CMake defines TAGWIRE_EXPORTS (private) and TAGWIRE_SHARED (public)
///   - Functions/classes marked with TAGWIRE_API will be exported
///
/// - When using tagwire as a SHARED library:
///   - Link against the tagwire target (CMake propagates TAGWIRE_SHARED)
///   - Functions/classes marked with TAGWIRE_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, TAGWIRE_API expands to nothing
///
/// Example:
/// @code
/// class TAGWIRE_API Serializer { ... };          // Export entire class
/// TAGWIRE_API ByteBuffer compress(...);          // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    // Windows platform (MSVC, MinGW, Clang-CL)
    #ifdef TAGWIRE_SHARED
        #ifdef TAGWIRE_EXPORTS
            // Building the DLL: export symbols
            #define TAGWIRE_API __declspec(dllexport)
        #else
            // Using the DLL: import symbols
            #define TAGWIRE_API __declspec(dllimport)
        #endif
    #else
        // Static library: no decoration needed
        #define TAGWIRE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang on Unix-like platforms
    #if defined(TAGWIRE_SHARED) && defined(TAGWIRE_EXPORTS)
        // Building shared library: set default visibility
        #define TAGWIRE_API __attribute__((visibility("default")))
    #else
        // Static library or using shared library
        #define TAGWIRE_API
    #endif
#else
    // Unknown compiler: no decoration
    #define TAGWIRE_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define TAGWIRE_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define TAGWIRE_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define TAGWIRE_DEPRECATED(msg)
#endif
