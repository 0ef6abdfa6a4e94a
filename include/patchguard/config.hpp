#pragma once

/// @file config.hpp
/// @brief Configuration macros for the patchguard library.
///
/// Controls:
///   - Library version
///   - Branch prediction hints
///   - Recursion depth limit for the parser
///   - `$ref` hop limit for schema resolution
///   - Regex input length cap and schema candidate cap

// =====================================================================
// Version
// =====================================================================

#define PATCHGUARD_VERSION_MAJOR 1
#define PATCHGUARD_VERSION_MINOR 0
#define PATCHGUARD_VERSION_PATCH 0

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define PATCHGUARD_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define PATCHGUARD_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define PATCHGUARD_LIKELY(x)   (x)
    #define PATCHGUARD_UNLIKELY(x) (x)
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================

#if !defined(PATCHGUARD_MAX_DEPTH)
    #define PATCHGUARD_MAX_DEPTH 512
#endif

// =====================================================================
// Maximum number of `$ref` indirections followed in one resolution chain
// =====================================================================
// Also bounds how many times the same `$ref` may be expanded while
// inlining a recursive schema.

#if !defined(PATCHGUARD_MAX_REF_HOPS)
    #define PATCHGUARD_MAX_REF_HOPS 10
#endif

// =====================================================================
// Longest string handed to std::regex
// =====================================================================
// The standard library matcher recurses per input character, so longer
// strings are never run through a regex. Format checks treat them as
// non-matching and `pattern` reports them as unchecked.

#if !defined(PATCHGUARD_MAX_REGEX_INPUT)
    #define PATCHGUARD_MAX_REGEX_INPUT 8192
#endif

// =====================================================================
// Maximum number of candidate schemas tracked at one pointer
// =====================================================================
// Bounds the `anyOf` fan-out of candidates_at_pointer.

#if !defined(PATCHGUARD_MAX_CANDIDATES)
    #define PATCHGUARD_MAX_CANDIDATES 64
#endif
