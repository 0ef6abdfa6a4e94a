#pragma once

/// @file parse_options.hpp
/// @brief Non-standard JSON parser extension options.
///
/// Patch batches and schemas often arrive from generated text, so two
/// common deviations can be tolerated:
///   - C/C++ style comments (// and /* */)
///   - Trailing commas in arrays and objects

#include <cstddef>

namespace patchguard {

/// @brief Parser configuration for standard and lenient JSON.
struct ParseOptions {
    /// Allow C/C++ comments: // line, /* block */
    bool allow_comments         = false;

    /// Allow trailing commas: [1,2,3,] and {"a":1,"b":2,}
    bool allow_trailing_commas  = false;

    /// Maximum nesting depth (0 = use PATCHGUARD_MAX_DEPTH)
    size_t max_depth = 0;

    /// Strict JSON (RFC 8259), all extensions disabled.
    static constexpr ParseOptions strict() noexcept {
        return {};
    }

    /// Lenient mode: comments and trailing commas accepted.
    static constexpr ParseOptions lenient() noexcept {
        ParseOptions opts;
        opts.allow_comments        = true;
        opts.allow_trailing_commas = true;
        return opts;
    }
};

} // namespace patchguard
