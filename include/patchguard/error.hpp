#pragma once

/// @file error.hpp
/// @brief Error types for patchguard: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError, OutOfRangeError, PointerError,
///     PatchOpError (thrown by the low-level building blocks)
///   - Via error_code: patchguard::errc enum + patchguard_category()
///
/// The batch entry points (apply_patches, submit_patches) never throw:
/// every failure is turned into a PatchError record in the result.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace patchguard {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief Error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_escape          = 3,
    invalid_unicode_escape  = 4,
    invalid_number          = 5,
    unterminated_string     = 6,
    trailing_content        = 7,
    max_depth_exceeded      = 8,
    invalid_literal         = 9,
    invalid_comment         = 10,

    // Value access errors (50-79)
    type_mismatch           = 50,
    out_of_range            = 51,
    key_not_found           = 52,

    // Pointer errors (80-99)
    invalid_pointer         = 80,
    pointer_not_found       = 81,
    invalid_array_index     = 82,

    // Patch operation errors (100-119)
    invalid_operation       = 100,
    unsupported_operation   = 101,
    test_failed             = 102,

    // Schema errors (120-139)
    schema_violation        = 120,
    unresolved_ref          = 121,

    // Guard rejections (140-159)
    guard_rejected          = 140,
    shrinkage_detected      = 141,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class patchguard_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "patchguard";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected end of input";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_escape:          return "invalid escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_number:          return "invalid number";
            case errc::unterminated_string:     return "unterminated string";
            case errc::trailing_content:        return "trailing content after JSON";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::invalid_literal:         return "invalid literal";
            case errc::invalid_comment:         return "invalid comment";
            case errc::type_mismatch:           return "type mismatch";
            case errc::out_of_range:            return "index out of range";
            case errc::key_not_found:           return "key not found";
            case errc::invalid_pointer:         return "invalid JSON pointer";
            case errc::pointer_not_found:       return "path does not exist";
            case errc::invalid_array_index:     return "invalid array index";
            case errc::invalid_operation:       return "invalid patch operation";
            case errc::unsupported_operation:   return "operation not supported";
            case errc::test_failed:             return "test operation failed";
            case errc::schema_violation:        return "schema violation";
            case errc::unresolved_ref:          return "unresolved $ref";
            case errc::guard_rejected:          return "rejected by guard";
            case errc::shrinkage_detected:      return "document shrinkage detected";
            default:                            return "unknown patchguard error";
        }
    }
};

} // namespace detail

/// @brief Get the patchguard error category singleton.
inline const std::error_category& patchguard_category() noexcept {
    static const detail::patchguard_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from patchguard::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), patchguard_category()};
}

/// @brief Create an error_condition from patchguard::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), patchguard_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON parse error with source position information.
class ParseError : public std::system_error {
public:
    ParseError(const std::string& message, SourceLocation loc,
               errc code = errc::unexpected_character)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON parse error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) + ": " + msg;
    }

    SourceLocation location_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

/// @brief Malformed or unresolvable JSON Pointer.
///
/// what() is exactly the diagnostic text, without the category suffix,
/// so it can be relayed verbatim in a PatchError message.
class PointerError : public std::system_error {
public:
    PointerError(const std::string& msg, errc code = errc::invalid_pointer)
        : std::system_error(make_error_code(code), msg), message_(msg) {}

    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

/// @brief Structurally invalid or failed patch operation.
class PatchOpError : public std::system_error {
public:
    PatchOpError(const std::string& msg, errc code = errc::invalid_operation)
        : std::system_error(make_error_code(code), msg), message_(msg) {}

    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = patchguard::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace patchguard

// Register patchguard::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<patchguard::errc> : true_type {};
} // namespace std
