#pragma once

/// @file preview.hpp
/// @brief Helpers shared by the document inspection tools.

#include "../json_pointer.hpp"
#include "../value.hpp"
#include "utf8.hpp"

#include <string>
#include <string_view>

namespace patchguard::detail {

/// Coarse type name: null, boolean, number, string, array or object.
[[nodiscard]] inline const char* describe_type(const JsonValue& v) noexcept {
    switch (v.type()) {
        case Type::Null:    return "null";
        case Type::Bool:    return "boolean";
        case Type::Integer:
        case Type::Float:   return "number";
        case Type::String:  return "string";
        case Type::Array:   return "array";
        case Type::Object:  return "object";
    }
    return "null";
}

/// First @p max_len code points of @p s followed by @p suffix when longer.
[[nodiscard]] inline std::string clip(std::string_view s, size_t max_len, std::string_view suffix) {
    if (utf8::length(s) <= max_len) return std::string(s);
    std::string out(utf8::prefix(s, max_len));
    out += suffix;
    return out;
}

/// "/a/b" + token, with the token escaped.
[[nodiscard]] inline std::string join_pointer(std::string_view base, std::string_view token) {
    std::string out(base);
    out += '/';
    out += JsonPointer::escape(token);
    return out;
}

} // namespace patchguard::detail
