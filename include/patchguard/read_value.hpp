#pragma once

/// @file read_value.hpp
/// @brief read_value(): the value at a pointer, trimmed to size limits.
///
/// Strings are cut to `max_string_length` code points plus "…", arrays
/// and objects to their first `max_array_items` / `max_object_keys`
/// entries, and containers nested deeper than `max_depth` become the
/// string "[MaxDepth]". Every cut is reported in `notes` and
/// `valueTruncated`.

#include "detail/preview.hpp"
#include "json_pointer.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace patchguard {

struct ReadOptions {
    size_t max_string_length = 160;
    size_t max_depth = 6;
    size_t max_array_items = 50;
    size_t max_object_keys = 50;
};

namespace detail {

struct Sanitized {
    JsonValue value;
    bool truncated = false;
    std::vector<std::string> notes;
    JsonValue stats;
};

inline Sanitized sanitize(const JsonValue& v, const ReadOptions& opts, size_t depth) {
    Sanitized out;
    out.stats = JsonValue::object();
    out.stats["type"] = describe_type(v);

    if (v.is_string()) {
        const std::string& s = v.as_string();
        const size_t len = utf8::length(s);
        if (len > opts.max_string_length) {
            out.value = clip(s, opts.max_string_length, "…");
            out.truncated = true;
            out.notes.push_back(fmt::format("String truncated to max_string_length={}", opts.max_string_length));
            out.stats["originalLength"] = len;
        } else {
            out.value = v;
            out.stats["length"] = len;
        }
        return out;
    }
    if (!v.is_container()) {
        out.value = v;
        return out;
    }
    if (depth >= opts.max_depth) {
        out.value = "[MaxDepth]";
        out.truncated = true;
        out.notes.push_back(fmt::format("Max depth reached (max_depth={}); replaced with '[MaxDepth]'", opts.max_depth));
        return out;
    }

    bool nested_changed = false;
    auto take_child = [&](const JsonValue& child) {
        Sanitized c = sanitize(child, opts, depth + 1);
        if (c.truncated || !c.notes.empty()) nested_changed = true;
        if (c.truncated) out.truncated = true;
        return std::move(c.value);
    };

    if (v.is_array()) {
        const auto& arr = v.as_array();
        const size_t take = std::min(arr.size(), opts.max_array_items);
        Array items;
        items.reserve(take);
        for (size_t i = 0; i < take; ++i) items.push_back(take_child(arr[i]));
        if (arr.size() > opts.max_array_items) {
            out.truncated = true;
            out.notes.push_back(fmt::format("Array truncated to max_array_items={}", opts.max_array_items));
        }
        out.stats["originalLength"] = arr.size();
        out.stats["returnedLength"] = items.size();
        out.value = std::move(items);
    } else {
        const auto& obj = v.as_object();
        const size_t take = std::min(obj.size(), opts.max_object_keys);
        Object members;
        size_t i = 0;
        for (const auto& [key, val] : obj) {
            if (i++ >= take) break;
            members.insert(key, take_child(val));
        }
        if (obj.size() > opts.max_object_keys) {
            out.truncated = true;
            out.notes.push_back(fmt::format("Object truncated to max_object_keys={}", opts.max_object_keys));
        }
        out.stats["originalKeyCount"] = obj.size();
        out.stats["returnedKeyCount"] = take;
        out.value = std::move(members);
    }
    if (nested_changed) {
        out.notes.emplace_back("Nested values were sanitized/truncated for JSON safety");
        out.truncated = true;
    }
    return out;
}

inline JsonValue read_error(std::string_view path, std::string message) {
    JsonValue r = JsonValue::object();
    r["found"] = false;
    r["error"] = std::move(message);
    r["path"] = path;
    return r;
}

} // namespace detail

/// @brief Read the value at @p path.
///
/// Found: `{found: true, path, valueType, value, valueTruncated, notes,
/// stats, limits}`. Otherwise `{found: false, error, path}`. The path is
/// parsed leniently; tokens are not percent-decoded.
[[nodiscard]] inline JsonValue read_value(const JsonValue& doc, std::string_view path,
                                          const ReadOptions& opts = {}) {
    using namespace detail;
    const JsonPointer ptr = JsonPointer::parse_lenient(path, false);

    const JsonValue* cur = &doc;
    const auto& tokens = ptr.tokens();
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        if (cur->is_null()) {
            return read_error(path, fmt::format(
                "Cannot traverse '{}': encountered null at token index {}", tok, i));
        }
        if (cur->is_array()) {
            if (tok == "-")
                return read_error(path, "Invalid array index '-': not readable for read_value");
            const auto idx = JsonPointer::parse_canonical_index(tok);
            if (!idx)
                return read_error(path, fmt::format("Invalid array index token '{}' at token index {}", tok, i));
            if (*idx >= cur->size())
                return read_error(path, fmt::format("Array index out of range: {} (length {})", *idx, cur->size()));
            cur = &cur->as_array()[*idx];
        } else if (cur->is_object()) {
            const JsonValue* child = cur->find(tok);
            if (!child)
                return read_error(path, fmt::format("Property not found: '{}' at token index {}", tok, i));
            cur = child;
        } else {
            return read_error(path, fmt::format(
                "Cannot traverse into non-container type '{}' at token index {}", describe_type(*cur), i));
        }
    }

    Sanitized s = sanitize(*cur, opts, 0);
    JsonValue result = JsonValue::object();
    result["found"] = true;
    result["path"] = path;
    result["valueType"] = describe_type(*cur);
    result["value"] = std::move(s.value);
    result["valueTruncated"] = s.truncated;
    Array notes;
    for (auto& n : s.notes) notes.emplace_back(std::move(n));
    result["notes"] = std::move(notes);
    result["stats"] = std::move(s.stats);
    JsonValue limits = JsonValue::object();
    limits["max_string_length"] = opts.max_string_length;
    limits["max_depth"] = opts.max_depth;
    limits["max_array_items"] = opts.max_array_items;
    limits["max_object_keys"] = opts.max_object_keys;
    result["limits"] = std::move(limits);
    return result;
}

} // namespace patchguard
