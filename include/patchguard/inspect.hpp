#pragma once

/// @file inspect.hpp
/// @brief inspect_keys(): a shallow, size-limited summary of the value at a pointer.
///
/// The pointer is parsed leniently (missing leading '/' supplied, tokens
/// optionally percent-decoded). A path that does not resolve is not an
/// error: the result reports `found: false` with the deepest container
/// reached and what it holds, so the caller can correct the path.

#include "detail/preview.hpp"
#include "json_pointer.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <string_view>

namespace patchguard {

struct InspectOptions {
    size_t max_keys = 50;
    size_t max_array_items = 20;
    size_t max_string_length = 300;
    size_t max_depth_preview = 2;
    bool include_value = true;
    bool try_url_decode = true;
};

namespace detail {

inline JsonValue preview_primitive(const JsonValue& v, const InspectOptions& opts) {
    if (v.is_string()) return clip(v.as_string(), opts.max_string_length,
                                   fmt::format("…(truncated, len={})", utf8::length(v.as_string())));
    return v;
}

inline JsonValue leaf_entry(const JsonValue& v, const InspectOptions& opts) {
    JsonValue entry = JsonValue::object();
    entry["type"] = describe_type(v);
    if (!v.is_container() && opts.include_value) entry["valuePreview"] = preview_primitive(v, opts);
    return entry;
}

/// Summary fields merged into a found result.
inline void summarize(const JsonValue& value, const InspectOptions& opts, size_t depth, JsonValue& out) {
    out["type"] = describe_type(value);
    if (!value.is_container()) {
        if (opts.include_value) out["valuePreview"] = preview_primitive(value, opts);
        return;
    }

    if (value.is_array()) {
        const auto& arr = value.as_array();
        out["length"] = arr.size();
        if (depth >= opts.max_depth_preview) {
            out["itemsPreview"] = fmt::format("[preview depth limit {}]", opts.max_depth_preview);
            return;
        }
        const size_t take = std::min(arr.size(), opts.max_array_items);
        Array items;
        for (size_t i = 0; i < take; ++i) {
            JsonValue entry = leaf_entry(arr[i], opts);
            JsonValue indexed = JsonValue::object();
            indexed["index"] = i;
            for (auto& [k, v] : entry.as_object()) indexed[k] = std::move(v);
            items.push_back(std::move(indexed));
        }
        out["previewCount"] = take;
        out["truncated"] = take < arr.size();
        out["itemsPreview"] = std::move(items);
        return;
    }

    const auto& obj = value.as_object();
    const size_t take = std::min(obj.size(), opts.max_keys);
    Array keys;
    JsonValue shallow = nullptr;
    if (depth < opts.max_depth_preview) shallow = JsonValue::object();
    size_t i = 0;
    for (const auto& [key, val] : obj) {
        if (i++ >= take) break;
        keys.emplace_back(key);
        if (shallow.is_object()) shallow[key] = leaf_entry(val, opts);
    }
    out["count"] = obj.size();
    out["previewCount"] = take;
    out["truncated"] = take < obj.size();
    out["keysPreview"] = std::move(keys);
    out["shallowPreview"] = std::move(shallow);
}

inline JsonValue not_found(std::string_view pointer, const std::string& at, std::string message) {
    JsonValue r = JsonValue::object();
    r["ok"] = true;
    r["found"] = false;
    r["pointer"] = pointer;
    r["atPointer"] = at;
    r["message"] = std::move(message);
    return r;
}

} // namespace detail

/// @brief Summarize the value at @p pointer in @p doc.
///
/// Found: `{ok, found: true, pointer, resolvedPointer, type, ...}` where an
/// array adds `length, previewCount, truncated, itemsPreview`, an object
/// `count, previewCount, truncated, keysPreview, shallowPreview`, and a
/// scalar `valuePreview`.
/// Not found: `{ok, found: false, pointer, atPointer, message, ...}` plus
/// `containerType`/`containerLength` (arrays),
/// `containerType`/`availableKeysPreview`/`availableKeysTruncated`
/// (objects) or `encounteredType` (scalars).
[[nodiscard]] inline JsonValue inspect_keys(const JsonValue& doc, std::string_view pointer = "",
                                            const InspectOptions& opts = {}) {
    using namespace detail;
    const JsonPointer ptr = JsonPointer::parse_lenient(pointer, opts.try_url_decode);

    const JsonValue* current = &doc;
    std::string walked;
    for (const auto& token : ptr.tokens()) {
        const std::string next = join_pointer(walked, token);
        if (current->is_array()) {
            const size_t len = current->size();
            const auto idx = JsonPointer::parse_canonical_index(token);
            if (!idx || *idx >= len) {
                JsonValue r = not_found(pointer, next,
                    idx ? fmt::format("The index is out of range: {} (len={}).", *idx, len)
                        : fmt::format("Expected a numeric index for array, but received token '{}'.", token));
                r["containerType"] = "array";
                r["containerLength"] = len;
                return r;
            }
            current = &current->as_array()[*idx];
        } else if (current->is_object()) {
            const JsonValue* child = current->find(token);
            if (!child) {
                const auto& obj = current->as_object();
                const size_t take = std::min(obj.size(), opts.max_keys);
                Array keys;
                size_t i = 0;
                for (const auto& [key, val] : obj) {
                    if (i++ >= take) break;
                    keys.emplace_back(key);
                }
                JsonValue r = not_found(pointer, next, fmt::format("The key was not found: '{}'.", token));
                r["containerType"] = "object";
                r["availableKeysPreview"] = std::move(keys);
                r["availableKeysTruncated"] = take < obj.size();
                return r;
            }
            current = child;
        } else {
            const char* type = describe_type(*current);
            JsonValue r = not_found(pointer, walked.empty() ? std::string("/") : walked,
                fmt::format("It's not possible to navigate inside a value of type '{}'.", type));
            r["encounteredType"] = type;
            return r;
        }
        walked = next;
    }

    JsonValue result = JsonValue::object();
    result["ok"] = true;
    result["found"] = true;
    result["pointer"] = pointer;
    result["resolvedPointer"] = pointer.empty() ? std::string_view("/") : pointer;
    summarize(*current, opts, 0, result);
    return result;
}

} // namespace patchguard
