#pragma once

/// @file search.hpp
/// @brief search_pointer(): find keys or scalar values in a document and
/// report the JSON Pointers where they occur.
///
/// Matching is exact by default. Fuzzy matching compares ASCII-lowercased,
/// trimmed strings and accepts equality, containment in either direction,
/// or a small Levenshtein distance.

#include "detail/preview.hpp"
#include "value.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchguard {

enum class SearchType : uint8_t { Key, Value };

struct SearchOptions {
    SearchType type = SearchType::Value;
    bool fuzzy = false;
    /// Also return a flat "pointers" array.
    bool include_pointers = false;
    /// Maximum number of matches; nullopt means unlimited.
    std::optional<size_t> limit;
    /// Matched string values longer than this are cut (plus "…").
    size_t max_value_length = 120;
};

namespace detail {

inline std::string normalize_for_match(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    std::string out(s.substr(b, e - b));
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline std::u32string to_code_points(std::string_view s) {
    std::u32string out;
    const char* p = s.data();
    const char* end = p + s.size();
    while (p < end) out.push_back(static_cast<char32_t>(utf8::decode(p, end)));
    return out;
}

/// Edit distance over code points, two-row dynamic programming.
inline size_t levenshtein(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

inline bool fuzzy_match(std::string_view candidate, std::string_view query) {
    const std::string a = normalize_for_match(candidate);
    const std::string b = normalize_for_match(query);
    if (a == b) return true;
    if (a.find(b) != std::string::npos || b.find(a) != std::string::npos) return true;
    const auto ca = to_code_points(a);
    const auto cb = to_code_points(b);
    const size_t max_len = std::max(ca.size(), cb.size());
    if (max_len > 64) return false;
    const size_t min_len = std::min(ca.size(), cb.size());
    const size_t threshold = std::min<size_t>(3, std::max<size_t>(1, static_cast<size_t>(min_len * 0.34)));
    return levenshtein(ca, cb) <= threshold;
}

/// Text a scalar is matched as: strings verbatim, other scalars as JSON.
inline std::string comparable(const JsonValue& v) {
    return v.is_string() ? v.as_string() : v.dump();
}

class PointerSearch {
public:
    PointerSearch(std::string_view query, const SearchOptions& opts) : query_(query), opts_(opts) {}

    void run(const JsonValue& root) { visit(root, ""); }

    [[nodiscard]] JsonValue result() {
        JsonValue r = JsonValue::object();
        const size_t count = matches_.size();
        Array pointers;
        if (opts_.include_pointers)
            for (const auto& m : matches_) pointers.push_back(m["pointer"]);
        r["matches"] = std::move(matches_);
        r["count"] = count;
        r["truncated"] = truncated_;
        r["limit"] = opts_.limit ? JsonValue(*opts_.limit) : JsonValue(nullptr);
        r["max_value_length"] = opts_.max_value_length;
        if (opts_.include_pointers) r["pointers"] = std::move(pointers);
        return r;
    }

private:
    std::string query_;
    const SearchOptions& opts_;
    Array matches_;
    bool truncated_ = false;

    [[nodiscard]] bool full() const { return opts_.limit && matches_.size() >= *opts_.limit; }

    [[nodiscard]] bool matches(std::string_view candidate) const {
        return opts_.fuzzy ? fuzzy_match(candidate, query_) : candidate == query_;
    }

    /// Record a match, or flag truncation when the limit is already reached.
    bool accept() {
        if (!full()) return true;
        truncated_ = true;
        return false;
    }

    void collect_key(const std::string& key, const std::string& ptr) {
        if (opts_.type != SearchType::Key || !matches(key) || !accept()) return;
        JsonValue m = JsonValue::object();
        m["pointer"] = ptr;
        m["kind"] = "key";
        m["key"] = key;
        matches_.push_back(std::move(m));
    }

    void collect_value(const JsonValue& v, const std::string& ptr) {
        if (opts_.type != SearchType::Value || v.is_container()) return;
        if (!matches(comparable(v)) || !accept()) return;
        JsonValue m = JsonValue::object();
        m["pointer"] = ptr;
        m["kind"] = "value";
        bool cut = false;
        if (v.is_string() && utf8::length(v.as_string()) > opts_.max_value_length) {
            m["value"] = clip(v.as_string(), opts_.max_value_length, "…");
            cut = true;
        } else {
            m["value"] = v;
        }
        m["valueType"] = describe_type(v);
        m["valueTruncated"] = cut;
        matches_.push_back(std::move(m));
    }

    void visit(const JsonValue& node, const std::string& ptr) {
        if (truncated_) return;
        if (node.is_array()) {
            const auto& arr = node.as_array();
            for (size_t i = 0; i < arr.size() && !truncated_; ++i) {
                const std::string child = join_pointer(ptr, std::to_string(i));
                collect_value(arr[i], child);
                visit(arr[i], child);
            }
        } else if (node.is_object()) {
            for (const auto& [key, val] : node.as_object()) {
                if (truncated_) break;
                const std::string child = join_pointer(ptr, key);
                collect_key(key, child);
                collect_value(val, child);
                visit(val, child);
            }
        }
    }
};

} // namespace detail

/// @brief Search @p doc for @p query.
///
/// Returns `{matches, count, truncated, limit, max_value_length}` (plus
/// `pointers` when requested). A key match is `{pointer, kind: "key", key}`,
/// a value match `{pointer, kind: "value", value, valueType,
/// valueTruncated}`. Traversal is depth-first in document order;
/// `truncated` means a further match existed beyond `limit`.
[[nodiscard]] inline JsonValue search_pointer(const JsonValue& doc, std::string_view query,
                                              const SearchOptions& opts = {}) {
    detail::PointerSearch search(query, opts);
    search.run(doc);
    return search.result();
}

} // namespace patchguard
