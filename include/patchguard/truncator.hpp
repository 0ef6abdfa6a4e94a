#pragma once

/// @file truncator.hpp
/// @brief Bounded rendering of a JsonValue into a character budget.
///
/// The output is an indented, JSON-like text in which removed content shows
/// up as a marker: `...` for a dropped element or member, `[...]` and
/// `{...}` for a fully collapsed array or object. It is meant for humans
/// and language models, not for parsing back.
///
/// Shrinking runs in rounds until the text fits or nothing changes:
///   1. Strings longer than `min_len_for_truncation` are cut to a common
///      length L (plus "..."); L is binary-searched to the largest value
///      that fits
///   2. Otherwise, every array at the deepest level holding more than one
///      element loses its middle element to a marker, then the real
///      element beside the marker on the fuller side, until it collapses
///      to `[...]`
///   3. Otherwise objects shrink the same way, down to `{...}`
///   4. Otherwise the deepest containers left with a single member are
///      collapsed outright, up to the root
///
/// Lengths are counted in code points.

#include "detail/utf8.hpp"
#include "log.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace patchguard {

struct TruncatorConfig {
    int indentation = 4;
    size_t min_len_for_truncation = 23;
    size_t ellipsis_size = 3;
    size_t min_items_for_collapse = 2;
    size_t min_keys_for_collapse = 2;
};

namespace detail {

/// Working copy of a value, with room for truncation markers.
struct TruncNode {
    enum class Kind : uint8_t { Marker, Scalar, String, Array, Object };

    Kind kind = Kind::Marker;
    JsonValue scalar;
    std::string text;
    std::vector<TruncNode> items;
    /// A member whose value is a Marker stands for removed members.
    std::vector<std::pair<std::string, TruncNode>> members;

    static TruncNode marker() { return TruncNode{}; }

    static TruncNode from(const JsonValue& v) {
        TruncNode n;
        switch (v.type()) {
            case Type::String:
                n.kind = Kind::String;
                n.text = v.as_string();
                break;
            case Type::Array:
                n.kind = Kind::Array;
                n.items.reserve(v.size());
                for (const auto& item : v.as_array()) n.items.push_back(from(item));
                break;
            case Type::Object:
                n.kind = Kind::Object;
                n.members.reserve(v.size());
                for (const auto& [key, val] : v.as_object()) n.members.emplace_back(key, from(val));
                break;
            default:
                n.kind = Kind::Scalar;
                n.scalar = v;
                break;
        }
        return n;
    }

    [[nodiscard]] bool is_marker() const noexcept { return kind == Kind::Marker; }

    /// `[...]` or `{...}`.
    [[nodiscard]] bool is_collapsed() const noexcept {
        if (kind == Kind::Array) return items.size() == 1 && items[0].is_marker();
        if (kind == Kind::Object) return members.size() == 1 && members[0].second.is_marker();
        return false;
    }
};

class TruncRenderer {
public:
    explicit TruncRenderer(int indentation) : unit_(static_cast<size_t>(std::max(indentation, 0)), ' ') {}

    std::string render(const TruncNode& node) const {
        std::string out;
        write(node, 0, out);
        return out;
    }

private:
    std::string unit_;

    void indent(size_t level, std::string& out) const {
        for (size_t i = 0; i < level; ++i) out += unit_;
    }

    void write(const TruncNode& node, size_t level, std::string& out) const {
        using Kind = TruncNode::Kind;
        switch (node.kind) {
            case Kind::Marker:
                out += "...";
                return;
            case Kind::Scalar:
                out += node.scalar.dump();
                return;
            case Kind::String:
                write_string(node.text, out, false);
                return;
            case Kind::Array:
                if (node.items.empty()) { out += "[]"; return; }
                if (node.is_collapsed()) { out += "[...]"; return; }
                out += "[\n";
                for (size_t i = 0; i < node.items.size(); ++i) {
                    if (i) out += ",\n";
                    indent(level + 1, out);
                    write(node.items[i], level + 1, out);
                }
                out += '\n';
                indent(level, out);
                out += ']';
                return;
            case Kind::Object:
                if (node.members.empty()) { out += "{}"; return; }
                if (node.is_collapsed()) { out += "{...}"; return; }
                out += "{\n";
                for (size_t i = 0; i < node.members.size(); ++i) {
                    if (i) out += ",\n";
                    indent(level + 1, out);
                    const auto& [key, val] = node.members[i];
                    if (val.is_marker()) {
                        out += "...";
                        continue;
                    }
                    write_string(key, out, false);
                    out += ": ";
                    write(val, level + 1, out);
                }
                out += '\n';
                indent(level, out);
                out += '}';
                return;
        }
    }
};

class TruncEngine {
public:
    TruncEngine(TruncNode& root, size_t limit, const TruncatorConfig& cfg)
        : root_(root), limit_(limit), cfg_(cfg), renderer_(cfg.indentation) {}

    void run() {
        while (!fits()) {
            if (shrink_strings()) return;
            if (strings_changed_) { strings_changed_ = false; continue; }
            if (collapse_arrays()) continue;
            if (collapse_objects()) continue;
            if (collapse_singletons()) continue;
            log::get()->debug("truncator: cannot fit {} code points into {}", size(), limit_);
            return;
        }
    }

    [[nodiscard]] std::string text() const { return renderer_.render(root_); }

private:
    TruncNode& root_;
    size_t limit_;
    const TruncatorConfig& cfg_;
    TruncRenderer renderer_;
    bool strings_changed_ = false;

    struct Located {
        TruncNode* node;
        size_t depth;
    };

    [[nodiscard]] size_t size() const { return utf8::length(renderer_.render(root_)); }
    [[nodiscard]] bool fits() const { return size() <= limit_; }

    static void collect(TruncNode& node, size_t depth, std::vector<Located>& out) {
        using Kind = TruncNode::Kind;
        if (node.kind == Kind::Marker) return;
        if (node.kind == Kind::Object && node.is_collapsed()) return;
        out.push_back({&node, depth});
        for (auto& item : node.items) collect(item, depth + 1, out);
        for (auto& [key, val] : node.members) collect(val, depth + 1, out);
    }

    /// Strategy 1. Returns true when a shared cut length makes the text
    /// fit; sets strings_changed_ when the shortest cut was applied but the
    /// text is still too long.
    bool shrink_strings() {
        std::vector<Located> all;
        collect(root_, 0, all);
        std::vector<TruncNode*> strings;
        std::vector<std::string> originals;
        std::vector<size_t> lengths;
        // A cut string is never shorter than its ellipsis.
        const size_t threshold = std::max(cfg_.min_len_for_truncation, cfg_.ellipsis_size);
        for (const auto& loc : all) {
            if (loc.node->kind != TruncNode::Kind::String) continue;
            const size_t len = utf8::length(loc.node->text);
            if (len <= threshold) continue;
            strings.push_back(loc.node);
            originals.push_back(loc.node->text);
            lengths.push_back(len);
        }
        if (strings.empty()) return false;

        auto cut_to = [&](size_t max_len) {
            const size_t keep = max_len > cfg_.ellipsis_size ? max_len - cfg_.ellipsis_size : 0;
            for (size_t i = 0; i < strings.size(); ++i) {
                if (lengths[i] > max_len)
                    strings[i]->text = std::string(utf8::prefix(originals[i], keep)) + "...";
                else
                    strings[i]->text = originals[i];
            }
        };

        size_t best = cfg_.min_len_for_truncation;
        cut_to(best);
        if (!fits()) {
            strings_changed_ = true;
            return false;
        }
        size_t low = best;
        size_t high = *std::max_element(lengths.begin(), lengths.end());
        while (low <= high) {
            const size_t mid = low + (high - low) / 2;
            cut_to(mid);
            if (fits()) {
                best = mid;
                low = mid + 1;
            } else {
                if (mid == 0) break;
                high = mid - 1;
            }
        }
        cut_to(best);
        return true;
    }

    /// Deepest candidates only. @p eligible filters by kind and size.
    template <typename Pred>
    std::vector<TruncNode*> deepest(Pred eligible) {
        std::vector<Located> all;
        collect(root_, 0, all);
        std::vector<Located> candidates;
        for (const auto& loc : all)
            if (eligible(*loc.node)) candidates.push_back(loc);
        std::vector<TruncNode*> out;
        if (candidates.empty()) return out;
        size_t max_depth = 0;
        for (const auto& c : candidates) max_depth = std::max(max_depth, c.depth);
        for (const auto& c : candidates)
            if (c.depth == max_depth) out.push_back(c.node);
        return out;
    }

    /// Index of the removal marker, or size() when there is none.
    template <typename Seq, typename IsMarker>
    static size_t marker_index(const Seq& seq, IsMarker is_marker) {
        for (size_t i = 0; i < seq.size(); ++i)
            if (is_marker(seq[i])) return i;
        return seq.size();
    }

    /// Shared shrinking step: mark the middle, then drop the neighbour on the
    /// fuller side of the marker, then collapse. Returns false to collapse.
    template <typename Seq, typename IsMarker, typename MakeMarker>
    static bool shrink_sequence(Seq& seq, size_t min_real, IsMarker is_marker, MakeMarker make_marker) {
        const size_t idx = marker_index(seq, is_marker);
        if (idx == seq.size()) {
            seq[seq.size() / 2] = make_marker();
            return true;
        }
        const size_t real = seq.size() - 1;
        if (real <= min_real) return false;
        const size_t left = idx;
        const size_t right = seq.size() - 1 - idx;
        if (left > right) seq.erase(seq.begin() + static_cast<std::ptrdiff_t>(idx - 1));
        else seq.erase(seq.begin() + static_cast<std::ptrdiff_t>(idx + 1));
        return true;
    }

    bool collapse_arrays() {
        auto targets = deepest([](const TruncNode& n) {
            return n.kind == TruncNode::Kind::Array && n.items.size() > 1;
        });
        for (TruncNode* node : targets) {
            const bool kept = shrink_sequence(
                node->items, cfg_.min_items_for_collapse,
                [](const TruncNode& item) { return item.is_marker(); },
                [] { return TruncNode::marker(); });
            if (!kept) {
                node->items.clear();
                node->items.push_back(TruncNode::marker());
            }
        }
        return !targets.empty();
    }

    bool collapse_objects() {
        auto targets = deepest([](const TruncNode& n) {
            return n.kind == TruncNode::Kind::Object && n.members.size() > 1;
        });
        for (TruncNode* node : targets) {
            const bool kept = shrink_sequence(
                node->members, cfg_.min_keys_for_collapse,
                [](const std::pair<std::string, TruncNode>& m) { return m.second.is_marker(); },
                [] { return std::pair<std::string, TruncNode>(std::string(), TruncNode::marker()); });
            if (!kept) {
                node->members.clear();
                node->members.emplace_back(std::string(), TruncNode::marker());
            }
        }
        return !targets.empty();
    }

    /// Strategy 4. Once no container has two members left, fold the deepest
    /// single-member containers into `[...]` / `{...}`, working up to the root.
    bool collapse_singletons() {
        using Kind = TruncNode::Kind;
        auto targets = deepest([](const TruncNode& n) {
            if (n.is_collapsed()) return false;
            return (n.kind == Kind::Array && !n.items.empty()) ||
                   (n.kind == Kind::Object && !n.members.empty());
        });
        for (TruncNode* node : targets) {
            if (node->kind == Kind::Array) {
                node->items.clear();
                node->items.push_back(TruncNode::marker());
            } else {
                node->members.clear();
                node->members.emplace_back(std::string(), TruncNode::marker());
            }
        }
        return !targets.empty();
    }
};

inline void replace_all(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace detail

class Truncator {
public:
    explicit Truncator(TruncatorConfig config = {}) : cfg_(config) {}

    /// @brief Render @p data in at most @p limit code points where possible.
    ///
    /// Returns the full rendering when it already fits, and the smallest
    /// rendering the strategies reach when nothing fits.
    [[nodiscard]] std::string truncate_with_limit(const JsonValue& data, size_t limit) const {
        if (data.is_null()) return "null";
        detail::TruncNode root = detail::TruncNode::from(data);
        detail::TruncEngine engine(root, limit, cfg_);
        engine.run();
        std::string text = engine.text();
        detail::replace_all(text, "...,\n", "...\n");
        return text;
    }

    /// Untruncated rendering in the same layout.
    [[nodiscard]] std::string stringify(const JsonValue& data) const {
        return detail::TruncRenderer(cfg_.indentation).render(detail::TruncNode::from(data));
    }

    [[nodiscard]] const TruncatorConfig& config() const noexcept { return cfg_; }

private:
    TruncatorConfig cfg_;
};

/// @brief Shorthand for Truncator(config).truncate_with_limit(value, limit).
[[nodiscard]] inline std::string render(const JsonValue& value, size_t limit,
                                        const TruncatorConfig& config = {}) {
    return Truncator(config).truncate_with_limit(value, limit);
}

} // namespace patchguard
