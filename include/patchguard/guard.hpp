#pragma once

/// @file guard.hpp
/// @brief Heuristics that stop a patch batch from silently destroying data.
///
/// Three independent checks:
///   - pre_validate(): per-operation rules for container overwrites,
///     root replacement, type downgrades and large removals
///   - filter_duplicate_appends(): drops "/-" appends whose value is
///     already in the target array or earlier in the same batch
///   - check_shrinkage(): compares leaf counts before and after a batch
///
/// All messages are prescriptive: they name the offending path and the
/// operation that should have been used instead.

#include "detail/utf8.hpp"
#include "json_pointer.hpp"
#include "patch_op.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace patchguard {

/// Thresholds shared by the pre-validation and shrinkage checks.
struct GuardOptions {
    /// Documents with at most this many leaves skip the shrinkage check.
    size_t shrinkage_min_items = 10;
    /// A batch may not leave fewer than old * ratio leaves (also used by
    /// the object-replace data-loss check).
    double shrinkage_ratio = 0.5;
    /// Object replacements over at most this many leaves are not checked.
    size_t data_loss_min_items = 5;
};

/// @brief Number of scalar leaves under @p value.
///
/// Every scalar, null included, counts 1; containers count the sum of
/// their children, so empty containers count 0.
[[nodiscard]] inline size_t leaf_count(const JsonValue& value) {
    if (value.is_array()) {
        size_t n = 0;
        for (const auto& v : value.as_array()) n += leaf_count(v);
        return n;
    }
    if (value.is_object()) {
        size_t n = 0;
        for (const auto& [k, v] : value.as_object()) n += leaf_count(v);
        return n;
    }
    return 1;
}

/// Integer percentage of leaves lost going from @p old_count to @p new_count.
[[nodiscard]] inline int loss_percent(size_t old_count, size_t new_count) noexcept {
    if (old_count == 0) return 0;
    return 100 - static_cast<int>(static_cast<double>(new_count) / static_cast<double>(old_count) * 100.0);
}

namespace detail {

/// Lookup with the applier's token decoding (no percent-decoding):
/// "" and "/" are the root, "-" never resolves.
inline const JsonValue* guard_lookup(const JsonValue& doc, const std::string& path) {
    return JsonPointer::parse_lenient(path, false).try_resolve(doc);
}

inline PatchError guard_error(size_t index, const PatchOp& op, std::string message) {
    return PatchError{static_cast<int>(index), op, op.path, std::move(message), errc::guard_rejected};
}

inline std::optional<PatchError> check_add_on_array(size_t i, const PatchOp& op,
                                                    const JsonValue& value, const JsonValue& doc) {
    const std::string& p = op.path;
    if (p.empty()) return std::nullopt;
    const JsonValue* current = guard_lookup(doc, p);
    if (!current || !current->is_array()) return std::nullopt;

    const size_t n = current->size();
    if (value.is_array()) {
        return guard_error(i, op, fmt::format(
            "DESTRUCTIVE OVERWRITE: \"{0}\" already contains an array with {1} items. "
            "Your \"add\" would REPLACE ALL existing data with a new array of {2} items. "
            "To APPEND items, use \"{0}/-\" for each: "
            "[{{\"op\":\"add\",\"path\":\"{0}/-\",\"value\":item1}}, ...]",
            p, n, value.size()));
    }
    if (value.is_object()) {
        return guard_error(i, op, fmt::format(
            "DESTRUCTIVE OVERWRITE: \"{0}\" already contains an array with {1} items. "
            "Your \"add\" would REPLACE the entire array with a single object. "
            "To APPEND, use \"{0}/-\": {{\"op\":\"add\",\"path\":\"{0}/-\",\"value\":{{...}}}}",
            p, n));
    }
    return guard_error(i, op, fmt::format(
        "TYPE DOWNGRADE: \"{0}\" already contains an array with {1} items. "
        "Your \"add\" would REPLACE the entire array with a {2}. "
        "To APPEND, use \"{0}/-\": {{\"op\":\"add\",\"path\":\"{0}/-\",\"value\":...}}",
        p, n, value.type_name()));
}

inline std::optional<PatchError> check_add_at_root(size_t i, const PatchOp& op, const JsonValue& doc) {
    const size_t count = leaf_count(doc);
    if (count == 0) return std::nullopt;
    return guard_error(i, op, fmt::format(
        "DESTRUCTIVE: \"add\" at root would REPLACE the entire document ({} existing values). "
        "Add to specific paths instead (e.g., /metadata, /sections/-).",
        count));
}

inline std::optional<PatchError> check_replace_container(size_t i, const PatchOp& op,
                                                         const JsonValue& value, const JsonValue& doc,
                                                         const GuardOptions& opts) {
    const std::string& p = op.path;
    if (p.empty()) return std::nullopt;
    const JsonValue* current = guard_lookup(doc, p);
    if (!current) return std::nullopt;

    if (current->is_array() && !current->empty()) {
        return guard_error(i, op, fmt::format(
            "DESTRUCTIVE REPLACE: \"{0}\" is an array with {1} items. "
            "Replacing it would DISCARD all existing data. To update specific items, "
            "use \"replace\" on individual indices (e.g., \"{0}/0/value\"). "
            "To append new items, use \"add\" with \"{0}/-\".",
            p, current->size()));
    }
    if (current->is_object() && !current->empty()) {
        const size_t nested = leaf_count(*current);
        if (!value.is_container()) {
            return guard_error(i, op, fmt::format(
                "TYPE DOWNGRADE: \"{0}\" is an object with {1} keys ({2} nested values). "
                "Replacing it with a {3} would DESTROY all nested data. "
                "To update a specific field, use \"{0}/fieldName\" as the path.",
                p, current->size(), nested, value.type_name()));
        }
        if (value.is_object()) {
            const size_t new_count = leaf_count(value);
            if (static_cast<double>(new_count) < static_cast<double>(nested) * opts.shrinkage_ratio &&
                nested > opts.data_loss_min_items) {
                return guard_error(i, op, fmt::format(
                    "SIGNIFICANT DATA LOSS: replacing \"{}\" would reduce content from {} to {} values "
                    "({}% loss). Consider updating individual fields instead.",
                    p, nested, new_count, loss_percent(nested, new_count)));
            }
        }
    }
    return std::nullopt;
}

inline std::optional<PatchError> check_remove_container(size_t i, const PatchOp& op, const JsonValue& doc) {
    const std::string& p = op.path;
    if (p.empty()) return std::nullopt;
    const JsonValue* current = guard_lookup(doc, p);
    if (!current) return std::nullopt;

    const auto depth = static_cast<size_t>(std::count(p.begin(), p.end(), '/'));
    const size_t nested = leaf_count(*current);
    if (current->is_array() && !current->empty()) {
        return guard_error(i, op, fmt::format(
            "DATA LOSS WARNING: removing \"{0}\" would delete an array with {1} items "
            "({2} total nested values). If you need to remove specific items, "
            "use their full path (e.g., \"{0}/0\").",
            p, current->size(), nested));
    }
    if (current->is_object() && nested > 2 && depth <= 3) {
        return guard_error(i, op, fmt::format(
            "DATA LOSS WARNING: removing \"{0}\" would delete an object with {1} keys "
            "({2} total nested values). If you need to remove specific fields, "
            "use their full path (e.g., \"{0}/fieldName\").",
            p, current->size(), nested));
    }
    return std::nullopt;
}

inline std::optional<PatchError> check_type_downgrade(size_t i, const PatchOp& op,
                                                      const JsonValue& value, const JsonValue& doc) {
    const std::string& p = op.path;
    if (p.empty() || value.is_null() || value.is_container()) return std::nullopt;
    const JsonValue* current = guard_lookup(doc, p);
    if (!current || !current->is_container()) return std::nullopt;

    const size_t nested = leaf_count(*current);
    if (nested <= 1) return std::nullopt;
    return guard_error(i, op, fmt::format(
        "TYPE DOWNGRADE: \"{}\" is a {} with {} nested values. Replacing it with a {} ({}) "
        "would DESTROY all nested data. Update specific fields instead.",
        p, current->type_name(), nested, value.type_name(), utf8::prefix(value.dump(), 60)));
}

} // namespace detail

/// @brief Run the destructive-operation heuristics over a batch.
///
/// Every operation is checked against @p doc as it is before the batch.
/// At most one error is reported per operation (the first rule that
/// fires); the result is empty when the batch looks safe.
[[nodiscard]] inline std::vector<PatchError> pre_validate(const std::vector<PatchOp>& patches,
                                                          const JsonValue& doc,
                                                          const GuardOptions& opts = {}) {
    using namespace detail;
    std::vector<PatchError> errors;
    static const JsonValue null_value;

    for (size_t i = 0; i < patches.size(); ++i) {
        const PatchOp& op = patches[i];
        const std::string& p = op.path;
        const JsonValue& value = op.value ? *op.value : null_value;

        if (!p.empty() && p.front() != '/') {
            errors.push_back(guard_error(i, op, fmt::format(
                "Invalid JSON Pointer: \"{0}\" must start with \"/\". Did you mean \"/{0}\"?", p)));
            continue;
        }

        std::optional<PatchError> err;
        if (op.type == OpType::Add) err = check_add_on_array(i, op, value, doc);
        if (!err && op.type == OpType::Add && (p.empty() || p == "/")) err = check_add_at_root(i, op, doc);
        if (!err && op.type == OpType::Replace) err = check_replace_container(i, op, value, doc, opts);
        if (!err && op.type == OpType::Remove) err = check_remove_container(i, op, doc);
        if (!err && (op.type == OpType::Add || op.type == OpType::Replace))
            err = check_type_downgrade(i, op, value, doc);
        if (err) errors.push_back(std::move(*err));
    }
    return errors;
}

/// Result of filter_duplicate_appends().
struct DuplicateFilterResult {
    std::vector<PatchOp> kept;
    std::vector<std::string> skipped;
};

/// @brief Drop "/-" appends whose value is already present.
///
/// A value is a duplicate when its canonical text (sorted keys, compact)
/// equals that of an item already in the target array of @p doc, or of a
/// value appended to the same array earlier in the batch. Operations other
/// than add-with-"/-" pass through unchanged and keep their order.
[[nodiscard]] inline DuplicateFilterResult filter_duplicate_appends(const std::vector<PatchOp>& patches,
                                                                    const JsonValue& doc) {
    DuplicateFilterResult out;
    std::unordered_map<std::string, std::unordered_set<std::string>> existing;
    std::unordered_map<std::string, std::unordered_set<std::string>> queued;

    auto existing_for = [&](const std::string& array_path) -> const std::unordered_set<std::string>& {
        auto it = existing.find(array_path);
        if (it != existing.end()) return it->second;
        std::unordered_set<std::string> items;
        const JsonValue* arr = detail::guard_lookup(doc, array_path);
        if (arr && arr->is_array())
            for (const auto& item : arr->as_array()) items.insert(canonical(item));
        return existing.emplace(array_path, std::move(items)).first->second;
    };

    for (const auto& op : patches) {
        const std::string& p = op.path;
        const bool is_append = op.type == OpType::Add && op.has_op_and_path &&
                               p.size() >= 2 && p.compare(p.size() - 2, 2, "/-") == 0;
        if (!is_append) {
            out.kept.push_back(op);
            continue;
        }
        const std::string array_path = p.substr(0, p.size() - 2);
        const std::string key = canonical(op.value ? *op.value : JsonValue());
        auto& batch = queued[array_path];
        if (existing_for(array_path).count(key) || batch.count(key)) {
            out.skipped.push_back(fmt::format(
                "DUPLICATE SKIPPED at \"{}\": identical item already exists in the array. Preview: {}",
                p, detail::utf8::prefix(key, 120)));
            continue;
        }
        batch.insert(key);
        out.kept.push_back(op);
    }
    return out;
}

/// @brief Batch-level error when @p after lost too many leaves versus @p before.
///
/// Fires when before has more than `shrinkage_min_items` leaves and after
/// has fewer than `before * shrinkage_ratio`.
[[nodiscard]] inline std::optional<PatchError> check_shrinkage(const JsonValue& before,
                                                               const JsonValue& after,
                                                               const GuardOptions& opts = {}) {
    const size_t old_count = leaf_count(before);
    const size_t new_count = leaf_count(after);
    if (old_count <= opts.shrinkage_min_items ||
        !(static_cast<double>(new_count) < static_cast<double>(old_count) * opts.shrinkage_ratio))
        return std::nullopt;
    return PatchError{-1, std::nullopt, "/", fmt::format(
        "SHRINKAGE GUARD: patches would reduce document from {} to {} values ({}% data loss). "
        "This likely means you replaced a container instead of appending. "
        "Use \"/-\" to append to arrays, or update individual fields instead of replacing objects.",
        old_count, new_count, loss_percent(old_count, new_count)), errc::shrinkage_detected};
}

} // namespace patchguard
