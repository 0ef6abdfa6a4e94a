#pragma once

/// @file engine.hpp
/// @brief Batch entry points: apply_patches() and the guarded submit_patches().
///
/// apply_patches() runs every operation in order against a working copy of
/// the document. With a schema, each operation is first checked against the
/// candidate sub-schemas at its path, then applied, then the whole document
/// is re-validated. Failures become PatchError entries and processing moves
/// on to the next operation; no exception leaves either entry point.
///
/// submit_patches() wraps apply_patches() with the guard layer and is
/// all-or-nothing: its final_doc is the input document unless the batch
/// succeeded.

#include "guard.hpp"
#include "json_pointer.hpp"
#include "log.hpp"
#include "patch.hpp"
#include "patch_op.hpp"
#include "schema.hpp"
#include "validator.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace patchguard {

namespace detail {

/// "ptr: msg | ptr: msg", cut after @p limit entries with a trailing " | ...".
inline std::string join_validation_errors(const std::vector<ValidationError>& errors,
                                          size_t limit = static_cast<size_t>(-1)) {
    std::string out;
    const size_t n = std::min(limit, errors.size());
    for (size_t i = 0; i < n; ++i) {
        if (i) out += " | ";
        out += errors[i].pointer;
        out += ": ";
        out += errors[i].message;
    }
    if (errors.size() > n) out += " | ...";
    return out;
}

class BatchRunner {
public:
    BatchRunner(JsonValue doc, const JsonValue* schema)
        : doc_(std::move(doc)), schema_(schema) {
        if (schema_) validator_.emplace(*schema_);
    }

    PatchResult run(const std::vector<PatchOp>& ops) {
        for (size_t i = 0; i < ops.size(); ++i) {
            if (!check_structure(i, ops[i])) continue;
            if (schema_) run_with_schema(i, ops[i]);
            else run_without_schema(i, ops[i]);
        }
        PatchResult result;
        result.ok = errors_.empty();
        result.errors = std::move(errors_);
        result.final_doc = std::move(doc_);
        return result;
    }

private:
    JsonValue doc_;
    const JsonValue* schema_;
    std::optional<Validator> validator_;
    std::vector<PatchError> errors_;

    void add_error(size_t index, std::optional<PatchOp> op, std::string pointer, std::string message,
                   errc code = errc::invalid_operation) {
        log::get()->debug("op {} rejected at {}: {}", index, pointer, message);
        errors_.push_back({static_cast<int>(index), std::move(op), std::move(pointer), std::move(message), code});
    }

    bool check_structure(size_t i, const PatchOp& op) {
        if (!op.has_op_and_path) {
            add_error(i, op, "/", "invalid operation (missing op/path)");
            return false;
        }
        if (op.needs_value() && !op.value) {
            add_error(i, op, op.path, fmt::format("operation \"{}\" requires field \"value\"", op.name));
            return false;
        }
        if (op.needs_from() && !op.from) {
            add_error(i, op, op.path, fmt::format("operation \"{}\" requires field \"from\"", op.name));
            return false;
        }
        return true;
    }

    bool apply_op(size_t i, const PatchOp& op, const ApplyOptions& opts) {
        try {
            doc_ = apply(doc_, op, opts);
            return true;
        } catch (const std::system_error& e) {
            const errc code = e.code().category() == patchguard_category()
                                  ? static_cast<errc>(e.code().value())
                                  : errc::invalid_operation;
            add_error(i, op, op.path, fmt::format("failed to apply patch: {}", e.what()), code);
        } catch (const std::exception& e) {
            add_error(i, op, op.path, fmt::format("failed to apply patch: {}", e.what()));
        }
        return false;
    }

    void run_without_schema(size_t i, const PatchOp& op) {
        ApplyOptions opts;
        opts.create_parents = true;
        apply_op(i, op, opts);
    }

    /// Candidate errors for @p value: the candidate with the fewest errors wins.
    std::vector<ValidationError> best_errors(const std::vector<const JsonValue*>& candidates,
                                             const JsonValue& value, const std::string& path) const {
        std::optional<std::vector<ValidationError>> best;
        for (const JsonValue* c : candidates) {
            auto errs = validator_->validate(*c, value, path);
            if (!best || errs.size() < best->size()) best = std::move(errs);
            if (best->empty()) break;
        }
        return best ? std::move(*best) : std::vector<ValidationError>{};
    }

    static std::string type_hint(const std::vector<const JsonValue*>& candidates,
                                 const JsonValue& value, const std::string& path) {
        const std::string val_type = type_of_instance(value);
        for (const JsonValue* c : candidates) {
            const auto* t = c->find("type");
            if (!t || !t->is_string()) continue;
            const std::string& s_type = t->as_string();
            if (s_type == "array" && val_type == "object") {
                return fmt::format(
                    " HINT: The schema expects an array at \"{0}\", but you provided a single object. "
                    "To append this object to the array, use path \"{0}/-\" instead.", path);
            }
            if (s_type == "array" && val_type != "array") {
                return fmt::format(
                    " HINT: The schema expects an array at \"{0}\". "
                    "To append an item, use path \"{0}/-\" with the item as value.", path);
            }
            if (s_type == "object" && val_type == "array") {
                return fmt::format(
                    " HINT: The schema expects an object at \"{}\", but you provided an array. "
                    "Pass a single object as the value.", path);
            }
        }
        return {};
    }

    /// Checks specific to add. Returns false when the op was rejected.
    bool check_add(size_t i, const PatchOp& op, const JsonPointer& ptr, const JsonValue* target,
                   const JsonValue* parent, const std::vector<const JsonValue*>& parent_schemas) {
        const std::string& path = op.path;
        if (ptr.empty()) return check_add_target(i, op, target);
        const std::string& key = ptr.back();

        if (!parent) {
            add_error(i, op, path,
                      "add failed: parent path does not exist. "
                      "Use inspect_keys to verify the parent path exists before adding.",
                      errc::pointer_not_found);
            return false;
        }
        if (parent->is_array()) {
            const auto idx = JsonPointer::parse_index(key);
            const size_t n = parent->size();
            if (key != "-" && !(idx && *idx <= n)) {
                add_error(i, op, path, fmt::format(
                    "add in array: invalid index '{}'. Array has {} items (valid indices: 0..{}, "
                    "or '-' to append). Use \"{}/-\" to append to the end.",
                    key, n, n, path.substr(0, path.rfind('/'))), errc::invalid_array_index);
                return false;
            }
        } else if (parent->is_object()) {
            const bool allowed = std::any_of(parent_schemas.begin(), parent_schemas.end(),
                                             [&](const JsonValue* s) { return is_prop_allowed(*s, key); });
            if (!allowed) {
                add_error(i, op, path, fmt::format(
                    "add invalid: property \"{}\" is not allowed by the parent schema. "
                    "Check the TargetSchema to see which properties are allowed at this level.", key),
                    errc::schema_violation);
                return false;
            }
        }
        return check_add_target(i, op, target);
    }

    /// An add onto an existing array is never an append.
    bool check_add_target(size_t i, const PatchOp& op, const JsonValue* target) {
        if (!target || !target->is_array()) return true;
        const std::string& path = op.path;
        const JsonValue& value = *op.value;
        if (!value.is_array()) {
            add_error(i, op, path, fmt::format(
                "DESTRUCTIVE OVERWRITE BLOCKED: path \"{0}\" currently holds an array with {1} items. "
                "Your \"add\" would REPLACE the entire array with a single {2}. "
                "To APPEND an item, use \"{0}/-\" as the path instead. "
                "Example: {{\"op\":\"add\",\"path\":\"{0}/-\",\"value\":...}}",
                path, target->size(), type_of_instance(value)), errc::guard_rejected);
        } else {
            add_error(i, op, path, fmt::format(
                "DESTRUCTIVE OVERWRITE BLOCKED: path \"{0}\" currently holds an array with {1} items. "
                "Your \"add\" would REPLACE all existing data with a new array of {2} items. "
                "To APPEND items, use separate operations with \"{0}/-\" for each item. "
                "Example: [{{\"op\":\"add\",\"path\":\"{0}/-\",\"value\":item1}}, ...]",
                path, target->size(), value.size()), errc::guard_rejected);
        }
        return false;
    }

    void run_with_schema(size_t i, const PatchOp& op) {
        const std::string& path = op.path;
        std::optional<JsonPointer> parsed;
        try {
            parsed.emplace(path);
        } catch (const PointerError& e) {
            add_error(i, op, path, e.what(), errc::invalid_pointer);
            return;
        }
        const JsonPointer& ptr = *parsed;
        const JsonValue& root_schema = *schema_;

        const JsonValue* target = ptr.try_resolve(doc_);
        const JsonValue* parent = ptr.empty() ? nullptr : ptr.parent().try_resolve(doc_);
        const auto target_schemas = candidates_at_pointer(root_schema, ptr);
        const auto parent_schemas = candidates_at_pointer(root_schema, ptr.parent());

        const OpType type = op.type;
        if ((type == OpType::Replace || type == OpType::Remove || type == OpType::Test) && !target) {
            add_error(i, op, path, fmt::format("{} failed: path does not exist in current document", op.name),
                      errc::pointer_not_found);
            return;
        }

        if (type == OpType::Add && !check_add(i, op, ptr, target, parent, parent_schemas)) return;

        if (type == OpType::Remove) {
            if (ptr.empty()) {
                add_error(i, op, path, "remove at root leaves the document undefined (incompatible with schema)");
                return;
            }
            if (parent && parent->is_object()) {
                const std::string& key = ptr.back();
                const bool required = std::any_of(parent_schemas.begin(), parent_schemas.end(),
                                                  [&](const JsonValue* s) { return is_required(*s, key); });
                if (required) {
                    add_error(i, op, path, fmt::format("remove invalid: \"{}\" is required by parent schema", key),
                              errc::schema_violation);
                    return;
                }
            }
        }

        if (type == OpType::Add || type == OpType::Replace) {
            const auto best = best_errors(target_schemas, *op.value, path);
            if (!best.empty()) {
                add_error(i, op, path, fmt::format("value incompatible with schema at path: {}{}",
                                                   join_validation_errors(best),
                                                   type_hint(target_schemas, *op.value, path)),
                          errc::schema_violation);
                return;
            }
        }

        if (type == OpType::Test) {
            const auto best = best_errors(target_schemas, *op.value, path);
            if (!best.empty()) {
                add_error(i, op, path, fmt::format("test value incompatible with schema: {}",
                                                   join_validation_errors(best)),
                          errc::schema_violation);
                return;
            }
        }

        if (!apply_op(i, op, ApplyOptions{})) return;

        const auto post = validator_->validate(doc_);
        if (!post.empty()) {
            add_error(i, op, path, fmt::format("post-operation document became invalid: {}",
                                               join_validation_errors(post, 5)),
                      errc::schema_violation);
        }
    }
};

/// Initial working document: the schema skeleton with @p doc's members on top.
inline JsonValue seed_document(const JsonValue& doc, const JsonValue* schema) {
    if (!doc.is_null() && !doc.is_object()) return doc;
    if (!schema) return doc.is_null() ? JsonValue::object() : doc;
    JsonValue merged = build_base_doc(*schema);
    if (doc.is_object())
        for (const auto& [key, val] : doc.as_object()) merged.insert(key, val);
    return merged;
}

} // namespace detail

/// @brief Apply @p ops to a copy of @p doc, optionally checked against @p schema.
///
/// A null @p schema pointer, or a schema that is JSON null, disables schema
/// checks; missing intermediate containers are then created for add. With a
/// schema, the document starts from build_base_doc() overlaid with @p doc.
/// An empty batch succeeds and returns @p doc untouched. `ok` is true
/// exactly when no operation produced an error; final_doc holds every
/// operation that succeeded.
[[nodiscard]] inline PatchResult apply_patches(const JsonValue& doc, const std::vector<PatchOp>& ops,
                                               const JsonValue* schema = nullptr) {
    if (ops.empty()) {
        PatchResult result;
        result.final_doc = doc;
        return result;
    }
    if (schema && schema->is_null()) schema = nullptr;
    return detail::BatchRunner(detail::seed_document(doc, schema), schema).run(ops);
}

/// @brief apply_patches() over the wire form: a JSON array of operations.
///
/// Elements that are not objects are reported as
/// "invalid operation (not an object)" and skipped. A non-array
/// @p patches is reported as a single batch-level error.
[[nodiscard]] inline PatchResult apply_patches(const JsonValue& doc, const JsonValue& patches,
                                               const JsonValue* schema = nullptr) {
    if (!patches.is_array()) {
        PatchResult result;
        result.ok = false;
        result.errors.push_back({-1, std::nullopt, "/", "patches must be a JSON array"});
        result.final_doc = doc;
        return result;
    }
    std::vector<PatchOp> ops;
    std::vector<size_t> origin;  // ops[k] came from patches[origin[k]]
    std::vector<PatchError> decode_errors;
    const auto& items = patches.as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        if (!items[i].is_object()) {
            decode_errors.push_back({static_cast<int>(i), std::nullopt, "/", "invalid operation (not an object)"});
            continue;
        }
        origin.push_back(i);
        ops.push_back(PatchOp::from_json(items[i]));
    }
    if (decode_errors.empty()) return apply_patches(doc, ops, schema);

    PatchResult result = apply_patches(doc, ops, schema);
    for (auto& e : result.errors)
        if (e.op_index >= 0) e.op_index = static_cast<int>(origin[static_cast<size_t>(e.op_index)]);
    result.errors.insert(result.errors.end(), decode_errors.begin(), decode_errors.end());
    std::stable_sort(result.errors.begin(), result.errors.end(),
                     [](const PatchError& a, const PatchError& b) { return a.op_index < b.op_index; });
    result.ok = result.errors.empty();
    return result;
}

/// Outcome of submit_patches().
struct SubmitResult {
    PatchResult result;
    /// One message per append dropped by the duplicate filter.
    std::vector<std::string> duplicates_skipped;

    [[nodiscard]] JsonValue to_json() const {
        JsonValue j = result.to_json();
        Array skipped;
        for (const auto& s : duplicates_skipped) skipped.emplace_back(s);
        j["duplicatesSkipped"] = std::move(skipped);
        return j;
    }
};

/// @brief Guarded, all-or-nothing batch submission.
///
/// Order: pre_validate() (any error rejects the batch), then
/// filter_duplicate_appends(), then apply_patches(), then the shrinkage
/// check against @p doc. On any rejection result.final_doc is @p doc.
[[nodiscard]] inline SubmitResult submit_patches(const JsonValue& doc, const std::vector<PatchOp>& ops,
                                                 const JsonValue* schema = nullptr,
                                                 const GuardOptions& opts = {}) {
    SubmitResult out;
    auto reject = [&](std::vector<PatchError> errors) {
        out.result.ok = false;
        out.result.errors = std::move(errors);
        out.result.final_doc = doc;
    };

    if (ops.empty()) {
        reject({PatchError{-1, std::nullopt, "/", "No patches provided"}});
        return out;
    }

    auto pre = pre_validate(ops, doc, opts);
    if (!pre.empty()) {
        log::get()->info("batch of {} ops rejected by pre-validation ({} errors)", ops.size(), pre.size());
        reject(std::move(pre));
        return out;
    }

    auto filtered = filter_duplicate_appends(ops, doc);
    out.duplicates_skipped = std::move(filtered.skipped);
    for (const auto& msg : out.duplicates_skipped) log::get()->debug("{}", msg);
    if (filtered.kept.empty()) {
        out.result.final_doc = doc;
        return out;
    }

    PatchResult applied = apply_patches(doc, filtered.kept, schema);
    if (!applied.ok) {
        log::get()->info("batch rejected: {} of {} ops failed", applied.errors.size(), filtered.kept.size());
        reject(std::move(applied.errors));
        return out;
    }
    if (auto shrink = check_shrinkage(doc, applied.final_doc, opts)) {
        log::get()->warn("{}", shrink->message);
        reject({std::move(*shrink)});
        return out;
    }
    out.result = std::move(applied);
    return out;
}

} // namespace patchguard
