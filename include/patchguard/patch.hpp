#pragma once

/// @file patch.hpp
/// @brief RFC 6902 patch application.
///
/// apply_in_place() mutates a document and throws PatchOpError or
/// PointerError on failure. apply() and apply_batch() copy their input
/// first, so the caller's document is untouched on every path.
///
/// Semantics:
///   - add at the root replaces the whole document; on an object it sets
///     or overwrites the key; on an array "-" appends and an index in
///     [0, size] inserts
///   - replace and remove require the target to exist; the root cannot be
///     removed
///   - move is remove-then-add. apply_in_place() leaves the source removed
///     if the add half fails; apply() does not have this problem
///   - copy deep-copies the source and adds it at the target
///   - test compares with JsonValue equality (1 == 1.0, key order ignored)

#include "json_pointer.hpp"
#include "patch_op.hpp"
#include "value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace patchguard {

/// @brief Options for patch application.
struct ApplyOptions {
    /// Create missing intermediate containers for add. Each new container is
    /// an array when the token after it is "-" or an index, else an object.
    /// Existing scalars on the way are replaced by containers.
    bool create_parents = false;
};

namespace detail {

inline void create_parent_chain(JsonValue& doc, const JsonPointer& ptr) {
    const auto& tokens = ptr.tokens();
    if (tokens.size() <= 1) return;
    if (!doc.is_container())
        doc = JsonPointer::is_array_token(tokens[0]) ? JsonValue::array() : JsonValue::object();
    JsonValue* cur = &doc;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        const bool next_is_index = JsonPointer::is_array_token(tokens[i + 1]);
        auto fresh = [&] { return next_is_index ? JsonValue::array() : JsonValue::object(); };

        if (cur->is_array()) {
            auto& arr = cur->as_array();
            auto idx = tok == "-" ? std::optional<size_t>(arr.size()) : JsonPointer::parse_index(tok);
            if (!idx || *idx > arr.size())
                throw PatchOpError("add in array: invalid index: " + tok, errc::invalid_array_index);
            if (*idx == arr.size()) arr.push_back(fresh());
            else if (!arr[*idx].is_container()) arr[*idx] = fresh();
            cur = &arr[*idx];
        } else {
            auto* child = cur->find(tok);
            if (!child || !child->is_container()) {
                cur->insert(tok, fresh());
                child = cur->find(tok);
            }
            cur = child;
        }
    }
}

inline void add_at(JsonValue& doc, const JsonPointer& ptr, JsonValue value,
                   const std::string& path) {
    if (ptr.empty()) {
        doc = std::move(value);
        return;
    }
    JsonValue* parent = ptr.parent().try_resolve(doc);
    const std::string& key = ptr.back();
    if (!parent)
        throw PatchOpError("add failed: parent of " + path + " does not exist",
                           errc::pointer_not_found);
    if (parent->is_array()) {
        auto& arr = parent->as_array();
        auto idx = key == "-" ? std::optional<size_t>(arr.size()) : JsonPointer::parse_index(key);
        if (!idx || *idx > arr.size())
            throw PatchOpError("add in array: invalid index: " + key, errc::invalid_array_index);
        arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(*idx), std::move(value));
        return;
    }
    if (!parent->is_object())
        throw PatchOpError("add: parent is not object/array at path");
    parent->insert(key, std::move(value));
}

inline void replace_at(JsonValue& doc, const JsonPointer& ptr, JsonValue value,
                       const std::string& path) {
    JsonValue* target = ptr.try_resolve(doc);
    if (!target)
        throw PatchOpError("replace failed: " + path + " does not exist", errc::pointer_not_found);
    *target = std::move(value);
}

/// Removes and returns the value at @p ptr.
inline JsonValue remove_at(JsonValue& doc, const JsonPointer& ptr, const std::string& path,
                           const char* op_name) {
    if (ptr.empty())
        throw PatchOpError("remove at root leaves the document undefined");
    JsonValue* parent = ptr.parent().try_resolve(doc);
    const std::string& key = ptr.back();
    auto missing = [&] {
        return PatchOpError(std::string(op_name) + " failed: " + path + " does not exist",
                            errc::pointer_not_found);
    };
    if (!parent) throw missing();
    if (parent->is_array()) {
        auto& arr = parent->as_array();
        auto idx = JsonPointer::parse_index(key);
        if (!idx || *idx >= arr.size()) throw missing();
        JsonValue out = std::move(arr[*idx]);
        arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(*idx));
        return out;
    }
    if (!parent->is_object())
        throw PatchOpError(std::string(op_name) + ": parent is not object/array at path");
    auto* found = parent->find(key);
    if (!found) throw missing();
    JsonValue out = std::move(*found);
    parent->erase(key);
    return out;
}

inline bool is_proper_prefix(const JsonPointer& prefix, const JsonPointer& ptr) {
    const auto& a = prefix.tokens();
    const auto& b = ptr.tokens();
    if (a.size() >= b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (a[i] != b[i]) return false;
    return true;
}

} // namespace detail

/// @brief Apply one operation to @p doc in place.
inline void apply_in_place(JsonValue& doc, const PatchOp& op, const ApplyOptions& opts = {}) {
    if (!op.has_op_and_path)
        throw PatchOpError("invalid operation (missing op/path)");
    if (op.type == OpType::Unknown)
        throw PatchOpError("Operation not supported: " + op.name, errc::unsupported_operation);
    if (op.needs_value() && !op.value)
        throw PatchOpError("operation \"" + op.name + "\" requires field \"value\"");
    if (op.needs_from() && !op.from)
        throw PatchOpError("operation \"" + op.name + "\" requires field \"from\"");

    const JsonPointer ptr(op.path);

    switch (op.type) {
        case OpType::Add:
            if (opts.create_parents) detail::create_parent_chain(doc, ptr);
            detail::add_at(doc, ptr, *op.value, op.path);
            break;
        case OpType::Replace:
            detail::replace_at(doc, ptr, *op.value, op.path);
            break;
        case OpType::Remove:
            detail::remove_at(doc, ptr, op.path, "remove");
            break;
        case OpType::Test: {
            const JsonValue* cur = ptr.try_resolve(doc);
            if (!cur)
                throw PatchOpError("test failed: " + op.path + " does not exist", errc::test_failed);
            if (*cur != *op.value)
                throw PatchOpError("test failed: value differs at " + op.path, errc::test_failed);
            break;
        }
        case OpType::Copy: {
            const JsonValue* src = JsonPointer(*op.from).try_resolve(doc);
            if (!src)
                throw PatchOpError("copy failed: from=" + *op.from + " does not exist",
                                   errc::pointer_not_found);
            JsonValue clone = *src;
            detail::add_at(doc, ptr, std::move(clone), op.path);
            break;
        }
        case OpType::Move: {
            const JsonPointer from(*op.from);
            if (!from.try_resolve(doc))
                throw PatchOpError("move failed: from=" + *op.from + " does not exist",
                                   errc::pointer_not_found);
            if (detail::is_proper_prefix(from, ptr))
                throw PatchOpError("move failed: cannot move " + *op.from +
                                   " into its own child " + op.path);
            JsonValue moved = detail::remove_at(doc, from, *op.from, "move");
            detail::add_at(doc, ptr, std::move(moved), op.path);
            break;
        }
        case OpType::Unknown:
            break;
    }
}

/// @brief Apply one operation to a copy of @p doc and return the result.
[[nodiscard]] inline JsonValue apply(const JsonValue& doc, const PatchOp& op,
                                     const ApplyOptions& opts = {}) {
    JsonValue out = doc;
    apply_in_place(out, op, opts);
    return out;
}

/// @brief Apply operations in order to a copy of @p doc. Later operations
/// see the effects of earlier ones; the first failure throws.
[[nodiscard]] inline JsonValue apply_batch(const JsonValue& doc, const std::vector<PatchOp>& ops,
                                           const ApplyOptions& opts = {}) {
    JsonValue out = doc;
    for (const auto& op : ops) apply_in_place(out, op, opts);
    return out;
}

} // namespace patchguard
