#pragma once

/// @file patch_op.hpp
/// @brief Patch operations, per-operation errors and batch results,
/// with their JSON wire forms.
///
/// Wire shapes:
///   PatchOp     {"op": "add", "path": "/a", "value": ..., "from": "/b"}
///   PatchError  {"opIndex": 0, "op": {...} | null, "pointer": "/a", "message": "..."}
///   PatchResult {"ok": true, "errors": [...], "finalDoc": ...}

#include "error.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchguard {

/// RFC 6902 operation kinds. Unknown covers any other name.
enum class OpType : uint8_t {
    Add,
    Replace,
    Remove,
    Move,
    Copy,
    Test,
    Unknown
};

[[nodiscard]] inline OpType op_type_from_name(std::string_view name) noexcept {
    if (name == "add")     return OpType::Add;
    if (name == "replace") return OpType::Replace;
    if (name == "remove")  return OpType::Remove;
    if (name == "move")    return OpType::Move;
    if (name == "copy")    return OpType::Copy;
    if (name == "test")    return OpType::Test;
    return OpType::Unknown;
}

/// @brief One JSON Patch operation.
///
/// `name` keeps the operation name exactly as received, so an unsupported
/// name can be echoed back in diagnostics. `value` and `from` are optional
/// on the wire; whether an operation needs them is checked when it is
/// applied, not when it is decoded.
struct PatchOp {
    OpType type = OpType::Unknown;
    std::string name;
    std::string path;
    std::optional<JsonValue> value;
    std::optional<std::string> from;

    /// False when the wire form lacked a string "op" or a string "path".
    bool has_op_and_path = true;

    PatchOp() = default;
    PatchOp(std::string op_name, std::string op_path)
        : type(op_type_from_name(op_name))
        , name(std::move(op_name))
        , path(std::move(op_path)) {}

    // ─── Factories ───────────────────────────────────────────────────────

    static PatchOp add(std::string path, JsonValue value) {
        PatchOp op("add", std::move(path));
        op.value = std::move(value);
        return op;
    }
    static PatchOp replace(std::string path, JsonValue value) {
        PatchOp op("replace", std::move(path));
        op.value = std::move(value);
        return op;
    }
    static PatchOp remove(std::string path) {
        return PatchOp("remove", std::move(path));
    }
    static PatchOp move(std::string from, std::string path) {
        PatchOp op("move", std::move(path));
        op.from = std::move(from);
        return op;
    }
    static PatchOp copy(std::string from, std::string path) {
        PatchOp op("copy", std::move(path));
        op.from = std::move(from);
        return op;
    }
    static PatchOp test(std::string path, JsonValue value) {
        PatchOp op("test", std::move(path));
        op.value = std::move(value);
        return op;
    }

    /// add, replace and test carry a value.
    [[nodiscard]] bool needs_value() const noexcept {
        return type == OpType::Add || type == OpType::Replace || type == OpType::Test;
    }
    /// move and copy carry a source pointer.
    [[nodiscard]] bool needs_from() const noexcept {
        return type == OpType::Move || type == OpType::Copy;
    }

    // ─── Wire form ───────────────────────────────────────────────────────

    /// Decode one operation. Throws PatchOpError when @p j is not an object;
    /// missing or mistyped members are recorded, not thrown.
    [[nodiscard]] static PatchOp from_json(const JsonValue& j) {
        if (!j.is_object())
            throw PatchOpError("invalid operation (not an object)");
        PatchOp op;
        const auto* name = j.find("op");
        const auto* path = j.find("path");
        op.has_op_and_path = name && name->is_string() && path && path->is_string();
        if (name && name->is_string()) {
            op.name = name->as_string();
            op.type = op_type_from_name(op.name);
        }
        if (path && path->is_string()) op.path = path->as_string();
        if (const auto* v = j.find("value")) op.value = *v;
        if (const auto* f = j.find("from"); f && f->is_string()) op.from = f->as_string();
        return op;
    }

    [[nodiscard]] JsonValue to_json() const {
        JsonValue j = JsonValue::object();
        if (has_op_and_path || !name.empty()) j["op"] = name;
        if (has_op_and_path || !path.empty()) j["path"] = path;
        if (value) j["value"] = *value;
        if (from) j["from"] = *from;
        return j;
    }
};

/// Decode a JSON array of operations. Throws PatchOpError when @p j is not
/// an array or an element is not an object.
[[nodiscard]] inline std::vector<PatchOp> parse_patch_ops(const JsonValue& j) {
    if (!j.is_array())
        throw PatchOpError("patches must be a JSON array");
    std::vector<PatchOp> ops;
    ops.reserve(j.size());
    for (const auto& item : j.as_array()) ops.push_back(PatchOp::from_json(item));
    return ops;
}

/// @brief One diagnostic. `op_index` is -1 for batch-level errors.
struct PatchError {
    int op_index = -1;
    std::optional<PatchOp> op;
    std::string pointer;
    std::string message;
    /// Machine-readable class of the failure; not part of the wire form.
    errc code = errc::invalid_operation;

    [[nodiscard]] std::error_code error_code() const noexcept { return make_error_code(code); }

    [[nodiscard]] JsonValue to_json() const {
        JsonValue j = JsonValue::object();
        j["opIndex"] = op_index;
        j["op"] = op ? op->to_json() : JsonValue(nullptr);
        j["pointer"] = pointer;
        j["message"] = message;
        return j;
    }
};

/// @brief Outcome of a batch. `ok` holds exactly when `errors` is empty.
struct PatchResult {
    bool ok = true;
    std::vector<PatchError> errors;
    JsonValue final_doc;

    [[nodiscard]] JsonValue to_json() const {
        JsonValue j = JsonValue::object();
        j["ok"] = ok;
        Array errs;
        errs.reserve(errors.size());
        for (const auto& e : errors) errs.push_back(e.to_json());
        j["errors"] = std::move(errs);
        j["finalDoc"] = final_doc;
        return j;
    }
};

} // namespace patchguard
