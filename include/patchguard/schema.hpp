#pragma once

/// @file schema.hpp
/// @brief Schema resolution: `$ref` lookup, ref inlining, candidate
/// sub-schemas at a document pointer, and schema-derived skeletons.
///
/// A schema is an ordinary JsonValue. `true`, `null` and the permissive
/// sentinel `{"__any": true}` accept everything; `false` accepts nothing.
/// Only same-document references of the form "#/..." are followed.

#include "config.hpp"
#include "json_pointer.hpp"
#include "log.hpp"
#include "value.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace patchguard {

/// The permissive sentinel schema: {"__any": true}.
[[nodiscard]] inline const JsonValue& permissive_schema() {
    static const JsonValue instance(Object{{"__any", JsonValue(true)}});
    return instance;
}

/// True for schemas that accept any value.
[[nodiscard]] inline bool is_permissive(const JsonValue& schema) noexcept {
    if (schema.is_null()) return true;
    if (schema.is_bool()) return schema.get_or(false);
    if (!schema.is_object()) return false;
    const auto* any = schema.find("__any");
    return any && any->is_bool() && any->get_or(false);
}

/// The `type` keyword as a list ("string" -> ["string"]); empty when absent.
[[nodiscard]] inline std::vector<std::string> schema_types(const JsonValue& schema) {
    std::vector<std::string> out;
    const auto* t = schema.find("type");
    if (!t) return out;
    if (t->is_string()) {
        out.push_back(t->as_string());
    } else if (t->is_array()) {
        for (const auto& v : t->as_array())
            if (v.is_string()) out.push_back(v.as_string());
    }
    return out;
}

/// @brief Follow the `$ref` chain starting at @p schema.
///
/// Stops after PATCHGUARD_MAX_REF_HOPS hops, at a ref already seen in this
/// chain, at a non-local ref, or at a ref whose target does not exist. In
/// each of those cases the last node reached is returned unchanged, still
/// carrying its `$ref`. The result refers into @p schema or @p root.
[[nodiscard]] inline const JsonValue& resolve_ref(const JsonValue& schema, const JsonValue& root) {
    const JsonValue* current = &schema;
    std::unordered_set<std::string> seen;
    for (int hop = 0; hop < PATCHGUARD_MAX_REF_HOPS; ++hop) {
        const auto* ref = current->find("$ref");
        if (!ref || !ref->is_string()) return *current;
        const std::string& target = ref->as_string();
        if (!seen.insert(target).second) return *current;
        if (target.rfind("#/", 0) != 0 && target != "#") {
            log::get()->debug("unresolved $ref (not a local reference): {}", target);
            return *current;
        }
        const JsonValue* resolved = JsonPointer::parse_lenient(target.substr(1), false).try_resolve(root);
        if (!resolved) {
            log::get()->debug("unresolved $ref (no such target): {}", target);
            return *current;
        }
        current = resolved;
    }
    return *current;
}

/// True when @p schema still carries a `$ref` that resolve_ref could not follow.
[[nodiscard]] inline bool has_unresolved_ref(const JsonValue& schema) {
    return schema.is_object() && schema.contains("$ref");
}

namespace detail {

inline JsonValue inline_refs_impl(const JsonValue& schema, const JsonValue& root,
                                  const std::vector<std::string>& seen) {
    if (!schema.is_object()) return schema;

    if (const auto* ref = schema.find("$ref"); ref && ref->is_string()) {
        const std::string& target = ref->as_string();
        if (std::find(seen.begin(), seen.end(), target) != seen.end())
            return permissive_schema();
        const JsonValue& resolved = resolve_ref(schema, root);
        if (&resolved == &schema) return schema;
        auto next_seen = seen;
        next_seen.push_back(target);
        return inline_refs_impl(resolved, root, next_seen);
    }

    Object out;
    for (const auto& [key, val] : schema.as_object()) {
        if (key == "properties" && val.is_object()) {
            Object props;
            for (const auto& [name, sub] : val.as_object())
                props.insert(name, inline_refs_impl(sub, root, seen));
            out.insert(key, JsonValue(std::move(props)));
        } else if ((key == "items" || key == "additionalProperties") && val.is_object()) {
            out.insert(key, inline_refs_impl(val, root, seen));
        } else if ((key == "anyOf" || key == "oneOf" || key == "allOf") && val.is_array()) {
            Array branches;
            for (const auto& sub : val.as_array())
                branches.push_back(inline_refs_impl(sub, root, seen));
            out.insert(key, JsonValue(std::move(branches)));
        } else {
            // definitions / $defs and unknown keywords are kept as-is.
            out.insert(key, val);
        }
    }
    return JsonValue(std::move(out));
}

} // namespace detail

/// @brief A copy of @p schema with every local `$ref` replaced by its target.
///
/// A ref that recurs inside its own expansion becomes the permissive
/// sentinel; unresolvable refs are left in place.
[[nodiscard]] inline JsonValue inline_refs(const JsonValue& schema, const JsonValue& root) {
    return detail::inline_refs_impl(schema, root, {});
}

[[nodiscard]] inline JsonValue inline_refs(const JsonValue& schema) {
    return inline_refs(schema, schema);
}

/// @brief Candidate schemas for the members of an object described by @p schema.
[[nodiscard]] inline std::vector<const JsonValue*> candidates_for_property(
        const JsonValue& schema, std::string_view key) {
    if (is_permissive(schema) || !schema.is_object()) {
        if (schema.is_bool() && !schema.get_or(true)) return {};
        return {&permissive_schema()};
    }
    if (const auto* any_of = schema.find("anyOf"); any_of && any_of->is_array()) {
        std::vector<const JsonValue*> all;
        for (const auto& branch : any_of->as_array()) {
            auto sub = candidates_for_property(branch, key);
            all.insert(all.end(), sub.begin(), sub.end());
        }
        return all;
    }
    if (const auto* props = schema.find("properties")) {
        if (const auto* p = props->find(key)) return {p};
    }
    const auto* ap = schema.find("additionalProperties");
    if (!ap || ap->is_null() || (ap->is_bool() && ap->get_or(false))) return {&permissive_schema()};
    if (ap->is_bool()) return {};
    return {ap};
}

/// @brief Candidate schemas for the elements of an array described by @p schema.
[[nodiscard]] inline std::vector<const JsonValue*> candidates_for_index(const JsonValue& schema) {
    if (is_permissive(schema) || !schema.is_object()) {
        if (schema.is_bool() && !schema.get_or(true)) return {};
        return {&permissive_schema()};
    }
    if (const auto* any_of = schema.find("anyOf"); any_of && any_of->is_array()) {
        std::vector<const JsonValue*> all;
        for (const auto& branch : any_of->as_array()) {
            auto sub = candidates_for_index(branch);
            all.insert(all.end(), sub.begin(), sub.end());
        }
        return all;
    }
    const auto* items = schema.find("items");
    if (items && (items->is_object() ? !items->empty() : items->is_bool() && !items->get_or(true)))
        return {items};
    return {&permissive_schema()};
}

/// @brief Every sub-schema of @p root that may govern the value at @p ptr.
///
/// Walks the pointer one token at a time. A numeric token or "-" descends
/// through `items` when the current schema may describe an array, any other
/// token (or a numeric one on a schema that cannot be an array) through
/// `properties` / `additionalProperties`. `anyOf` branches are expanded,
/// never merged. When a step leaves no candidate, or more than
/// PATCHGUARD_MAX_CANDIDATES, the permissive sentinel is used. Returned
/// pointers refer into @p root or to permissive_schema().
[[nodiscard]] inline std::vector<const JsonValue*> candidates_at_pointer(
        const JsonValue& root, const JsonPointer& ptr) {
    std::vector<const JsonValue*> candidates{&root};
    for (const auto& tok : ptr.tokens()) {
        std::vector<const JsonValue*> next;
        const bool numeric = tok == "-" || JsonPointer::parse_index(tok).has_value();
        for (const JsonValue* cand : candidates) {
            const JsonValue& s = resolve_ref(*cand, root);
            if (s.is_bool() && !s.get_or(true)) continue;
            const auto types = schema_types(s);
            auto declares = [&](const char* t) {
                return std::find(types.begin(), types.end(), t) != types.end();
            };
            const bool open = is_permissive(s) || types.empty();
            const bool could_be_array = open || declares("array");
            const bool could_be_object = open || declares("object");

            std::vector<const JsonValue*> found;
            if (numeric && could_be_array) found = candidates_for_index(s);
            else if (could_be_object) found = candidates_for_property(s, tok);
            for (const JsonValue* f : found) next.push_back(&resolve_ref(*f, root));
        }
        if (next.size() > static_cast<size_t>(PATCHGUARD_MAX_CANDIDATES)) {
            log::get()->debug("{} candidate schemas at {}; falling back to the permissive schema",
                              next.size(), ptr.to_string());
            next.assign(1, &permissive_schema());
        }
        if (next.empty()) next.push_back(&permissive_schema());
        candidates = std::move(next);
    }
    for (auto& c : candidates) c = &resolve_ref(*c, root);
    return candidates;
}

/// @brief Whether an object described by @p schema may hold @p key.
/// Only an explicit `additionalProperties: false` without a matching
/// `properties` entry forbids a key.
[[nodiscard]] inline bool is_prop_allowed(const JsonValue& schema, std::string_view key) {
    if (schema.is_bool()) return schema.get_or(true);
    if (!schema.is_object() || is_permissive(schema) || schema.contains("anyOf")) return true;
    if (const auto* props = schema.find("properties"); props && props->contains(key)) return true;
    const auto* ap = schema.find("additionalProperties");
    return !(ap && ap->is_bool() && !ap->get_or(true));
}

/// @brief Whether @p schema lists @p key in `required`.
[[nodiscard]] inline bool is_required(const JsonValue& schema, std::string_view key) {
    if (!schema.is_object() || is_permissive(schema) || schema.contains("anyOf")) return false;
    const auto* req = schema.find("required");
    if (!req || !req->is_array()) return false;
    for (const auto& r : req->as_array())
        if (r.is_string() && r.as_string() == key) return true;
    return false;
}

/// @brief Minimal document for an object schema: each required property
/// set to [] (array-typed), {} (object-typed) or null. Property schemas are
/// `$ref`-resolved against @p root. Non-object schemas give {}.
[[nodiscard]] inline JsonValue build_base_doc(const JsonValue& schema, const JsonValue& root) {
    JsonValue base = JsonValue::object();
    const JsonValue& s = resolve_ref(schema, root);
    const auto types = schema_types(s);
    if (types.empty() || types.front() != "object") return base;
    const auto* req = s.find("required");
    if (!req || !req->is_array()) return base;
    const auto* props = s.find("properties");
    for (const auto& r : req->as_array()) {
        if (!r.is_string()) continue;
        const std::string& key = r.as_string();
        const JsonValue* prop = props ? props->find(key) : nullptr;
        const auto prop_types = prop ? schema_types(resolve_ref(*prop, root)) : std::vector<std::string>{};
        const std::string first = prop_types.empty() ? std::string() : prop_types.front();
        if (first == "array") base[key] = JsonValue::array();
        else if (first == "object") base[key] = JsonValue::object();
        else base[key] = nullptr;
    }
    return base;
}

[[nodiscard]] inline JsonValue build_base_doc(const JsonValue& schema) {
    return build_base_doc(schema, schema);
}

} // namespace patchguard
