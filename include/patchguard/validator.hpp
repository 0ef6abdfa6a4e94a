#pragma once

/// @file validator.hpp
/// @brief Validation of a JsonValue against a practical JSON-Schema subset.
///
/// Keywords: $ref, anyOf, allOf, enum, type, pattern, format, minimum,
/// maximum, items, required, properties, additionalProperties.
///
/// `$ref` is resolved lazily against the root schema at each visited node.
/// Each instance position allows PATCHGUARD_MAX_REF_HOPS ref hops; the count
/// resets when validation descends into a child value. A recursive schema is
/// therefore checked to the full depth of the instance, while a ref loop that
/// never consumes instance depth degrades to "accept", as does a `$ref`
/// whose target is missing or not local.

#include "config.hpp"
#include "formats.hpp"
#include "json_pointer.hpp"
#include "log.hpp"
#include "schema.hpp"
#include "serializer.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace patchguard {

/// A single schema violation: where it happened and what went wrong.
struct ValidationError {
    std::string pointer;
    std::string message;

    [[nodiscard]] bool operator==(const ValidationError& o) const {
        return pointer == o.pointer && message == o.message;
    }
};

/// @brief Schema type name of an instance.
///
/// Same as JSON type names, except that integers and floats with no
/// fractional part are "integer", other numbers "number".
[[nodiscard]] inline const char* type_of_instance(const JsonValue& v) noexcept {
    switch (v.type()) {
        case Type::Null:    return "null";
        case Type::Bool:    return "boolean";
        case Type::Integer: return "integer";
        case Type::Float: {
            double d = v.get_or(0.0);
            return std::isfinite(d) && std::floor(d) == d ? "integer" : "number";
        }
        case Type::String:  return "string";
        case Type::Array:   return "array";
        case Type::Object:  return "object";
    }
    return "null";
}

class Validator {
public:
    /// @p root is the schema `$ref`s resolve against; it must outlive the validator.
    explicit Validator(const JsonValue& root) : root_(root) {}

    /// Validate @p instance against the root schema.
    [[nodiscard]] std::vector<ValidationError> validate(const JsonValue& instance) const {
        return validate(root_, instance, "");
    }

    /// Validate @p instance against @p schema, reporting pointers under @p at.
    [[nodiscard]] std::vector<ValidationError> validate(const JsonValue& schema,
                                                        const JsonValue& instance,
                                                        const std::string& at) const {
        std::vector<ValidationError> errors;
        visit(schema, instance, at, 0, errors);
        return errors;
    }

    [[nodiscard]] bool is_valid(const JsonValue& schema, const JsonValue& instance) const {
        return validate(schema, instance, "").empty();
    }

    [[nodiscard]] const JsonValue& root() const noexcept { return root_; }

private:
    const JsonValue& root_;
    mutable std::unordered_map<std::string, std::regex> regex_cache_;

    /// Compiled `pattern`, or nullptr if it is not a valid ECMAScript regex.
    const std::regex* compiled(const std::string& pattern) const {
        auto it = regex_cache_.find(pattern);
        if (it != regex_cache_.end()) return &it->second;
        try {
            auto [pos, inserted] = regex_cache_.emplace(pattern, std::regex(pattern, std::regex::ECMAScript));
            return &pos->second;
        } catch (const std::regex_error& e) {
            log::get()->debug("invalid schema pattern {}: {}", pattern, e.what());
            return nullptr;
        }
    }

    static void push(std::vector<ValidationError>& errors, const std::string& at, std::string msg) {
        errors.push_back({at.empty() ? std::string("/") : at, std::move(msg)});
    }

    static std::string child(const std::string& at, std::string_view token) {
        return at + "/" + JsonPointer::escape(token);
    }

    void visit(const JsonValue& node, const JsonValue& instance, const std::string& at,
               int hops, std::vector<ValidationError>& errors) const {
        const JsonValue* schema = &node;
        while (const auto* ref = schema->find("$ref")) {
            if (!ref->is_string()) break;
            if (++hops > PATCHGUARD_MAX_REF_HOPS) {
                log::get()->debug("$ref hop limit reached at {}; accepting value", at.empty() ? "/" : at);
                return;
            }
            const JsonValue& next = resolve_ref(*schema, root_);
            if (&next == schema) return;  // unresolvable: accept
            schema = &next;
        }
        const JsonValue& s = *schema;

        if (s.is_null()) return;
        if (s.is_bool()) {
            if (!s.get_or(true)) push(errors, at, "schema \"false\" does not accept any value");
            return;
        }
        if (!s.is_object() || is_permissive(s)) return;

        if (const auto* any_of = s.find("anyOf"); any_of && any_of->is_array()) {
            for (const auto& branch : any_of->as_array()) {
                std::vector<ValidationError> sub;
                visit(branch, instance, at, hops, sub);
                if (sub.empty()) return;
            }
            push(errors, at, "failed in anyOf (no alternative accepted the value)");
            return;
        }

        if (const auto* all_of = s.find("allOf"); all_of && all_of->is_array()) {
            for (const auto& branch : all_of->as_array())
                visit(branch, instance, at, hops, errors);
        }

        if (const auto* en = s.find("enum"); en && en->is_array()) {
            const auto& options = en->as_array();
            if (std::find(options.begin(), options.end(), instance) == options.end())
                push(errors, at, fmt::format("value is not in enum: {}", instance.dump()));
        }

        const std::string inst_type = type_of_instance(instance);
        const auto allowed = schema_types(s);
        if (!allowed.empty()) {
            const bool matches =
                std::find(allowed.begin(), allowed.end(), inst_type) != allowed.end() ||
                (inst_type == "integer" &&
                 std::find(allowed.begin(), allowed.end(), "number") != allowed.end());
            if (!matches) {
                push(errors, at, fmt::format("invalid type: expected {}, received {}",
                                             fmt::join(allowed, " | "), inst_type));
                return;
            }
        }

        if (instance.is_string()) {
            check_string(s, instance.as_string(), at, errors);
        } else if (instance.is_number()) {
            check_number(s, instance.as_number(), at, errors);
        } else if (instance.is_array()) {
            const auto* items = s.find("items");
            const bool truthy = items && !(items->is_bool() && !items->get_or(true)) &&
                                !items->is_null() && !(items->is_object() && items->empty());
            if (truthy) {
                const auto& arr = instance.as_array();
                for (size_t i = 0; i < arr.size(); ++i)
                    visit(*items, arr[i], at + "/" + std::to_string(i), 0, errors);
            }
        } else if (instance.is_object()) {
            check_object(s, instance.as_object(), at, errors);
        }
    }

    void check_string(const JsonValue& s, const std::string& value, const std::string& at,
                      std::vector<ValidationError>& errors) const {
        if (const auto* pattern = s.find("pattern"); pattern && pattern->is_string() &&
                                                      !pattern->as_string().empty()) {
            const std::string& p = pattern->as_string();
            if (value.size() > PATCHGUARD_MAX_REGEX_INPUT) {
                push(errors, at, fmt::format("string of {} bytes is too long to check against pattern "
                                             "(limit {}): {}", value.size(), PATCHGUARD_MAX_REGEX_INPUT, p));
            } else if (const std::regex* re = compiled(p)) {
                if (!std::regex_search(value, *re))
                    push(errors, at, fmt::format("string does not match pattern: {}", p));
            } else {
                push(errors, at, fmt::format("schema pattern is not a valid regular expression: {}", p));
            }
        }
        if (const auto* format = s.find("format"); format && format->is_string() &&
                                                    !format->as_string().empty()) {
            if (!check_format(format->as_string(), value))
                push(errors, at, fmt::format("string does not respect format: {}", format->as_string()));
        }
    }

    static void check_number(const JsonValue& s, double value, const std::string& at,
                             std::vector<ValidationError>& errors) {
        if (const auto* min = s.find("minimum"); min && min->is_number()) {
            if (!(value >= min->as_number()))
                push(errors, at, fmt::format("number < minimum ({})", min->dump()));
        }
        if (const auto* max = s.find("maximum"); max && max->is_number()) {
            if (!(value <= max->as_number()))
                push(errors, at, fmt::format("number > maximum ({})", max->dump()));
        }
    }

    void check_object(const JsonValue& s, const Object& obj, const std::string& at,
                      std::vector<ValidationError>& errors) const {
        const auto* props = s.find("properties");
        if (const auto* req = s.find("required"); req && req->is_array()) {
            for (const auto& r : req->as_array()) {
                if (r.is_string() && !obj.contains(r.as_string()))
                    push(errors, at, fmt::format("required field missing: {}", r.as_string()));
            }
        }
        const auto* ap = s.find("additionalProperties");
        for (const auto& [key, val] : obj) {
            if (const JsonValue* prop = props ? props->find(key) : nullptr) {
                visit(*prop, val, child(at, key), 0, errors);
            } else if (ap && ap->is_bool() && !ap->get_or(true)) {
                push(errors, child(at, key),
                     fmt::format("property not allowed (additionalProperties=false): {}", key));
            } else if (ap && ap->is_object() && !ap->empty()) {
                visit(*ap, val, child(at, key), 0, errors);
            }
        }
    }
};

/// @brief Validate @p instance against @p schema, resolving refs against @p root.
[[nodiscard]] inline std::vector<ValidationError> validate(const JsonValue& schema,
                                                           const JsonValue& instance,
                                                           const std::string& at,
                                                           const JsonValue& root) {
    return Validator(root).validate(schema, instance, at);
}

/// @brief Validate @p instance against a self-contained @p schema.
[[nodiscard]] inline std::vector<ValidationError> validate(const JsonValue& schema,
                                                           const JsonValue& instance) {
    return Validator(schema).validate(instance);
}

} // namespace patchguard
