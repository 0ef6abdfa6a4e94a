#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for patchguard.

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchguard {

// ─── Forward declarations ───────────────────────────────────────────────
class JsonValue;

/// JSON value types
enum class Type : uint8_t {
    Null    = 0,
    Bool    = 1,
    Integer = 2,
    Float   = 3,
    String  = 4,
    Array   = 5,
    Object  = 6
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:    return "null";
        case Type::Bool:    return "bool";
        case Type::Integer: return "integer";
        case Type::Float:   return "float";
        case Type::String:  return "string";
        case Type::Array:   return "array";
        case Type::Object:  return "object";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<JsonValue>;

/// @brief JSON object: key-value pairs kept in insertion order.
///
/// Documents built through patches are small and their key order is
/// visible to callers (rendering, previews), so lookup is a linear scan
/// over the entries rather than a hash index.
struct Object {
    using value_type   = std::pair<std::string, JsonValue>;
    using storage_type = std::vector<value_type>;
    using size_type    = size_t;

    storage_type entries;

    Object() = default;
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;
    ~Object();

    /// Initializer-list constructor: {{"key", value}, ...}
    Object(std::initializer_list<value_type> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin()  const noexcept { return entries.begin(); }
    auto end()    const noexcept { return entries.end(); }

    // ─── Methods (defined after JsonValue in value.hpp) ─────────────────

    JsonValue* find(std::string_view key) noexcept;
    const JsonValue* find(std::string_view key) const noexcept;

    bool contains(std::string_view key) const noexcept;

    /// Access or create an element by key.
    JsonValue& operator[](std::string_view key);

    /// Const access by key. Throws OutOfRangeError if not found.
    const JsonValue& at(std::string_view key) const;

    /// Insert, or overwrite in place when the key already exists.
    void insert(std::string key, JsonValue value);

    /// Erase by key. Returns false when the key is absent.
    bool erase(std::string_view key);

    void clear() noexcept { entries.clear(); }

    /// Comparison ignores key order.
    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

    /// Keys in insertion order.
    std::vector<std::string> keys() const;
};

struct SerializeOptions;

} // namespace patchguard
