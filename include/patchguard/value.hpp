#pragma once

/// @file value.hpp
/// @brief Library core: JsonValue, a tagged union over the JSON types.
///
/// Implementation:
///   - Scalars (bool, int64_t, double) stored inline
///   - Strings, arrays and objects owned through heap pointers
///   - Manual resource management (copy/move/destroy); copies are deep
///   - Objects keep keys in insertion order
///   - Equality compares integers and floats numerically and ignores
///     object key order

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace patchguard {

class JsonValue {
public:
    JsonValue() noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    JsonValue(int v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(long v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(long long v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(unsigned v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(unsigned long v) noexcept : kind_(Type::Integer) { init_unsigned(v); }
    JsonValue(unsigned long long v) noexcept : kind_(Type::Integer) { init_unsigned(v); }
    JsonValue(double v) noexcept : kind_(Type::Float) { u_.d = v; }
    JsonValue(const char* v) : kind_(Type::Null) {
        u_.i = 0;
        if (PATCHGUARD_UNLIKELY(!v)) return;
        kind_ = Type::String;
        u_.str = new std::string(v);
    }
    JsonValue(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }

    JsonValue(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    JsonValue(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    JsonValue(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    JsonValue(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    JsonValue(const JsonValue& o) : kind_(o.kind_) { copy_payload(o); }
    JsonValue(JsonValue&& o) noexcept : kind_(o.kind_) {
        std::memcpy(&u_, &o.u_, sizeof(u_));
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    JsonValue& operator=(const JsonValue& o) {
        if (this != &o) { JsonValue tmp(o); swap(tmp); }
        return *this;
    }
    JsonValue& operator=(JsonValue&& o) noexcept {
        if (this != &o) {
            // o may be owned by this value's payload (v = std::move(v[0])).
            JsonValue tmp(std::move(o));
            swap(tmp);
        }
        return *this;
    }
    ~JsonValue() { destroy(); }

    void swap(JsonValue& o) noexcept {
        std::swap(kind_, o.kind_);
        Payload tmp;
        std::memcpy(&tmp, &u_, sizeof(u_));
        std::memcpy(&u_, &o.u_, sizeof(u_));
        std::memcpy(&o.u_, &tmp, sizeof(u_));
    }

    [[nodiscard]] static JsonValue array() { return JsonValue(Array{}); }
    [[nodiscard]] static JsonValue object() { return JsonValue(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] const char* type_name() const noexcept { return patchguard::type_name(kind_); }
    [[nodiscard]] bool is_null()    const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()    const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer() const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_float()   const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_string()  const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()   const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()  const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_number()  const noexcept { return is_integer() || is_float(); }
    /// Array or object.
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    bool as_bool() const {
        if (PATCHGUARD_UNLIKELY(!is_bool()))
            throw TypeError("expected bool, got " + std::string(type_name()));
        return u_.b;
    }
    int64_t as_integer() const {
        if (PATCHGUARD_UNLIKELY(!is_integer()))
            throw TypeError("expected integer, got " + std::string(type_name()));
        return u_.i;
    }
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        throw TypeError("expected number, got " + std::string(type_name()));
    }
    double as_number() const { return as_float(); }

    [[nodiscard]] const std::string& as_string() const {
        if (PATCHGUARD_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name()));
        return *u_.str;
    }
    [[nodiscard]] std::string_view as_string_view() const { return as_string(); }

    [[nodiscard]] const Array& as_array() const {
        if (PATCHGUARD_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name()));
        return *u_.arr;
    }
    Array& as_array() {
        if (PATCHGUARD_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name()));
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (PATCHGUARD_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name()));
        return *u_.obj;
    }
    Object& as_object() {
        if (PATCHGUARD_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name()));
        return *u_.obj;
    }

    /// Type-safe value access with fallback, no exceptions.
    template <typename T>
    [[nodiscard]] T get_or(const T& dv) const noexcept {
        if constexpr (std::is_same_v<T, bool>) {
            return is_bool() ? u_.b : dv;
        } else if constexpr (std::is_integral_v<T>) {
            if (is_integer()) return static_cast<T>(u_.i);
            if (is_float() && std::floor(u_.d) == u_.d) return static_cast<T>(u_.d);
            return dv;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (is_float()) return static_cast<T>(u_.d);
            if (is_integer()) return static_cast<T>(u_.i);
            return dv;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return is_string() ? *u_.str : dv;
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for get_or<T>()");
        }
    }

    JsonValue& operator[](size_t index) {
        auto& a = as_array();
        if (PATCHGUARD_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) + " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const JsonValue& operator[](size_t index) const {
        const auto& a = as_array();
        if (PATCHGUARD_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) + " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    JsonValue& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const JsonValue& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    /// Object member access. A null value silently becomes an empty object.
    JsonValue& operator[](std::string_view key) {
        if (is_null()) *this = object();
        if (PATCHGUARD_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name()));
        return (*u_.obj)[key];
    }
    const JsonValue& operator[](std::string_view key) const { return as_object().at(key); }
    JsonValue& operator[](const char* key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const char* key) const { return operator[](std::string_view(key)); }
    JsonValue& operator[](const std::string& key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const std::string& key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const JsonValue* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] JsonValue* find(std::string_view key) {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    void push_back(const JsonValue& v) { as_array().push_back(v); }
    void push_back(JsonValue&& v)      { as_array().push_back(std::move(v)); }

    void insert(std::string key, JsonValue v) {
        as_object().insert(std::move(key), std::move(v));
    }
    bool erase(std::string_view key) { return as_object().erase(key); }

    [[nodiscard]] bool operator==(const JsonValue& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number())
                return as_float() == other.as_float();
            return false;
        }
        switch (kind_) {
            case Type::Null:    return true;
            case Type::Bool:    return u_.b == other.u_.b;
            case Type::Integer: return u_.i == other.u_.i;
            case Type::Float:   return u_.d == other.u_.d;
            case Type::String:  return *u_.str == *other.u_.str;
            case Type::Array:   return *u_.arr == *other.u_.arr;
            case Type::Object:  return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

    /// Defined in serializer.hpp.
    [[nodiscard]] std::string dump(int indent = -1) const;
    [[nodiscard]] std::string dump(const SerializeOptions& opts) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    template <typename U>
    void init_unsigned(U v) noexcept {
        if (v <= static_cast<U>(std::numeric_limits<int64_t>::max())) {
            u_.i = static_cast<int64_t>(v);
        } else {
            kind_ = Type::Float;
            u_.d = static_cast<double>(v);
        }
    }

    void copy_payload(const JsonValue& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default: std::memcpy(&u_, &o.u_, sizeof(u_)); break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
        kind_ = Type::Null;
    }
};

// ─── Object member functions ─────────────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {}
inline Object::Object(Object&& o) noexcept : entries(std::move(o.entries)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) entries = o.entries;
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) entries = std::move(o.entries);
    return *this;
}
inline Object::Object(std::initializer_list<value_type> init) {
    for (const auto& kv : init) insert(kv.first, kv.second);
}

inline JsonValue* Object::find(std::string_view key) noexcept {
    for (auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline const JsonValue* Object::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline JsonValue& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    entries.emplace_back(std::string(key), JsonValue{});
    return entries.back().second;
}
inline const JsonValue& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (PATCHGUARD_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline void Object::insert(std::string key, JsonValue value) {
    if (auto* p = find(key)) { *p = std::move(value); return; }
    entries.emplace_back(std::move(key), std::move(value));
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) { entries.erase(it); return true; }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    // Key order does not matter for semantic comparison of JSON objects.
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}
inline std::vector<std::string> Object::keys() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& kv : entries) out.push_back(kv.first);
    return out;
}

} // namespace patchguard
