#pragma once

/// @file serializer.hpp
/// @brief JSON serializer.
///
/// Features:
///   - Compact (`,` and `:` without spaces) and indented output
///   - ensure_ascii mode for encoding non-ASCII -> \uXXXX
///   - sort_keys mode; canonical() combines it with compact output and is
///     the equality key used for duplicate detection
///   - Shortest round-trip float formatting; integral floats keep ".0"

#include "config.hpp"
#include "detail/utf8.hpp"
#include "value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace patchguard {

/// @brief Serialization options.
struct SerializeOptions {
    int indent = -1;            ///< Indentation (-1 = compact, >= 0 = pretty-printed)
    bool ensure_ascii = false;  ///< Encode all non-ASCII characters as \uXXXX
    bool sort_keys = false;     ///< Sort object keys (byte order)
};

namespace detail {

inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// @brief Appends a number in the textual form used across the library.
///
/// NaN and infinities have no JSON form and are written as null.
inline void write_number(const JsonValue& v, std::string& out) {
    char buf[32];
    if (v.is_integer()) {
        auto res = std::to_chars(buf, buf + sizeof(buf), v.as_integer());
        out.append(buf, res.ptr);
        return;
    }
    const double d = v.as_float();
    if (PATCHGUARD_UNLIKELY(!std::isfinite(d))) {
        out.append("null");
        return;
    }
    auto res = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text(buf, static_cast<size_t>(res.ptr - buf));
    out.append(text);
    if (text.find_first_of(".e") == std::string_view::npos) out.append(".0");
}

/// @brief Appends @p s as a quoted JSON string literal.
inline void write_string(std::string_view s, std::string& out, bool ensure_ascii) {
    out.push_back('"');
    const char* ptr = s.data();
    const char* const end = ptr + s.size();
    while (ptr < end) {
        auto c = static_cast<unsigned char>(*ptr);
        switch (c) {
            case '"':  out.append("\\\""); ++ptr; continue;
            case '\\': out.append("\\\\"); ++ptr; continue;
            case '\b': out.append("\\b");  ++ptr; continue;
            case '\f': out.append("\\f");  ++ptr; continue;
            case '\n': out.append("\\n");  ++ptr; continue;
            case '\r': out.append("\\r");  ++ptr; continue;
            case '\t': out.append("\\t");  ++ptr; continue;
            default: break;
        }
        if (c < 0x20) {
            out.append("\\u00");
            out.push_back(kHexDigits[(c >> 4) & 0xF]);
            out.push_back(kHexDigits[c & 0xF]);
            ++ptr;
        } else if (c >= 0x80 && ensure_ascii) {
            utf8::encode_escaped(utf8::decode(ptr, end), out);
        } else {
            out.push_back(static_cast<char>(c));
            ++ptr;
        }
    }
    out.push_back('"');
}

class Serializer {
public:
    explicit Serializer(const SerializeOptions& opts) noexcept : opts_(opts) {}

    [[nodiscard]] std::string serialize(const JsonValue& value) {
        out_.clear();
        depth_ = 0;
        write_value(value);
        return std::move(out_);
    }

private:
    SerializeOptions opts_;
    std::string out_;
    int depth_ = 0;

    bool pretty() const noexcept { return opts_.indent >= 0; }

    void write_newline_indent() {
        if (!pretty()) return;
        out_.push_back('\n');
        out_.append(static_cast<size_t>(depth_ * opts_.indent), ' ');
    }

    void write_value(const JsonValue& v) {
        switch (v.type()) {
            case Type::Null:    out_.append("null"); break;
            case Type::Bool:    out_.append(v.as_bool() ? "true" : "false"); break;
            case Type::Integer:
            case Type::Float:   write_number(v, out_); break;
            case Type::String:  write_string(v.as_string(), out_, opts_.ensure_ascii); break;
            case Type::Array:   write_array(v.as_array()); break;
            case Type::Object:  write_object(v.as_object()); break;
        }
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_.append("[]"); return; }
        out_.push_back('[');
        ++depth_;
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out_.push_back(',');
            write_newline_indent();
            write_value(arr[i]);
        }
        --depth_;
        write_newline_indent();
        out_.push_back(']');
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_.append("{}"); return; }

        std::vector<const Object::value_type*> members;
        members.reserve(obj.size());
        for (const auto& kv : obj) members.push_back(&kv);
        if (opts_.sort_keys) {
            std::sort(members.begin(), members.end(),
                      [](const Object::value_type* a, const Object::value_type* b) {
                          return a->first < b->first;
                      });
        }

        out_.push_back('{');
        ++depth_;
        for (size_t i = 0; i < members.size(); ++i) {
            if (i > 0) out_.push_back(',');
            write_newline_indent();
            write_string(members[i]->first, out_, opts_.ensure_ascii);
            out_.append(pretty() ? ": " : ":");
            write_value(members[i]->second);
        }
        --depth_;
        write_newline_indent();
        out_.push_back('}');
    }
};

} // namespace detail

// ─── JsonValue::dump() implementation ────────────────────────────────────

inline std::string JsonValue::dump(int indent) const {
    SerializeOptions opts;
    opts.indent = indent;
    return detail::Serializer(opts).serialize(*this);
}

inline std::string JsonValue::dump(const SerializeOptions& opts) const {
    return detail::Serializer(opts).serialize(*this);
}

/// @brief Free function: serialize to string.
[[nodiscard]] inline std::string serialize(const JsonValue& value, int indent = -1) {
    return value.dump(indent);
}

/// @brief Serialize with extended options.
[[nodiscard]] inline std::string serialize(const JsonValue& value,
                                           const SerializeOptions& opts) {
    return value.dump(opts);
}

/// @brief Compact, key-sorted form. Objects that differ only in key order
/// share the same canonical text.
[[nodiscard]] inline std::string canonical(const JsonValue& value) {
    SerializeOptions opts;
    opts.sort_keys = true;
    return value.dump(opts);
}

inline std::ostream& operator<<(std::ostream& os, const JsonValue& value) {
    return os << value.dump();
}

} // namespace patchguard
