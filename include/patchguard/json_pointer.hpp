#pragma once

/// @file json_pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing, escaping and navigation.
///
///   "" or "/" -> root document
///   "/foo"    -> key "foo"
///   "/foo/0"  -> first element of array "foo"
///   "/a~1b"   -> key "a/b" (~ encoding: ~0 = ~, ~1 = /)
///   "/arr/-"  -> append position of "arr"; never resolves to a value
///
/// A bare "/" is treated as the root rather than as the empty key, since
/// callers use the two spellings interchangeably.
///
/// Navigation never throws for a well-formed pointer: a missing key, an
/// out-of-range or non-numeric array token, or a step into a scalar simply
/// yields nullptr from try_resolve().

#include "error.hpp"
#include "value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchguard {

class JsonPointer {
public:
    /// Construct empty pointer (references root document).
    JsonPointer() = default;

    /// Parse a pointer string. Throws PointerError when a non-root pointer
    /// does not start with '/'.
    explicit JsonPointer(std::string_view ptr) {
        if (ptr.empty() || ptr == "/") return;
        if (ptr[0] != '/') {
            throw PointerError("Invalid JSON Pointer (must start with \"/\"): " +
                               std::string(ptr));
        }
        split(ptr.substr(1), false);
    }

    /// Build from already decoded tokens.
    [[nodiscard]] static JsonPointer from_tokens(std::vector<std::string> tokens) {
        JsonPointer p;
        p.tokens_ = std::move(tokens);
        return p;
    }

    /// Lenient parse for paths typed by hand: a missing leading '/' is
    /// supplied, and when @p url_decode is set tokens containing '%' are
    /// percent-decoded after ~ unescaping. Never throws.
    [[nodiscard]] static JsonPointer parse_lenient(std::string_view ptr,
                                                   bool url_decode = true) {
        JsonPointer p;
        if (ptr.empty() || ptr == "/") return p;
        if (ptr[0] == '/') ptr.remove_prefix(1);
        p.split(ptr, url_decode);
        return p;
    }

    // ─── Navigation ──────────────────────────────────────────────────────

    /// Resolve against a JSON value; nullptr when the location does not exist.
    [[nodiscard]] const JsonValue* try_resolve(const JsonValue& root) const noexcept {
        const JsonValue* cur = &root;
        for (const auto& tok : tokens_) {
            cur = step(*cur, tok);
            if (!cur) return nullptr;
        }
        return cur;
    }

    [[nodiscard]] JsonValue* try_resolve(JsonValue& root) const noexcept {
        return const_cast<JsonValue*>(
            try_resolve(static_cast<const JsonValue&>(root)));
    }

    /// Resolve against a JSON value. Throws PointerError when absent.
    const JsonValue& resolve(const JsonValue& root) const {
        const auto* p = try_resolve(root);
        if (!p) {
            throw PointerError("path does not exist: " + to_string(),
                               errc::pointer_not_found);
        }
        return *p;
    }

    JsonValue& resolve(JsonValue& root) const {
        return const_cast<JsonValue&>(resolve(static_cast<const JsonValue&>(root)));
    }

    /// @brief The container that would hold this location, and the final token.
    ///
    /// `parent` is nullptr for the root pointer and when the parent path
    /// itself does not resolve.
    struct ParentRef {
        JsonValue* parent = nullptr;
        std::string key;
    };

    [[nodiscard]] ParentRef resolve_parent_and_key(JsonValue& root) const {
        if (tokens_.empty()) return {};
        return {parent().try_resolve(root), tokens_.back()};
    }

    // ─── Composition ─────────────────────────────────────────────────────

    [[nodiscard]] JsonPointer append(std::string_view token) const {
        JsonPointer p = *this;
        p.tokens_.emplace_back(token);
        return p;
    }

    [[nodiscard]] JsonPointer append(size_t index) const {
        return append(std::to_string(index));
    }

    /// Parent pointer (empty if already root).
    [[nodiscard]] JsonPointer parent() const {
        JsonPointer p;
        if (!tokens_.empty())
            p.tokens_.assign(tokens_.begin(), tokens_.end() - 1);
        return p;
    }

    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] size_t depth() const noexcept { return tokens_.size(); }
    [[nodiscard]] const std::string& back() const { return tokens_.back(); }

    [[nodiscard]] const std::vector<std::string>& tokens() const noexcept {
        return tokens_;
    }

    /// Serialize back to RFC 6901 form ("" for the root).
    [[nodiscard]] std::string to_string() const {
        std::string result;
        for (const auto& tok : tokens_) {
            result += '/';
            result += escape(tok);
        }
        return result;
    }

    bool operator==(const JsonPointer& o) const { return tokens_ == o.tokens_; }
    bool operator!=(const JsonPointer& o) const { return tokens_ != o.tokens_; }

    // ─── Token helpers ───────────────────────────────────────────────────

    /// Escape for RFC 6901: ~ -> ~0, / -> ~1
    [[nodiscard]] static std::string escape(std::string_view s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            if (c == '~') result += "~0";
            else if (c == '/') result += "~1";
            else result += c;
        }
        return result;
    }

    /// Unescape RFC 6901: ~1 -> /, ~0 -> ~
    [[nodiscard]] static std::string unescape(std::string_view sv) {
        std::string result;
        result.reserve(sv.size());
        for (size_t i = 0; i < sv.size(); ++i) {
            if (sv[i] == '~' && i + 1 < sv.size()) {
                if (sv[i + 1] == '1') { result += '/'; ++i; continue; }
                if (sv[i + 1] == '0') { result += '~'; ++i; continue; }
            }
            result += sv[i];
        }
        return result;
    }

    /// Decode %XX sequences; malformed sequences are kept verbatim.
    [[nodiscard]] static std::string percent_decode(std::string_view sv) {
        auto hex = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        std::string result;
        result.reserve(sv.size());
        for (size_t i = 0; i < sv.size(); ++i) {
            if (sv[i] == '%' && i + 2 < sv.size()) {
                int hi = hex(sv[i + 1]);
                int lo = hex(sv[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    result += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
            }
            result += sv[i];
        }
        return result;
    }

    /// A non-empty run of decimal digits, as an index. "-" and anything
    /// else yield nullopt.
    [[nodiscard]] static std::optional<size_t> parse_index(std::string_view tok) noexcept {
        if (tok.empty() || tok.size() > 18) return std::nullopt;
        size_t idx = 0;
        for (char c : tok) {
            if (c < '0' || c > '9') return std::nullopt;
            idx = idx * 10 + static_cast<size_t>(c - '0');
        }
        return idx;
    }

    /// parse_index() without leading zeros: "0" and "12", never "012".
    [[nodiscard]] static std::optional<size_t> parse_canonical_index(std::string_view tok) noexcept {
        if (tok.size() > 1 && tok[0] == '0') return std::nullopt;
        return parse_index(tok);
    }

    /// True for "-" or a decimal index: the token addresses an array slot.
    [[nodiscard]] static bool is_array_token(std::string_view tok) noexcept {
        return tok == "-" || parse_index(tok).has_value();
    }

private:
    std::vector<std::string> tokens_;

    void split(std::string_view src, bool url_decode) {
        for (;;) {
            auto pos = src.find('/');
            auto seg = src.substr(0, pos);
            std::string tok = unescape(seg);
            if (url_decode && tok.find('%') != std::string::npos)
                tok = percent_decode(tok);
            tokens_.push_back(std::move(tok));
            if (pos == std::string_view::npos) break;
            src.remove_prefix(pos + 1);
        }
    }

    static const JsonValue* step(const JsonValue& cur, const std::string& tok) noexcept {
        if (cur.is_object()) return cur.find(tok);
        if (cur.is_array()) {
            auto idx = parse_index(tok);
            const auto& arr = cur.as_array();
            if (!idx || *idx >= arr.size()) return nullptr;
            return &arr[*idx];
        }
        return nullptr;
    }
};

/// Resolve a pointer string; nullptr when absent. Throws PointerError for a
/// malformed pointer.
[[nodiscard]] inline const JsonValue* try_resolve(const JsonValue& root,
                                                  std::string_view pointer) {
    return JsonPointer(pointer).try_resolve(root);
}

} // namespace patchguard
