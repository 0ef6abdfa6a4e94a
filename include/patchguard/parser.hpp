#pragma once

/// @file parser.hpp
/// @brief Recursive descent JSON parser.
///
/// Features:
///   - Exception-free parsing via try_parse() with error_code
///   - Recursion depth limiting to protect against stack overflow
///   - Full UTF-8 support, including surrogate pairs
///   - Integers that do not fit int64_t degrade to double

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "value.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

namespace patchguard {
namespace detail {

class Parser {
public:
    /// @brief Parse a JSON string (with exceptions).
    [[nodiscard]] static JsonValue parse(std::string_view input,
                                         const ParseOptions& opts = {}) {
        Parser p(input.data(), input.data() + input.size(), opts);
        JsonValue result = p.parse_value();
        p.skip_ws_and_comments();
        if (PATCHGUARD_UNLIKELY(p.ptr_ < p.end_)) {
            p.error("unexpected trailing content", errc::trailing_content);
        }
        return result;
    }

    /// @brief Parse a JSON string (no exceptions, error_code).
    [[nodiscard]] static result<JsonValue> try_parse(
            std::string_view input, const ParseOptions& opts = {}) {
        try {
            return {parse(input, opts), {}};
        } catch (const ParseError& e) {
            return {JsonValue{}, e.code()};
        }
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    ParseOptions opts_;
    size_t depth_ = 0;
    size_t max_depth_;

    Parser(const char* begin, const char* end, const ParseOptions& opts) noexcept
        : ptr_(begin), end_(end), begin_(begin), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : PATCHGUARD_MAX_DEPTH) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation current_location() const noexcept {
        SourceLocation loc;
        loc.offset = static_cast<size_t>(ptr_ - begin_);
        for (const char* p = begin_; p < ptr_; ++p) {
            if (*p == '\n') { ++loc.line; loc.column = 1; }
            else { ++loc.column; }
        }
        return loc;
    }

    [[noreturn]] void error(const std::string& msg,
                            errc code = errc::unexpected_character) {
        throw ParseError(msg, current_location(), code);
    }

    [[noreturn]] void error_unexpected_end() {
        error("unexpected end of input", errc::unexpected_end_of_input);
    }

    [[noreturn]] void error_unexpected_char() {
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("unexpected character '") + *ptr_ + "'");
    }

    // ─── Depth tracking ──────────────────────────────────────────────────

    void push_depth() {
        if (PATCHGUARD_UNLIKELY(++depth_ > max_depth_)) {
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }
    void pop_depth() noexcept { --depth_; }

    // ─── Whitespace and comments ─────────────────────────────────────────

    void skip_whitespace() noexcept {
        while (ptr_ < end_) {
            char c = *ptr_;
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') ++ptr_;
            else return;
        }
    }

    void skip_comments() {
        while (ptr_ + 1 < end_ && *ptr_ == '/') {
            if (ptr_[1] == '/') {
                ptr_ += 2;
                while (ptr_ < end_ && *ptr_ != '\n') ++ptr_;
                skip_whitespace();
            } else if (ptr_[1] == '*') {
                ptr_ += 2;
                bool closed = false;
                while (ptr_ + 1 < end_) {
                    if (ptr_[0] == '*' && ptr_[1] == '/') {
                        ptr_ += 2;
                        closed = true;
                        break;
                    }
                    ++ptr_;
                }
                if (!closed) error("unterminated block comment", errc::invalid_comment);
                skip_whitespace();
            } else {
                break;
            }
        }
    }

    void skip_ws_and_comments() {
        skip_whitespace();
        if (opts_.allow_comments) skip_comments();
    }

    // ─── Character reading ───────────────────────────────────────────────

    void expect(char c) {
        if (PATCHGUARD_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("expected '") + c + "', got '" + *ptr_ + "'");
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        if (static_cast<size_t>(end_ - ptr_) < len ||
            std::memcmp(ptr_, literal, len) != 0) {
            error(std::string("expected '") + literal + "'", errc::invalid_literal);
        }
        ptr_ += len;
    }

    // ─── Value parsing ───────────────────────────────────────────────────

    JsonValue parse_value() {
        skip_ws_and_comments();
        if (PATCHGUARD_UNLIKELY(ptr_ >= end_)) error_unexpected_end();
        switch (*ptr_) {
            case '"': return JsonValue(parse_string());
            case '{': return parse_object();
            case '[': return parse_array();
            case 't': expect_literal("true");  return JsonValue(true);
            case 'f': expect_literal("false"); return JsonValue(false);
            case 'n': expect_literal("null");  return JsonValue(nullptr);
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return parse_number();
            default:
                error_unexpected_char();
        }
    }

    // ─── Strings ─────────────────────────────────────────────────────────

    std::string parse_string() {
        expect('"');
        std::string out;
        for (;;) {
            const char* run = ptr_;
            while (ptr_ < end_ && *ptr_ != '"' && *ptr_ != '\\' &&
                   static_cast<unsigned char>(*ptr_) >= 0x20) {
                ++ptr_;
            }
            out.append(run, static_cast<size_t>(ptr_ - run));
            if (PATCHGUARD_UNLIKELY(ptr_ >= end_)) {
                error("unterminated string", errc::unterminated_string);
            }
            char c = *ptr_;
            if (c == '"') {
                ++ptr_;
                return out;
            }
            if (c == '\\') {
                ++ptr_;
                parse_escape(out);
                continue;
            }
            error("control character in string", errc::unexpected_character);
        }
    }

    void parse_escape(std::string& out) {
        if (PATCHGUARD_UNLIKELY(ptr_ >= end_))
            error("unterminated escape sequence", errc::invalid_escape);
        char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  parse_unicode_escape(out); return;
            default:
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    static int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    uint32_t parse_hex4() {
        if (PATCHGUARD_UNLIKELY(end_ - ptr_ < 4))
            error("incomplete unicode escape", errc::invalid_unicode_escape);
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            int nib = hex_value(ptr_[i]);
            if (PATCHGUARD_UNLIKELY(nib < 0))
                error("invalid hex digit in unicode escape", errc::invalid_unicode_escape);
            val = (val << 4) | static_cast<uint32_t>(nib);
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(std::string& out) {
        uint32_t cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (PATCHGUARD_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                error("missing low surrogate", errc::invalid_unicode_escape);
            }
            ptr_ += 2;
            uint32_t low = parse_hex4();
            if (PATCHGUARD_UNLIKELY(low < 0xDC00 || low > 0xDFFF)) {
                error("invalid low surrogate value", errc::invalid_unicode_escape);
            }
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (PATCHGUARD_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_unicode_escape);
        }
        utf8::encode(cp, out);
    }

    // ─── Numbers ─────────────────────────────────────────────────────────

    static bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    JsonValue parse_number() {
        const char* start = ptr_;
        if (*ptr_ == '-') ++ptr_;
        if (ptr_ >= end_ || !is_digit(*ptr_)) error("invalid number", errc::invalid_number);

        if (*ptr_ == '0') {
            ++ptr_;
            if (ptr_ < end_ && is_digit(*ptr_))
                error("leading zeros are not allowed", errc::invalid_number);
        } else {
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        bool is_float = false;
        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (ptr_ >= end_ || !is_digit(*ptr_)) error("invalid number", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }
        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E')) {
            is_float = true;
            ++ptr_;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) ++ptr_;
            if (ptr_ >= end_ || !is_digit(*ptr_)) error("invalid number", errc::invalid_number);
            while (ptr_ < end_ && is_digit(*ptr_)) ++ptr_;
        }

        if (!is_float) {
            int64_t iv = 0;
            auto [p, ec] = std::from_chars(start, ptr_, iv);
            if (ec == std::errc() && p == ptr_) return JsonValue(iv);
            // Out of int64 range: fall through to double.
        }

        std::string num(start, static_cast<size_t>(ptr_ - start));
        char* end_ptr = nullptr;
        double dv = std::strtod(num.c_str(), &end_ptr);
        if (end_ptr != num.c_str() + num.size()) error("invalid number", errc::invalid_number);
        return JsonValue(dv);
    }

    // ─── Containers ──────────────────────────────────────────────────────

    JsonValue parse_array() {
        expect('[');
        push_depth();
        Array arr;
        skip_ws_and_comments();
        if (ptr_ < end_ && *ptr_ == ']') {
            ++ptr_;
            pop_depth();
            return JsonValue(std::move(arr));
        }
        for (;;) {
            arr.push_back(parse_value());
            skip_ws_and_comments();
            if (ptr_ >= end_) error_unexpected_end();
            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws_and_comments();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == ']') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (*ptr_ == ']') {
                ++ptr_;
                break;
            }
            error_unexpected_char();
        }
        pop_depth();
        return JsonValue(std::move(arr));
    }

    JsonValue parse_object() {
        expect('{');
        push_depth();
        Object obj;
        skip_ws_and_comments();
        if (ptr_ < end_ && *ptr_ == '}') {
            ++ptr_;
            pop_depth();
            return JsonValue(std::move(obj));
        }
        for (;;) {
            skip_ws_and_comments();
            if (ptr_ >= end_) error_unexpected_end();
            if (*ptr_ != '"') error_unexpected_char();
            std::string key = parse_string();
            skip_ws_and_comments();
            expect(':');
            // Duplicate keys: last value wins, first position kept.
            obj.insert(std::move(key), parse_value());
            skip_ws_and_comments();
            if (ptr_ >= end_) error_unexpected_end();
            if (*ptr_ == ',') {
                ++ptr_;
                skip_ws_and_comments();
                if (opts_.allow_trailing_commas && ptr_ < end_ && *ptr_ == '}') {
                    ++ptr_;
                    break;
                }
                continue;
            }
            if (*ptr_ == '}') {
                ++ptr_;
                break;
            }
            error_unexpected_char();
        }
        pop_depth();
        return JsonValue(std::move(obj));
    }
};

} // namespace detail

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse JSON from a string (with exceptions).
[[nodiscard]] inline JsonValue parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse JSON (no exceptions, returns result with error_code).
[[nodiscard]] inline result<JsonValue> try_parse(std::string_view input,
                                                  const ParseOptions& opts = {}) {
    return detail::Parser::try_parse(input, opts);
}

} // namespace patchguard
