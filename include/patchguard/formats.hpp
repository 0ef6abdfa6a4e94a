#pragma once

/// @file formats.hpp
/// @brief String `format` checks for schema validation.
///
/// Supported: email, idn-email, date, time, date-time, duration, uri,
/// uri-reference, uri-template, iri, iri-reference, hostname,
/// idn-hostname, ipv4, ipv6, uuid, json-pointer, relative-json-pointer,
/// regex. Unknown format names always pass.
///
/// Formats of unbounded length (email, duration, uri, uri-template,
/// json-pointer) are checked by linear scans. The remaining regex checks
/// reject input longer than PATCHGUARD_MAX_REGEX_INPUT.

#include "config.hpp"
#include "detail/utf8.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace patchguard {
namespace detail {

inline int to_int(const std::ssub_match& m) { return std::stoi(m.str()); }

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool is_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

/// ECMAScript `\s` over ASCII.
inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

inline bool fits_regex(std::string_view v) noexcept { return v.size() <= PATCHGUARD_MAX_REGEX_INPUT; }

inline bool is_leap_year(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline bool valid_calendar_date(int y, int m, int d) noexcept {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (y < 1 || m < 1 || m > 12 || d < 1) return false;
    int max_day = kDays[m - 1] + (m == 2 && is_leap_year(y) ? 1 : 0);
    return d <= max_day;
}

inline std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    for (;;) {
        auto pos = s.find(sep);
        out.push_back(s.substr(0, pos));
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return out;
}

/// A URI scheme followed by ':'.
inline bool has_uri_scheme(std::string_view s) noexcept {
    if (s.empty() || !is_alpha(s[0])) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ':') return true;
        if (!is_alpha(c) && !is_digit(c) && c != '+' && c != '.' && c != '-') return false;
    }
    return false;
}

/// local@domain.tld: one '@', no whitespace, a '.' strictly inside the domain.
inline bool check_email(std::string_view v) noexcept {
    const auto at = v.find('@');
    if (at == std::string_view::npos || at == 0 || v.find('@', at + 1) != std::string_view::npos)
        return false;
    for (char c : v)
        if (is_space(c)) return false;
    const auto domain = v.substr(at + 1);
    return domain.size() >= 3 && domain.substr(1, domain.size() - 2).find('.') != std::string_view::npos;
}

/// Bracketed IPv6 hosts must be closed.
inline bool balanced_brackets(std::string_view s) noexcept {
    int depth = 0;
    for (char c : s) {
        if (c == '[') ++depth;
        else if (c == ']' && --depth < 0) return false;
    }
    return depth == 0;
}

/// Every '~' is followed by '0' or '1'.
inline bool pointer_escapes_ok(std::string_view s) noexcept {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '~') continue;
        if (i + 1 == s.size() || (s[i + 1] != '0' && s[i + 1] != '1')) return false;
    }
    return true;
}

inline bool check_date(const std::string& v) {
    if (!fits_regex(v)) return false;
    static const std::regex re(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(v, m, re)) return false;
    return valid_calendar_date(to_int(m[1]), to_int(m[2]), to_int(m[3]));
}

inline bool check_time(const std::string& v) {
    if (!fits_regex(v)) return false;
    static const std::regex re(R"(^(\d{2}):(\d{2}):(\d{2})(\.\d+)?(Z|[+-]\d{2}:\d{2})?$)");
    std::smatch m;
    if (!std::regex_match(v, m, re)) return false;
    return to_int(m[1]) <= 23 && to_int(m[2]) <= 59 && to_int(m[3]) <= 60;
}

/// RFC 3339 date-time. Leap seconds are rejected, offsets must be below 24h.
inline bool check_date_time(const std::string& v) {
    if (!fits_regex(v)) return false;
    static const std::regex re(
        R"(^(\d{4})-(\d{2})-(\d{2})[Tt](\d{2}):(\d{2}):(\d{2})(\.\d+)?([Zz]|([+-])(\d{2}):(\d{2}))$)");
    std::smatch m;
    if (!std::regex_match(v, m, re)) return false;
    if (!valid_calendar_date(to_int(m[1]), to_int(m[2]), to_int(m[3]))) return false;
    if (to_int(m[4]) > 23 || to_int(m[5]) > 59 || to_int(m[6]) > 59) return false;
    if (m[10].matched && (to_int(m[10]) > 23 || to_int(m[11]) > 59)) return false;
    return true;
}

/// ISO 8601 duration: PnW, or PnYnMnD with an optional T section of
/// nHnMnS. Only the seconds may carry a fraction.
inline bool check_duration(std::string_view v) noexcept {
    if (v.size() < 2 || v[0] != 'P') return false;
    size_t i = 1;
    auto digits = [&] {
        const size_t start = i;
        while (i < v.size() && is_digit(v[i])) ++i;
        return i > start;
    };
    // Designators in order; each at most once.
    auto designator = [&](std::string_view order, size_t& next) {
        const auto k = order.find(v[i], next);
        if (k == std::string_view::npos) return false;
        next = k + 1;
        ++i;
        return true;
    };

    if (digits() && i + 1 == v.size() && v[i] == 'W') return true;
    i = 1;

    size_t next = 0;
    while (i < v.size() && v[i] != 'T') {
        if (!digits() || i == v.size() || !designator("YMD", next)) return false;
    }
    if (i == v.size()) return true;
    if (++i == v.size()) return v.size() > 2;

    next = 0;
    while (i < v.size()) {
        if (!digits() || i == v.size()) return false;
        if (v[i] == '.') {
            ++i;
            if (!digits() || i == v.size() || v[i] != 'S') return false;
            return designator("HMS", next) && i == v.size();
        }
        if (!designator("HMS", next)) return false;
    }
    return true;
}

/// One `{...}` expression body: optional operator, then comma-separated
/// varspecs with an optional `:prefix` or `*` modifier.
inline bool check_template_expression(std::string_view expr) {
    static constexpr std::string_view kOperators = "+#./;?&";
    if (!expr.empty() && kOperators.find(expr[0]) != std::string_view::npos) expr.remove_prefix(1);
    for (auto spec : split(expr, ',')) {
        size_t j = 0;
        while (j < spec.size() && (is_alpha(spec[j]) || is_digit(spec[j]) || spec[j] == '_')) ++j;
        if (j == 0) return false;
        const auto mod = spec.substr(j);
        if (mod.empty() || mod == "*") continue;
        if (mod.size() < 2 || mod[0] != ':' || mod[1] < '1' || mod[1] > '9') return false;
        for (char c : mod.substr(2))
            if (!is_digit(c)) return false;
    }
    return true;
}

/// RFC 6570 level 4 syntax: balanced, non-nested braces around valid expressions.
inline bool check_uri_template(std::string_view v) {
    size_t i = 0;
    while (i < v.size()) {
        if (v[i] == '}') return false;
        if (v[i] != '{') {
            ++i;
            continue;
        }
        const auto close = v.find('}', i + 1);
        if (close == std::string_view::npos) return false;
        const auto expr = v.substr(i + 1, close - i - 1);
        if (expr.find('{') != std::string_view::npos || !check_template_expression(expr)) return false;
        i = close + 1;
    }
    return true;
}

inline bool check_hostname(const std::string& v, bool idn) {
    static const std::regex label_re(R"(^[a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?$)");
    if (utf8::length(v) > 253) return false;
    for (auto label : split(v, '.')) {
        const size_t len = utf8::length(label);
        if (len == 0 || len > 63) return false;
        if (idn) {
            if (label.front() == '-' || label.back() == '-') return false;
        } else if (!std::regex_match(label.begin(), label.end(), label_re)) {
            return false;
        }
    }
    return true;
}

inline bool check_ipv4(const std::string& v) {
    auto parts = split(v, '.');
    if (parts.size() != 4) return false;
    for (auto part : parts) {
        if (part.empty() || part.size() > 3) return false;
        int num = 0;
        for (char c : part) {
            if (c < '0' || c > '9') return false;
            num = num * 10 + (c - '0');
        }
        if (num > 255) return false;
        if (part.size() > 1 && part.front() == '0') return false;
    }
    return true;
}

inline bool check_ipv6(const std::string& v) {
    if (!fits_regex(v)) return false;
    static const std::regex re(
        "^(?:(?:[0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}"
        "|(?:[0-9a-fA-F]{1,4}:){1,7}:"
        "|(?:[0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4}"
        "|(?:[0-9a-fA-F]{1,4}:){1,5}(?::[0-9a-fA-F]{1,4}){1,2}"
        "|(?:[0-9a-fA-F]{1,4}:){1,4}(?::[0-9a-fA-F]{1,4}){1,3}"
        "|(?:[0-9a-fA-F]{1,4}:){1,3}(?::[0-9a-fA-F]{1,4}){1,4}"
        "|(?:[0-9a-fA-F]{1,4}:){1,2}(?::[0-9a-fA-F]{1,4}){1,5}"
        "|[0-9a-fA-F]{1,4}:(?::[0-9a-fA-F]{1,4}){1,6}"
        "|:(?:(?::[0-9a-fA-F]{1,4}){1,7}|:)"
        "|fe80:(?::[0-9a-fA-F]{0,4}){0,4}%[0-9a-zA-Z]+"
        "|::(?:ffff(?::0{1,4})?:)?(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\\.){3}"
        "(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])"
        "|(?:[0-9a-fA-F]{1,4}:){1,4}:(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\\.){3}"
        "(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9]))$");
    return std::regex_match(v, re);
}

inline bool check_relative_json_pointer(std::string_view v) noexcept {
    if (v.empty() || !is_digit(v[0])) return false;
    size_t i = 1;
    if (v[0] != '0')
        while (i < v.size() && is_digit(v[i])) ++i;
    const auto rest = v.substr(i);
    if (rest.empty() || rest == "#") return true;
    return rest[0] == '/' && pointer_escapes_ok(rest);
}

} // namespace detail

/// @brief Whether @p value satisfies the named string format.
[[nodiscard]] inline bool check_format(std::string_view format, const std::string& value) {
    using namespace detail;
    if (format == "email" || format == "idn-email") return check_email(value);
    if (format == "date")      return check_date(value);
    if (format == "time")      return check_time(value);
    if (format == "date-time") return check_date_time(value);
    if (format == "duration")  return check_duration(value);
    if (format == "uri" || format == "iri") return has_uri_scheme(value);
    if (format == "uri-reference" || format == "iri-reference") {
        if (value.empty() || value[0] == '/' || value[0] == '#' || value[0] == '?') return true;
        return format == "uri-reference" ? balanced_brackets(value) : has_uri_scheme(value);
    }
    if (format == "uri-template") return check_uri_template(value);
    if (format == "hostname")     return check_hostname(value, false);
    if (format == "idn-hostname") return check_hostname(value, true);
    if (format == "ipv4")         return check_ipv4(value);
    if (format == "ipv6")         return check_ipv6(value);
    if (format == "uuid") {
        if (!fits_regex(value)) return false;
        static const std::regex re(
            R"(^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[1-5][0-9a-fA-F]{3}-[89abAB][0-9a-fA-F]{3}-[0-9a-fA-F]{12}$)");
        return std::regex_match(value, re);
    }
    if (format == "json-pointer") {
        if (value.empty()) return true;
        return value[0] == '/' && pointer_escapes_ok(value);
    }
    if (format == "relative-json-pointer") return check_relative_json_pointer(value);
    if (format == "regex") {
        if (!fits_regex(value)) return false;
        try {
            std::regex compiled(value, std::regex::ECMAScript);
            return true;
        } catch (const std::regex_error&) {
            return false;
        }
    }
    return true;
}

} // namespace patchguard
