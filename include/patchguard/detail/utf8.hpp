#pragma once

/// @file utf8.hpp
/// @brief UTF-8 utilities.
///
///   - Encoding a code point to UTF-8 (1-4 bytes)
///   - Decoding UTF-8 to a code point
///   - Encoding a code point as \uXXXX (with surrogate pairs for non-BMP)
///   - Code point counting and prefix extraction, so that length limits
///     (string truncation, previews) never split a multi-byte sequence

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace patchguard::detail::utf8 {

// ─── Code point encoding → UTF-8 ─────────────────────────────────────

/// @brief Encodes a Unicode code point as UTF-8 and appends to the string.
inline void encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// ─── UTF-8 decoding → code point ───────────────────────────────────

/// @brief Determines the UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid byte, 0 for an invalid one.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

/// @brief Decodes a single UTF-8 sequence.
/// @param ptr  Pointer to the start of the sequence (advanced on return).
/// @param end  Pointer past the end of the buffer.
/// @return Unicode code point, or 0xFFFD on error.
inline uint32_t decode(const char*& ptr, const char* end) noexcept {
    auto lead = static_cast<unsigned char>(*ptr);
    unsigned len = sequence_length(lead);

    if (len == 0 || ptr + len > end) {
        ++ptr;
        return 0xFFFD;
    }
    if (len == 1) {
        ++ptr;
        return lead;
    }

    uint32_t cp = lead & (len == 2 ? 0x1F : len == 3 ? 0x0F : 0x07);
    for (unsigned i = 1; i < len; ++i) {
        auto byte = static_cast<unsigned char>(ptr[i]);
        if ((byte & 0xC0) != 0x80) {
            ptr += i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }
    ptr += len;

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
        return 0xFFFD;  // overlong
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0xFFFD;
    if (cp > 0x10FFFF) return 0xFFFD;
    return cp;
}

// ─── JSON escaping (\uXXXX) ───────────────────────────────────────────

/// @brief Encodes a code point as \uXXXX (or a surrogate pair for non-BMP).
inline void encode_escaped(uint32_t cp, std::string& out) {
    static constexpr char kHex[] = "0123456789abcdef";

    auto write_u16 = [&](uint32_t val) {
        out.push_back('\\');
        out.push_back('u');
        out.push_back(kHex[(val >> 12) & 0xF]);
        out.push_back(kHex[(val >> 8) & 0xF]);
        out.push_back(kHex[(val >> 4) & 0xF]);
        out.push_back(kHex[val & 0xF]);
    };

    if (cp < 0x10000) {
        write_u16(cp);
    } else {
        cp -= 0x10000;
        write_u16(0xD800 + (cp >> 10));
        write_u16(0xDC00 + (cp & 0x3FF));
    }
}

// ─── Code point counting ─────────────────────────────────────────────

/// @brief Number of code points in a UTF-8 string.
/// Invalid bytes count as one code point each.
inline size_t length(std::string_view s) noexcept {
    size_t n = 0;
    const char* p = s.data();
    const char* end = p + s.size();
    while (p < end) {
        decode(p, end);
        ++n;
    }
    return n;
}

/// @brief The first @p count code points of @p s.
inline std::string_view prefix(std::string_view s, size_t count) noexcept {
    const char* begin = s.data();
    const char* p = begin;
    const char* end = begin + s.size();
    while (count > 0 && p < end) {
        decode(p, end);
        --count;
    }
    return s.substr(0, static_cast<size_t>(p - begin));
}

} // namespace patchguard::detail::utf8
