#pragma once

#include <export.hpp>
#include <string>
#include <cstdint>
#include <cstddef>

namespace YangKeys {

/// U+FFFD encoded as UTF-8.
inline constexpr char k_replacement_utf8[] = "\xEF\xBF\xBD";

/**
 * @brief Copy a byte string, replacing ill-formed UTF-8 with U+FFFD.
 *
 * Each maximal ill-formed subpart becomes a single replacement character,
 * so valid text passes through unchanged and the output is always valid UTF-8.
 *
 * @param replaced If non-null, receives the number of replacements made.
 */
inline std::string sanitize_utf8(const std::string& s, size_t* replaced = nullptr) {
    std::string out;
    out.reserve(s.size());
    size_t count = 0;

    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);

        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        uint8_t lo = 0x80, hi = 0xBF; // Bounds for the first continuation byte
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; } // No surrogates
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }

        if (len == 0) { // Invalid start byte
            out += k_replacement_utf8;
            ++count;
            ++i;
            continue;
        }

        size_t valid = 1;
        for (; valid < len && i + valid < s.size(); ++valid) {
            uint8_t cc = static_cast<uint8_t>(s[i + valid]);
            uint8_t min = (valid == 1) ? lo : 0x80;
            uint8_t max = (valid == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
        }

        if (valid == len) {
            out.append(s, i, len);
        } else {
            out += k_replacement_utf8;
            ++count;
        }
        i += valid;
    }

    if (replaced) *replaced = count;
    return out;
}

/**
 * @brief Decode the code point starting at byte offset i.
 *
 * @return Number of bytes consumed (at least 1). Ill-formed input decodes to
 *         U+FFFD one byte at a time.
 */
inline size_t decode_utf8_at(const std::string& s, size_t i, char32_t& cp) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    size_t len = 0;

    if (c < 0x80) { cp = c; return 1; }
    else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
    else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
    else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
    else { cp = 0xFFFD; return 1; }

    if (i + len > s.size()) { cp = 0xFFFD; return 1; }
    for (size_t j = 1; j < len; ++j) {
        uint8_t cc = static_cast<uint8_t>(s[i + j]);
        if ((cc >> 6) != 0x2) { cp = 0xFFFD; return 1; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

/**
 * @brief Unicode whitespace: ASCII space and controls \t..\r, \x1c..\x1f,
 *        NEL, NBSP and the Zs/Zl/Zp separators.
 */
inline bool is_space_codepoint(char32_t cp) {
    if (cp <= 0x20) return cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F);
    switch (cp) {
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

/**
 * @brief Letters, characters with a numeric value, and '_'.
 */
YANGKEYS_API bool is_word_codepoint(char32_t cp);

} // namespace YangKeys
