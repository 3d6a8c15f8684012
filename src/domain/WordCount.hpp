/**
 * @file WordCount.hpp
 * @brief Whitespace-delimited token counting over UTF-8 text.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace novelstore::domain {

/**
 * @brief True for code points with the Unicode White_Space property.
 */
inline bool IsUnicodeWhitespace(std::uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
           cp == 0x205F || cp == 0x3000;
}

/**
 * @brief Decodes the code point starting at `pos` and advances `pos` past it.
 *
 * A malformed or truncated sequence yields its lead byte as a single unit,
 * which never counts as whitespace.
 */
inline std::uint32_t NextCodePoint(const std::string& text, std::size_t& pos) {
    auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    std::uint32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return lead;
    }

    if (pos + length > text.size()) {
        ++pos;
        return lead;
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return lead;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    pos += length;
    return cp;
}

/**
 * @brief Number of maximal runs of non-whitespace code points.
 */
inline std::size_t CountWords(const std::string& text) {
    std::size_t count = 0;
    bool inWord = false;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (IsUnicodeWhitespace(NextCodePoint(text, pos))) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

} // namespace novelstore::domain
