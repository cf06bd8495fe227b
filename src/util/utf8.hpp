#ifndef DOCREDACT_UTIL_UTF8_HPP
#define DOCREDACT_UTIL_UTF8_HPP

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file utf8.hpp
 * @brief Small UTF-8 helpers: validation and code point counting.
 */

namespace docredact {
namespace util {
namespace utf8 {

/**
 * @brief Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF).
 * @param allowNul If false, an embedded NUL byte makes the buffer invalid.
 */
inline bool isValid(const uint8_t *data, size_t len, bool allowNul = true)
{
    size_t i = 0;
    while (i < len) {
        uint8_t c = data[i];
        if (c < 0x80) {
            if (c == 0 && !allowNul) {
                return false;
            }
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t minCp = 0;
        if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; minCp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; minCp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; minCp = 0x10000; }
        else {
            return false;
        }

        if (i + extra >= len) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = data[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

inline bool isValid(const std::string &s, bool allowNul = true)
{
    return isValid(reinterpret_cast<const uint8_t*>(s.data()), s.size(), allowNul);
}

/**
 * @brief Number of code points in a UTF-8 string (continuation bytes are not counted).
 */
inline size_t codePointCount(const std::string &s)
{
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace utf8
} // namespace util
} // namespace docredact

#endif // DOCREDACT_UTIL_UTF8_HPP
