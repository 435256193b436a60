// server/utf8.hpp
// UTF-8 well-formedness check for request bodies
#ifndef SERVER_UTF8_HPP
#define SERVER_UTF8_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Utf8 {

// Strict check: rejects overlong forms, surrogates and code points past U+10FFFF
inline bool isValid(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        std::uint8_t c = static_cast<std::uint8_t>(text[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;      // overlong
            else if (c == 0xED) hi = 0x9F; // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;      // overlong
            else if (c == 0xF4) hi = 0x8F; // > U+10FFFF
        } else {
            return false;
        }

        if (i + len > n) return false;

        // Only the first continuation byte has a narrowed range
        std::uint8_t c1 = static_cast<std::uint8_t>(text[i + 1]);
        if (c1 < lo || c1 > hi) return false;

        for (std::size_t k = 2; k < len; ++k) {
            std::uint8_t ck = static_cast<std::uint8_t>(text[i + k]);
            if (ck < 0x80 || ck > 0xBF) return false;
        }

        i += len;
    }

    return true;
}

} // namespace Utf8

#endif // SERVER_UTF8_HPP
