#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace editcore {

// =============================================================================
// UTF-8 Decoding / Encoding
// =============================================================================

/**
 * Decode the codepoint starting at pos.
 * Malformed or truncated sequences decode as U+FFFD with byteLen = 1, so a
 * caller always makes progress. byteLen = 0 only when pos is past the end.
 */
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

inline void appendUtf8(std::string& out, std::uint32_t cp) {
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
    } else {
        appendUtf8(out, 0xFFFD);
    }
}

inline std::string encodeUtf8(std::uint32_t cp) {
    std::string out;
    appendUtf8(out, cp);
    return out;
}

inline bool isUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace editcore
