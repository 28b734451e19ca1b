/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "tiptv/utils/string_utils.h"
#include <cstdint>

#include <unicode/uchar.h>

namespace tiptv {
namespace utils {

size_t decodeUtf8(const std::string& str, size_t pos, char32_t& codePoint) {
    auto byte = [&str](size_t i) { return static_cast<uint8_t>(str[i]); };

    uint8_t lead = byte(pos);
    size_t len;
    uint32_t minCodePoint;

    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        minCodePoint = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        minCodePoint = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        minCodePoint = 0x10000;
    } else {
        return 0;  // Stray continuation byte or invalid lead
    }

    if (pos + len > str.length()) {
        return 0;
    }

    uint32_t value = lead & (0xFF >> (len + 1));
    for (size_t i = 1; i < len; ++i) {
        uint8_t c = byte(pos + i);
        if ((c & 0xC0) != 0x80) {
            return 0;
        }
        value = (value << 6) | (c & 0x3F);
    }

    // Reject overlong encodings, surrogates and values past U+10FFFF
    if (value < minCodePoint ||
        (value >= 0xD800 && value <= 0xDFFF) ||
        value > 0x10FFFF) {
        return 0;
    }

    codePoint = static_cast<char32_t>(value);
    return len;
}

bool isWhitespace(char32_t codePoint) {
    return u_isUWhiteSpace(static_cast<UChar32>(codePoint));
}

std::string trim(const std::string& str) {
    size_t start = std::string::npos;
    size_t end = 0;
    size_t pos = 0;

    // Malformed bytes count as content, never as whitespace
    while (pos < str.length()) {
        char32_t codePoint = 0;
        size_t len = decodeUtf8(str, pos, codePoint);
        size_t step = (len == 0) ? 1 : len;

        if (len == 0 || !isWhitespace(codePoint)) {
            if (start == std::string::npos) {
                start = pos;
            }
            end = pos + step;
        }
        pos += step;
    }

    if (start == std::string::npos) {
        return "";
    }

    return str.substr(start, end - start);
}

std::string replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result;
    result.reserve(str.length());

    size_t pos = 0;
    size_t found;
    while ((found = str.find(from, pos)) != std::string::npos) {
        result.append(str, pos, found - pos);
        result += to;
        pos = found + from.length();
    }
    result.append(str, pos, std::string::npos);

    return result;
}

size_t utf8Length(const std::string& str) {
    size_t count = 0;
    size_t pos = 0;
    char32_t codePoint = 0;

    while (pos < str.length()) {
        size_t len = decodeUtf8(str, pos, codePoint);
        pos += (len == 0) ? 1 : len;
        ++count;
    }

    return count;
}

bool isValidUtf8(const std::string& str) {
    size_t pos = 0;

    while (pos < str.length()) {
        char32_t codePoint = 0;
        size_t len = decodeUtf8(str, pos, codePoint);
        if (len == 0) {
            return false;
        }
        pos += len;
    }

    return true;
}

} // namespace utils
} // namespace tiptv
