/**
 * @file Text.cpp
 * @brief Implementation of the string helpers.
 */

#include "domain/common/Text.hpp"

#include <cctype>

namespace glucosetrail::domain::text {

namespace {

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/**
 * Decodes the code point starting at @p pos. Rejects truncated sequences, overlong
 * forms, surrogates and values above U+10FFFF.
 * @return Its length in bytes, or 0 if the sequence is malformed.
 */
std::size_t decodeAt(const std::string& value, std::size_t pos, char32_t& codePoint) {
    const auto lead = static_cast<unsigned char>(value[pos]);
    std::size_t length = 0;
    char32_t minimum = 0;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2; minimum = 0x80; codePoint = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; minimum = 0x800; codePoint = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; minimum = 0x10000; codePoint = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > value.size()) return 0;
    for (std::size_t i = 1; i < length; ++i) {
        if (!isContinuationByte(value[pos + i])) return 0;
        codePoint = (codePoint << 6) | (static_cast<unsigned char>(value[pos + i]) & 0x3F);
    }
    if (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return 0;
    }
    return length;
}

// Unicode White_Space, the set string trimming removes elsewhere.
bool isSpace(char32_t cp) {
    if (cp < 0x80) return std::isspace(static_cast<int>(cp)) != 0;
    return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

/// Byte length of the whitespace code point at @p pos, or 0 if there is none.
std::size_t spaceAt(const std::string& value, std::size_t pos) {
    char32_t cp = 0;
    std::size_t length = decodeAt(value, pos, cp);
    return (length > 0 && isSpace(cp)) ? length : 0;
}

/// Byte length of the whitespace code point ending just before @p end, or 0.
std::size_t spaceBefore(const std::string& value, std::size_t end) {
    std::size_t start = end - 1;
    while (start > 0 && end - start < 4 && isContinuationByte(value[start])) {
        --start;
    }
    std::size_t length = spaceAt(value, start);
    return (length == end - start) ? length : 0;
}

} // namespace

std::string Trim(const std::string& value) {
    std::size_t first = 0;
    while (first < value.size()) {
        std::size_t length = spaceAt(value, first);
        if (length == 0) break;
        first += length;
    }
    std::size_t last = value.size();
    while (last > first) {
        std::size_t length = spaceBefore(value, last);
        if (length == 0) break;
        last -= length;
    }
    return value.substr(first, last - first);
}

bool IsBlank(const std::string& value) {
    std::size_t pos = 0;
    while (pos < value.size()) {
        std::size_t length = spaceAt(value, pos);
        if (length == 0) return false;
        pos += length;
    }
    return true;
}

bool IsValidUtf8(const std::string& value) {
    std::size_t pos = 0;
    char32_t cp = 0;
    while (pos < value.size()) {
        std::size_t length = decodeAt(value, pos, cp);
        if (length == 0) return false;
        pos += length;
    }
    return true;
}

std::size_t Utf8Length(const std::string& value) {
    std::size_t count = 0;
    for (char c : value) {
        if (!isContinuationByte(c)) ++count;
    }
    return count;
}

std::string Utf8Prefix(const std::string& value, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (!isContinuationByte(value[i])) {
            if (seen == count) return value.substr(0, i);
            ++seen;
        }
    }
    return value;
}

std::string Ellipsize(const std::string& value, std::size_t threshold, std::size_t keep) {
    if (Utf8Length(value) <= threshold) {
        return value;
    }
    return Utf8Prefix(value, keep) + "...";
}

} // namespace glucosetrail::domain::text
