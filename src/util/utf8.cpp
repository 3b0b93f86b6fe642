#include "ipaseg/util/utf8.hpp"

#include <cstdio>

namespace ipaseg::util {

// - No logging in hot path
// - Invalid sequences replaced with U+FFFD
// - A leading BOM is dropped
std::u32string decode_utf8(std::string_view data) {
    std::u32string codepoints;
    codepoints.reserve(data.size());

    const uint8_t* p = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* end = p + data.size();

    if (data.size() >= 3 && p[0] == 0xEF && p[1] == 0xBB && p[2] == 0xBF) {
        p += 3;
    }

    while (p < end) {
        uint32_t cp;

        if (*p < 0x80) {
            // ASCII fast path
            cp = *p++;
        } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            if ((b2 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p--; // Rewind to retry b2 as start byte
            } else {
                cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
                if (cp < 0x80) cp = 0xFFFD; // Overlong
            }
        } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 2;
            } else {
                cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
                if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
            }
        } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
            uint8_t b1 = *p++;
            uint8_t b2 = *p++;
            uint8_t b3 = *p++;
            uint8_t b4 = *p++;
            if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
                cp = 0xFFFD;
                p -= 3;
            } else {
                cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
                if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
            }
        } else {
            // Invalid start byte or truncated sequence
            cp = 0xFFFD;
            ++p;
        }

        codepoints.push_back(static_cast<char32_t>(cp));
    }

    return codepoints;
}

std::string encode_utf8(char32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return result;
}

std::string encode_utf8(std::u32string_view codepoints) {
    std::string result;
    result.reserve(codepoints.size() * 2);
    for (char32_t cp : codepoints) {
        result += encode_utf8(cp);
    }
    return result;
}

bool is_space(char32_t cp) noexcept {
    if (cp <= 0x20) {
        return cp == 0x20 || (cp >= 0x09 && cp <= 0x0D);
    }
    switch (cp) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string format_codepoint(char32_t cp) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
    return buf;
}

std::optional<char32_t> parse_codepoint(std::string_view text) {
    if (text.size() >= 2 && (text[0] == 'U' || text[0] == 'u') && text[1] == '+') {
        text.remove_prefix(2);
    } else if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 6) {
        return std::nullopt;
    }

    uint32_t value = 0;
    for (char c : text) {
        uint32_t digit;
        if (c >= '0' && c <= '9') digit = static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') digit = static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') digit = static_cast<uint32_t>(c - 'A' + 10);
        else return std::nullopt;
        value = (value << 4) | digit;
    }
    if (value > 0x10FFFF) {
        return std::nullopt;
    }
    return static_cast<char32_t>(value);
}

} // namespace ipaseg::util
