#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ipaseg::util {

// Decode UTF-8 bytes to Unicode codepoints (invalid sequences become U+FFFD)
std::u32string decode_utf8(std::string_view data);

// Encode codepoint(s) to UTF-8 bytes
std::string encode_utf8(char32_t codepoint);
std::string encode_utf8(std::u32string_view codepoints);

// Unicode White_Space property
bool is_space(char32_t codepoint) noexcept;

// "U+0070" style rendering
std::string format_codepoint(char32_t codepoint);

// Accepts "U+0070", "u+70", "0x70" or bare hex "0070"
std::optional<char32_t> parse_codepoint(std::string_view text);

} // namespace ipaseg::util
