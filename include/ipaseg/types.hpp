#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ipaseg {

/**
 * Tokenizer role of a grapheme. Decides how the grapheme attaches to
 * neighbouring material when a transcription is segmented.
 */
enum class Role : uint8_t {
    Base,            // core consonant or vowel of a segment
    DiacriticLeft,   // attaches to the following base
    DiacriticRight,  // attaches to the preceding base
    CompoundRight,   // tie bar joining two bases
    Boundary,        // word, syllable, foot or intonation boundary
    Stress,          // primary/secondary stress marker
    Unknown          // role text the table carries but the tokenizer does not know
};

enum class PhoneticType : uint8_t {
    Consonant,
    Vowel,
    Implosive,
    Click,
    Diacritic,
    Suprasegmental,
    Tone,
    Other
};

Role parse_role(std::string_view text);
const char* role_name(Role role) noexcept;

PhoneticType parse_phonetic_type(std::string_view text);
const char* phonetic_type_name(PhoneticType type) noexcept;

// Roles that close an open segment once it has a base
constexpr bool is_segment_ender(Role role) noexcept {
    return role == Role::Base || role == Role::DiacriticLeft ||
           role == Role::Boundary || role == Role::Stress;
}

/**
 * One row of the IPA symbol table, keyed by a single codepoint.
 * Feature columns are empty where they do not apply to the symbol's type.
 */
struct SymbolRecord {
    char32_t symbol = 0;
    std::string description;
    std::string display;
    std::string name;
    std::vector<char32_t> unicode;
    PhoneticType type = PhoneticType::Other;
    Role role = Role::Unknown;

    // Consonant features
    std::string voice;
    std::string place;
    std::string manner;
    std::optional<int> sonority;
    std::string eml;  // EML column, blank for most symbols

    // Vowel features
    std::string backness;
    std::string height;
    std::string rounding;
    bool rhotic = false;
};

} // namespace ipaseg
