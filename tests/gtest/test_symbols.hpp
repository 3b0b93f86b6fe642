// =============================================================================
// Shared synthetic symbol table for tokenizer tests
// =============================================================================

#pragma once

#include "ipaseg/classifier.hpp"
#include "ipaseg/symbol_table.hpp"
#include "ipaseg/types.hpp"
#include "ipaseg/util/utf8.hpp"

#include <string>
#include <vector>

#ifndef IPASEG_TEST_DATA_DIR
#define IPASEG_TEST_DATA_DIR "data"
#endif

namespace ipaseg::test {

inline SymbolRecord record(char32_t symbol, const char* type, const char* role,
                           const char* name = "") {
    SymbolRecord r;
    r.symbol = symbol;
    r.description = type;
    r.display = util::encode_utf8(symbol);
    r.name = name;
    r.unicode = {symbol};
    r.type = parse_phonetic_type(type);
    r.role = parse_role(role);
    return r;
}

inline SymbolRecord consonant(char32_t symbol, const char* voice, const char* place,
                              const char* manner, int sonority, const char* type = "Consonant") {
    SymbolRecord r = record(symbol, type, "base");
    r.voice = voice;
    r.place = place;
    r.manner = manner;
    r.sonority = sonority;
    return r;
}

inline SymbolRecord vowel(char32_t symbol, const char* backness, const char* height,
                          const char* rounding) {
    SymbolRecord r = record(symbol, "Vowel", "base");
    r.voice = "Voiced";
    r.sonority = 7;
    r.backness = backness;
    r.height = height;
    r.rounding = rounding;
    return r;
}

inline std::vector<SymbolRecord> test_records() {
    return {
        consonant(U'p', "Voiceless", "Bilabial", "Plosive", 1),
        consonant(U't', "Voiceless", "Alveolar", "Plosive", 1),
        consonant(U'k', "Voiceless", "Velar", "Plosive", 1),
        consonant(U's', "Voiceless", "Alveolar", "Fricative", 3),
        consonant(U'h', "Voiceless", "Glottal", "Fricative", 3),
        consonant(U'm', "Voiced", "Bilabial", "Nasal", 4),
        consonant(U'n', "Voiced", "Alveolar", "Nasal", 4),
        consonant(U'\u02A7', "Voiceless", "Postalveolar", "Affricate", 2),   // ʧ
        consonant(U'\u0283', "Voiceless", "Postalveolar", "Fricative", 3),   // ʃ
        consonant(U'\u0253', "Voiced", "Bilabial", "Implosive", 1, "Implosive"),  // ɓ
        consonant(U'\u01C3', "Voiceless", "Alveolar", "Click", 1, "Click"),  // ǃ
        vowel(U'a', "Front", "Open", "Unrounded"),
        vowel(U'A', "Front", "Open", "Unrounded"),
        vowel(U'o', "Back", "Close-mid", "Rounded"),
        vowel(U'u', "Back", "Close", "Rounded"),
        vowel(U'i', "Front", "Close", "Unrounded"),
        vowel(U'\u00E6', "Front", "Near-open", "Unrounded"),   // æ
        vowel(U'\u0259', "Central", "Mid", "Unrounded"),       // ə
        vowel(U'\u028A', "Back", "Near-close", "Rounded"),     // ʊ
        record(U'\u02B0', "Diacritic", "diacritic_right", "Aspirated"),   // ʰ
        record(U'\u0325', "Diacritic", "diacritic_right", "Voiceless"),   // ̥
        record(U'\u0303', "Diacritic", "diacritic_right", "Nasalized"),   // ̃
        record(U'\u02D0', "Diacritic", "diacritic_right", "Long"),        // ː
        record(U'\u02E1', "Diacritic", "diacritic_right", "Lateral release"),  // ˡ
        record(U'\u032A', "Diacritic", "diacritic_right", "Dental"),      // ̪
        record(U'\u207F', "Diacritic", "diacritic_left", "Prenasalized"), // ⁿ
        record(U'\u1D50', "Diacritic", "diacritic_left", "Prenasalized"), // ᵐ
        record(U'\u1DAC', "Diacritic", "diacritic_left", "Prenasalized"), // ᶬ
        record(U'\u0361', "Diacritic", "compound_right", "Tie bar"),      // ͡
        record(U'.', "Suprasegmental", "boundary", "Syllable break"),
        record(U'|', "Suprasegmental", "boundary", "Minor group"),
        record(U'\u2016', "Suprasegmental", "boundary", "Major group"),   // ‖
        record(U'\u02C8', "Suprasegmental", "stress", "Primary stress"),  // ˈ
        record(U'\u02CC', "Suprasegmental", "stress", "Secondary stress"),  // ˌ
        record(U'\u2193', "Tone", "tone_marker", "Downstep arrow"),       // ↓ (unknown role)
        record(U'\u02AD', "Suprasegmental", "base", "Bidental percussive"),  // ʭ (base, not C/V)
    };
}

inline SymbolTable make_test_table() {
    return SymbolTable::from_records(test_records());
}

// Classify a single UTF-8 character against `table`
inline PhoElement element(const SymbolTable& table, const std::string& utf8) {
    std::u32string chars = util::decode_utf8(utf8);
    return ElementClassifier(table).classify(chars.at(0));
}

} // namespace ipaseg::test
