#include "ipaseg/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace ipaseg {

namespace {

std::string lowercase(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

Role parse_role(std::string_view text) {
    // Role strings are lowercase in the table; be lenient about case only
    std::string value = lowercase(text);
    if (value == "base")            return Role::Base;
    if (value == "diacritic_left")  return Role::DiacriticLeft;
    if (value == "diacritic_right") return Role::DiacriticRight;
    if (value == "compound_right")  return Role::CompoundRight;
    if (value == "boundary")        return Role::Boundary;
    if (value == "stress")          return Role::Stress;
    return Role::Unknown;
}

const char* role_name(Role role) noexcept {
    switch (role) {
        case Role::Base:           return "base";
        case Role::DiacriticLeft:  return "diacritic_left";
        case Role::DiacriticRight: return "diacritic_right";
        case Role::CompoundRight:  return "compound_right";
        case Role::Boundary:       return "boundary";
        case Role::Stress:         return "stress";
        case Role::Unknown:        return "unknown";
    }
    return "unknown";
}

PhoneticType parse_phonetic_type(std::string_view text) {
    std::string value = lowercase(text);
    if (value == "consonant")      return PhoneticType::Consonant;
    if (value == "vowel")          return PhoneticType::Vowel;
    if (value == "implosive")      return PhoneticType::Implosive;
    if (value == "click")          return PhoneticType::Click;
    if (value == "diacritic")      return PhoneticType::Diacritic;
    if (value == "suprasegmental") return PhoneticType::Suprasegmental;
    if (value == "tone")           return PhoneticType::Tone;
    return PhoneticType::Other;
}

const char* phonetic_type_name(PhoneticType type) noexcept {
    switch (type) {
        case PhoneticType::Consonant:      return "Consonant";
        case PhoneticType::Vowel:          return "Vowel";
        case PhoneticType::Implosive:      return "Implosive";
        case PhoneticType::Click:          return "Click";
        case PhoneticType::Diacritic:      return "Diacritic";
        case PhoneticType::Suprasegmental: return "Suprasegmental";
        case PhoneticType::Tone:           return "Tone";
        case PhoneticType::Other:          return "Other";
    }
    return "Other";
}

} // namespace ipaseg
