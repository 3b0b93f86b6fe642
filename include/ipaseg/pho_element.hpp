#pragma once

#include "ipaseg/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace ipaseg {

/**
 * Element kinds. Each carries only the fields that make sense for it.
 */
struct Unclassified {};

struct Consonant {
    std::string voice;
    std::string place;
    std::string manner;
    std::optional<int> sonority;
    std::string eml;
};

struct Vowel {
    std::string voice;
    std::optional<int> sonority;
    std::string backness;
    std::string height;
    std::string rounding;
    bool rhotic = false;
};

enum class AttachSide : uint8_t { Left, Right };

struct Diacritic {
    AttachSide side = AttachSide::Right;
};

struct Ligature {};

struct Boundary {
    bool word = false;  // synthesized from whitespace
};

struct Stress {
    bool primary = true;
};

using ElementKind = std::variant<Unclassified, Consonant, Vowel, Diacritic, Ligature, Boundary, Stress>;

enum class ElementTag : uint8_t {
    Unclassified,
    Consonant,
    Vowel,
    Diacritic,
    Ligature,
    Boundary,
    Stress
};

const char* element_tag_name(ElementTag tag) noexcept;

/**
 * PhoElement - one classified grapheme
 *
 * Equality compares (character, symbol, type, role) only; the display text,
 * description and kind payload are derived from those and do not take part.
 */
class PhoElement {
public:
    PhoElement(const SymbolRecord& record, ElementKind kind);

    // Word boundary element produced for whitespace
    static PhoElement word_boundary();

    char32_t character() const noexcept { return character_; }
    const std::string& symbol() const noexcept { return symbol_; }
    const std::string& display() const noexcept { return display_; }
    const std::string& description() const noexcept { return description_; }
    const std::string& name() const noexcept { return name_; }
    Role role() const noexcept { return role_; }
    PhoneticType type() const noexcept { return type_; }

    const ElementKind& kind() const noexcept { return kind_; }
    ElementTag tag() const noexcept { return static_cast<ElementTag>(kind_.index()); }

    template<typename K>
    bool is() const noexcept { return std::holds_alternative<K>(kind_); }

    template<typename K>
    const K* as() const noexcept { return std::get_if<K>(&kind_); }

    bool is_base() const noexcept { return is<Consonant>() || is<Vowel>(); }
    bool is_word_boundary() const noexcept {
        const Boundary* b = as<Boundary>();
        return b && b->word;
    }

    bool operator==(const PhoElement& other) const noexcept {
        return character_ == other.character_ && symbol_ == other.symbol_ &&
               type_ == other.type_ && role_ == other.role_;
    }
    bool operator!=(const PhoElement& other) const noexcept { return !(*this == other); }

    // e.g. Consonant('t')
    std::string repr() const;

private:
    PhoElement() = default;

    char32_t character_ = 0;
    std::string symbol_;
    std::string display_;
    std::string description_;
    std::string name_;
    Role role_ = Role::Unknown;
    PhoneticType type_ = PhoneticType::Other;
    ElementKind kind_;
};

std::ostream& operator<<(std::ostream& os, const PhoElement& element);

} // namespace ipaseg
