#include "ipaseg/pho_element.hpp"
#include "ipaseg/util/utf8.hpp"

namespace ipaseg {

const char* element_tag_name(ElementTag tag) noexcept {
    switch (tag) {
        case ElementTag::Unclassified: return "PhoElement";
        case ElementTag::Consonant:    return "Consonant";
        case ElementTag::Vowel:        return "Vowel";
        case ElementTag::Diacritic:    return "Diacritic";
        case ElementTag::Ligature:     return "Ligature";
        case ElementTag::Boundary:     return "Boundary";
        case ElementTag::Stress:       return "Stress";
    }
    return "PhoElement";
}

PhoElement::PhoElement(const SymbolRecord& record, ElementKind kind)
    : character_(record.symbol)
    , symbol_(util::encode_utf8(record.symbol))
    , display_(record.display.empty() ? symbol_ : record.display)
    , description_(record.description)
    , name_(record.name)
    , role_(record.role)
    , type_(record.type)
    , kind_(std::move(kind)) {}

PhoElement PhoElement::word_boundary() {
    PhoElement element;
    element.character_ = U' ';
    element.symbol_ = " ";
    element.display_ = " ";
    element.description_ = "Word boundary";
    element.name_ = "Whitespace";
    element.type_ = PhoneticType::Suprasegmental;
    element.role_ = Role::Boundary;
    element.kind_ = Boundary{true};
    return element;
}

std::string PhoElement::repr() const {
    return std::string(element_tag_name(tag())) + "('" + symbol_ + "')";
}

std::ostream& operator<<(std::ostream& os, const PhoElement& element) {
    return os << element.repr();
}

} // namespace ipaseg
