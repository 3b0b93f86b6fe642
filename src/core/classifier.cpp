#include "ipaseg/classifier.hpp"
#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"
#include "ipaseg/util/utf8.hpp"

namespace ipaseg {

namespace {

constexpr char32_t SECONDARY_STRESS = U'\u02CC';  // ˌ

ElementKind kind_for(const SymbolRecord& record) {
    switch (record.role) {
        case Role::Base:
            // TODO: compound phones (two bases fused by a tie bar) still classify as plain bases
            if (record.type == PhoneticType::Consonant ||
                record.type == PhoneticType::Implosive ||
                record.type == PhoneticType::Click) {
                return Consonant{record.voice, record.place, record.manner, record.sonority,
                                 record.eml};
            }
            if (record.type == PhoneticType::Vowel) {
                return Vowel{record.voice, record.sonority, record.backness,
                             record.height, record.rounding, record.rhotic};
            }
            break;
        case Role::DiacriticLeft:
            return Diacritic{AttachSide::Left};
        case Role::DiacriticRight:
            return Diacritic{AttachSide::Right};
        case Role::CompoundRight:
            return Ligature{};
        case Role::Boundary:
            return Boundary{false};
        case Role::Stress:
            return Stress{record.symbol != SECONDARY_STRESS};
        case Role::Unknown:
            break;
    }

    LOG_WARN("PhoElement unable to be classified: '", util::encode_utf8(record.symbol),
             "' role=", role_name(record.role), " type=", phonetic_type_name(record.type));
    return Unclassified{};
}

} // namespace

PhoElement classify_record(const SymbolRecord& record) {
    return PhoElement(record, kind_for(record));
}

PhoElement ElementClassifier::classify(char32_t character) const {
    if (util::is_space(character)) {
        return PhoElement::word_boundary();
    }

    const SymbolRecord* record = table_->find(character);
    if (!record) {
        LOG_ERROR("'", util::encode_utf8(character), "' (", util::format_codepoint(character),
                  ") not in symbol table");
        throw UnknownSymbolError(character, __func__);
    }
    return classify_record(*record);
}

bool ElementClassifier::resolvable(char32_t character) const noexcept {
    return util::is_space(character) || table_->contains(character);
}

} // namespace ipaseg
