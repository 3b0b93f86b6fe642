#pragma once

#include "ipaseg/pho_element.hpp"
#include "ipaseg/symbol_table.hpp"

namespace ipaseg {

/**
 * Map a symbol record to its element kind.
 *
 *   base + Consonant/Implosive/Click -> Consonant
 *   base + Vowel                     -> Vowel
 *   diacritic_left/diacritic_right   -> Diacritic
 *   compound_right                   -> Ligature
 *   boundary                         -> Boundary
 *   stress                           -> Stress
 *   anything else                    -> Unclassified (logged as a warning)
 */
PhoElement classify_record(const SymbolRecord& record);

/**
 * Element Classifier - character -> PhoElement against an injected table.
 * Holds a reference; the table must outlive the classifier.
 */
class ElementClassifier {
public:
    explicit ElementClassifier(const SymbolTable& table) noexcept : table_(&table) {}

    /**
     * Classify one character. Whitespace yields a word boundary without
     * touching the table.
     * @throws UnknownSymbolError if the character is not in the table
     */
    PhoElement classify(char32_t character) const;

    bool resolvable(char32_t character) const noexcept;

    const SymbolTable& table() const noexcept { return *table_; }

private:
    const SymbolTable* table_;
};

} // namespace ipaseg
