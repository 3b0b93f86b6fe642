#pragma once

#include "ipaseg/pho_element.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ipaseg {

// Tie bar used to join the bases of a compound phone (U+0361)
inline constexpr char32_t TIE_BAR = U'\u0361';

/**
 * Segment - one base glyph plus the diacritics attached to it.
 *
 * Components keep tokenizer order. A segment with more than one base is a
 * compound phone; only its string form is supported.
 */
class Segment {
public:
    using const_iterator = std::vector<PhoElement>::const_iterator;

    /**
     * @throws ValidationError if no component has the base role
     */
    explicit Segment(std::vector<PhoElement> components);

    const std::vector<PhoElement>& components() const noexcept { return components_; }
    const std::vector<PhoElement>& base() const noexcept { return base_; }
    const std::vector<PhoElement>& left_diacritics() const noexcept { return left_diacritics_; }
    const std::vector<PhoElement>& right_diacritics() const noexcept { return right_diacritics_; }

    // Concatenated component symbols
    const std::string& string() const noexcept { return string_; }

    bool is_compound() const noexcept { return base_.size() > 1; }

    // Base symbol; compound bases are joined with a tie bar
    std::string base_string() const;

    /**
     * @throws NotImplementedError for compound bases
     */
    const PhoElement& base_element() const;

    size_t size() const noexcept { return components_.size(); }
    const PhoElement& operator[](size_t index) const { return components_[index]; }
    const_iterator begin() const noexcept { return components_.begin(); }
    const_iterator end() const noexcept { return components_.end(); }

    bool contains(const PhoElement& element) const;
    bool contains(std::string_view text) const;

    bool operator==(const Segment& other) const { return components_ == other.components_; }
    bool operator!=(const Segment& other) const { return !(*this == other); }

    // e.g. Segment(string='pʰ', base=['p'], diacritics=['ʰ'])
    std::string repr() const;

private:
    std::vector<PhoElement> components_;
    std::vector<PhoElement> base_;
    std::vector<PhoElement> left_diacritics_;
    std::vector<PhoElement> right_diacritics_;
    std::string string_;
};

std::ostream& operator<<(std::ostream& os, const Segment& segment);

} // namespace ipaseg

namespace std {

template<>
struct hash<ipaseg::Segment> {
    size_t operator()(const ipaseg::Segment& segment) const noexcept {
        return hash<string>{}(segment.string());
    }
};

} // namespace std
