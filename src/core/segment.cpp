#include "ipaseg/segment.hpp"
#include "ipaseg/error.hpp"
#include "ipaseg/util/utf8.hpp"

#include <algorithm>

namespace ipaseg {

namespace {

std::string join_symbols(const std::vector<PhoElement>& elements) {
    std::string out;
    for (const auto& element : elements) {
        out += element.symbol();
    }
    return out;
}

std::string join_displays(const std::vector<PhoElement>& elements) {
    std::string out;
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + elements[i].display() + "'";
    }
    return out;
}

} // namespace

Segment::Segment(std::vector<PhoElement> components)
    : components_(std::move(components)) {
    for (const auto& component : components_) {
        switch (component.role()) {
            case Role::Base:           base_.push_back(component); break;
            case Role::DiacriticLeft:  left_diacritics_.push_back(component); break;
            case Role::DiacriticRight: right_diacritics_.push_back(component); break;
            default: break;
        }
    }

    string_ = join_symbols(components_);

    if (base_.empty()) {
        throw ValidationError("Segment must have at least one base component: '" + string_ + "'",
                              __func__);
    }
}

std::string Segment::base_string() const {
    if (base_.size() == 1) {
        return base_.front().symbol();
    }

    const std::string tie = util::encode_utf8(TIE_BAR);
    std::string out;
    for (size_t i = 0; i < base_.size(); ++i) {
        if (i > 0) out += tie;
        out += base_[i].symbol();
    }
    return out;
}

const PhoElement& Segment::base_element() const {
    if (base_.size() > 1) {
        throw NotImplementedError("Segment '" + string_ +
                                  "': element access for a compound base is not implemented",
                                  __func__);
    }
    return base_.front();
}

bool Segment::contains(const PhoElement& element) const {
    return std::find(components_.begin(), components_.end(), element) != components_.end();
}

bool Segment::contains(std::string_view text) const {
    return string_.find(text) != std::string::npos;
}

std::string Segment::repr() const {
    std::vector<PhoElement> diacritics = right_diacritics_;
    diacritics.insert(diacritics.end(), left_diacritics_.begin(), left_diacritics_.end());

    return "Segment(string='" + string_ + "', base=[" + join_displays(base_) +
           "], diacritics=[" + join_displays(diacritics) + "])";
}

std::ostream& operator<<(std::ostream& os, const Segment& segment) {
    return os << segment.repr();
}

} // namespace ipaseg
