#include "ipaseg/transcript.hpp"
#include "ipaseg/error.hpp"

namespace ipaseg {

std::string Transcript::to_string() const {
    std::string out;
    for (const auto& entry : entries_) {
        for (const auto& element : entry) {
            out += element.symbol();
        }
    }
    return out;
}

std::string Transcript::debug_string() const {
    std::string out;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) out += ' ';
        out += '[';
        for (size_t j = 0; j < entries_[i].size(); ++j) {
            if (j > 0) out += ' ';
            out += entries_[i][j].symbol();
        }
        out += ']';
    }
    return out;
}

void SegmentRange::iterator::settle() {
    current_.reset();
    while (entries_ && index_ < entries_->size()) {
        try {
            current_.emplace((*entries_)[index_]);
            return;
        } catch (const ValidationError&) {
            // Not a segment (boundary, stress, stray diacritics)
            ++index_;
        }
    }
}

std::vector<Segment> SegmentRange::to_vector() const {
    std::vector<Segment> out;
    for (const auto& segment : *this) {
        out.push_back(segment);
    }
    return out;
}

std::vector<PhoElement> bases(const Transcript& transcript) {
    std::vector<PhoElement> out;
    for (const auto& segment : transcript.segments()) {
        out.push_back(segment.base().front());
    }
    return out;
}

std::string bases_string(const Transcript& transcript) {
    std::string out;
    for (const auto& segment : transcript.segments()) {
        out += segment.base_string();
    }
    return out;
}

} // namespace ipaseg
