#pragma once

#include "ipaseg/pho_element.hpp"
#include "ipaseg/segment.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace ipaseg {

// One tokenizer output entry: segment components, or a singleton boundary/stress
using Entry = std::vector<PhoElement>;

class SegmentRange;

/**
 * Transcript - ordered tokenizer output, immutable once built
 */
class Transcript {
public:
    using const_iterator = std::vector<Entry>::const_iterator;

    Transcript() = default;
    explicit Transcript(std::vector<Entry> entries) : entries_(std::move(entries)) {}

    const std::vector<Entry>& entries() const noexcept { return entries_; }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const Entry& operator[](size_t index) const { return entries_[index]; }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    // All resolved symbols joined in order
    std::string to_string() const;

    // Entries rendered as "[p ʰ] [æ] [ ]"
    std::string debug_string() const;

    // Lazy view of the well-formed segments; other entries are skipped.
    // The view borrows the transcript, so temporaries are rejected.
    SegmentRange segments() const&;
    SegmentRange segments() const&& = delete;

    bool operator==(const Transcript& other) const { return entries_ == other.entries_; }
    bool operator!=(const Transcript& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

/**
 * Forward range of Segments over a transcript. Entries that fail Segment
 * validation (boundaries, stress, empty and base-less entries) are skipped.
 * The transcript must outlive the range.
 */
class SegmentRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Segment;
        using difference_type = std::ptrdiff_t;
        using pointer = const Segment*;
        using reference = const Segment&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            ++index_;
            settle();
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator& other) const noexcept {
            return entries_ == other.entries_ && index_ == other.index_;
        }
        bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        friend class SegmentRange;

        iterator(const std::vector<Entry>* entries, size_t index)
            : entries_(entries), index_(index) {
            settle();
        }

        // Advance to the next entry that forms a valid Segment
        void settle();

        const std::vector<Entry>* entries_ = nullptr;
        size_t index_ = 0;
        std::optional<Segment> current_;
    };

    explicit SegmentRange(const Transcript& transcript) noexcept : transcript_(&transcript) {}
    explicit SegmentRange(const Transcript&& transcript) = delete;

    iterator begin() const { return iterator(&transcript_->entries(), 0); }
    iterator end() const { return iterator(&transcript_->entries(), transcript_->size()); }

    // Materialize the whole range
    std::vector<Segment> to_vector() const;

private:
    const Transcript* transcript_;
};

inline SegmentRange Transcript::segments() const& {
    return SegmentRange(*this);
}

// Base element of every valid segment (first base for compound segments)
std::vector<PhoElement> bases(const Transcript& transcript);

// Base symbols of every valid segment, diacritics and suprasegmentals stripped
std::string bases_string(const Transcript& transcript);

} // namespace ipaseg
