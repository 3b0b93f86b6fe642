#pragma once

#include "ipaseg/classifier.hpp"
#include "ipaseg/pho_element.hpp"
#include "ipaseg/symbol_table.hpp"
#include "ipaseg/transcript.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ipaseg {

// Combining short stroke overlay, marks a diacritic whose attachment side is switched
inline constexpr char32_t ROLE_SWITCHER = U'\u0335';

/**
 * Prepare raw transcription text for scanning: decode UTF-8, replace
 * [ ] \ / delimiters with spaces, trim surrounding whitespace.
 * @throws UnsupportedFeatureError if the text contains the role switcher
 */
std::u32string normalize_transcription(std::string_view text);

enum class AccumulatorState {
    AwaitingBase,  // open segment (if any) has no base yet
    InSegment      // open segment has its base
};

const char* accumulator_state_name(AccumulatorState state) noexcept;

/**
 * Segment Accumulator - the grouping state machine behind tokenize().
 *
 * Transitions, by incoming element role:
 *
 *   state         role                     action
 *   ------------  -----------------------  -------------------------------------------
 *   AwaitingBase  boundary/stress          emit buffer, emit [element]
 *   AwaitingBase  base                     append, -> InSegment
 *   AwaitingBase  other                    append
 *   InSegment     boundary/stress          emit buffer, emit [element], -> AwaitingBase
 *   InSegment     base                     emit buffer, buffer = [element]
 *   InSegment     diacritic_left           emit buffer, buffer = [element], -> AwaitingBase
 *   InSegment     other                    append
 *
 * Whitespace runs collapse to one word boundary entry which also closes the
 * open segment. One accumulator per tokenize call; not thread-safe.
 */
class SegmentAccumulator {
public:
    SegmentAccumulator() = default;

    // Whitespace seen in the input
    void feed_space();

    // Classified non-whitespace element
    void feed(PhoElement element);

    AccumulatorState state() const noexcept { return state_; }
    const Entry& buffer() const noexcept { return buffer_; }
    const std::vector<Entry>& entries() const noexcept { return entries_; }

    // Flush the remaining buffer (even if empty) and hand over the result
    Transcript finish();

private:
    void flush();
    void emit_single(PhoElement element);

    std::vector<Entry> entries_;
    Entry buffer_;
    AccumulatorState state_ = AccumulatorState::AwaitingBase;
    bool last_was_space_ = false;
};

/**
 * Tokenizer - IPA text -> Transcript
 *
 * Stateless between calls and safe to share across threads; every call gets
 * its own accumulator. The symbol table must outlive the tokenizer.
 */
class Tokenizer {
public:
    explicit Tokenizer(const SymbolTable& table) noexcept : classifier_(table) {}

    /**
     * @throws UnsupportedFeatureError for role-switched diacritics
     * @throws UnknownSymbolError on the first character missing from the table
     */
    Transcript tokenize(std::string_view text) const;

    const ElementClassifier& classifier() const noexcept { return classifier_; }

private:
    ElementClassifier classifier_;
};

} // namespace ipaseg
