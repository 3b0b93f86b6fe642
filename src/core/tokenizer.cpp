#include "ipaseg/tokenizer.hpp"
#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"
#include "ipaseg/util/utf8.hpp"

namespace ipaseg {

namespace {

bool is_delimiter(char32_t c) noexcept {
    return c == U'[' || c == U']' || c == U'\\' || c == U'/';
}

} // namespace

std::u32string normalize_transcription(std::string_view text) {
    std::u32string chars = util::decode_utf8(text);

    if (chars.find(ROLE_SWITCHER) != std::u32string::npos) {
        throw UnsupportedFeatureError("Role-switched diacritics are not supported: '" +
                                      std::string(text) + "'", __func__);
    }

    for (char32_t& c : chars) {
        if (is_delimiter(c)) {
            c = U' ';
        }
    }

    size_t first = 0;
    while (first < chars.size() && util::is_space(chars[first])) {
        ++first;
    }
    size_t last = chars.size();
    while (last > first && util::is_space(chars[last - 1])) {
        --last;
    }
    return chars.substr(first, last - first);
}

const char* accumulator_state_name(AccumulatorState state) noexcept {
    switch (state) {
        case AccumulatorState::AwaitingBase: return "AwaitingBase";
        case AccumulatorState::InSegment:    return "InSegment";
    }
    return "unknown";
}

// =============================================================================
// SegmentAccumulator
// =============================================================================

void SegmentAccumulator::feed_space() {
    if (last_was_space_) {
        return;
    }
    flush();
    state_ = AccumulatorState::AwaitingBase;
    emit_single(PhoElement::word_boundary());
    last_was_space_ = true;
}

void SegmentAccumulator::feed(PhoElement element) {
    last_was_space_ = false;
    const Role role = element.role();

    // Boundaries and stress always stand alone and close whatever is open
    if (role == Role::Boundary || role == Role::Stress) {
        flush();
        state_ = AccumulatorState::AwaitingBase;
        emit_single(std::move(element));
        return;
    }

    if (state_ == AccumulatorState::AwaitingBase) {
        buffer_.push_back(std::move(element));
        if (role == Role::Base) {
            state_ = AccumulatorState::InSegment;
        }
        return;
    }

    if (is_segment_ender(role)) {
        flush();
        buffer_.push_back(std::move(element));
        state_ = (role == Role::Base) ? AccumulatorState::InSegment
                                      : AccumulatorState::AwaitingBase;
        return;
    }

    // Right diacritics and tie bars stay with the open segment
    buffer_.push_back(std::move(element));
}

Transcript SegmentAccumulator::finish() {
    flush();
    state_ = AccumulatorState::AwaitingBase;
    last_was_space_ = false;
    return Transcript(std::move(entries_));
}

void SegmentAccumulator::flush() {
    entries_.push_back(std::move(buffer_));
    buffer_.clear();
}

void SegmentAccumulator::emit_single(PhoElement element) {
    entries_.push_back(Entry{std::move(element)});
}

// =============================================================================
// Tokenizer
// =============================================================================

Transcript Tokenizer::tokenize(std::string_view text) const {
    const std::u32string chars = normalize_transcription(text);

    const bool trace = Logger::getInstance().enabled(LogLevel::DEBUG);

    SegmentAccumulator accumulator;
    for (size_t i = 0; i < chars.size(); ++i) {
        const char32_t c = chars[i];
        if (trace) {
            LOG_DEBUG("Parsing character ", i, ": '", util::encode_utf8(c), "' (",
                      util::format_codepoint(c), ") state=",
                      accumulator_state_name(accumulator.state()));
        }

        if (util::is_space(c)) {
            accumulator.feed_space();
        } else {
            accumulator.feed(classifier_.classify(c));
        }
    }

    Transcript transcript = accumulator.finish();
    if (trace) {
        LOG_DEBUG("Transcript: ", transcript.debug_string());
    }
    return transcript;
}

} // namespace ipaseg
