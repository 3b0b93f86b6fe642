#pragma once

#include "ipaseg/error.hpp"
#include "ipaseg/thread_pool.hpp"
#include "ipaseg/tokenizer.hpp"
#include "ipaseg/transcript.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ipaseg {

/**
 * Outcome of one input in a batch. Exactly one of `transcript` or an error
 * code other than SUCCESS is set.
 */
struct BatchResult {
    std::string input;
    std::optional<Transcript> transcript;
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool ok() const noexcept { return transcript.has_value(); }
};

/**
 * Tokenize many transcriptions in parallel against one shared table.
 * Output order matches input order; a failing input does not affect others.
 */
class BatchTokenizer {
public:
    // 0 threads = hardware concurrency
    explicit BatchTokenizer(const Tokenizer& tokenizer, size_t threads = 0);

    std::vector<BatchResult> tokenize_all(const std::vector<std::string>& inputs);

    size_t num_threads() const noexcept { return pool_.num_threads(); }

private:
    const Tokenizer& tokenizer_;
    ThreadPool pool_;
};

} // namespace ipaseg
