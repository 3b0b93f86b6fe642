#include "ipaseg/batch.hpp"
#include "ipaseg/logging.hpp"

#include <chrono>

namespace ipaseg {

BatchTokenizer::BatchTokenizer(const Tokenizer& tokenizer, size_t threads)
    : tokenizer_(tokenizer)
    , pool_(threads) {}

std::vector<BatchResult> BatchTokenizer::tokenize_all(const std::vector<std::string>& inputs) {
    std::vector<BatchResult> results(inputs.size());
    auto start = std::chrono::steady_clock::now();

    pool_.parallel_for(0, inputs.size(), [&](size_t i) {
        BatchResult& result = results[i];
        result.input = inputs[i];
        try {
            result.transcript = tokenizer_.tokenize(inputs[i]);
        } catch (const IpasegException& e) {
            result.error = e.code();
            result.message = e.message();
        }
    });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_INFO("Tokenized ", inputs.size(), " transcriptions on ", pool_.num_threads(),
             " threads in ", elapsed.count(), " ms");
    return results;
}

} // namespace ipaseg
