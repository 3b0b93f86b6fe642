#include "ipaseg/error.hpp"
#include "ipaseg/util/utf8.hpp"

namespace ipaseg {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:             return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case ErrorCode::NOT_IMPLEMENTED:     return "NOT_IMPLEMENTED";
        case ErrorCode::UNKNOWN_SYMBOL:      return "UNKNOWN_SYMBOL";
        case ErrorCode::UNSUPPORTED_FEATURE: return "UNSUPPORTED_FEATURE";
        case ErrorCode::VALIDATION_FAILED:   return "VALIDATION_FAILED";
        case ErrorCode::FILE_NOT_FOUND:      return "FILE_NOT_FOUND";
        case ErrorCode::PARSE_ERROR:         return "PARSE_ERROR";
        case ErrorCode::INTERNAL_ERROR:      return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

UnknownSymbolError::UnknownSymbolError(char32_t symbol, const std::string& context)
    : IpasegException(ErrorCode::UNKNOWN_SYMBOL,
                      "'" + util::encode_utf8(symbol) + "' (" + util::format_codepoint(symbol) +
                          ") not in symbol table",
                      context,
                      "Add the symbol to the symbol table or remove it from the transcription")
    , symbol_(symbol) {}

} // namespace ipaseg
