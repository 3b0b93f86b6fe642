#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ipaseg {

/**
 * Error handling for the tokenizer and its loaders.
 * Every error carries a code, an optional context (usually the throwing
 * function) and an optional suggestion for the user.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_IMPLEMENTED = 3,

    // Transcription errors
    UNKNOWN_SYMBOL = 100,
    UNSUPPORTED_FEATURE = 101,
    VALIDATION_FAILED = 102,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PARSE_ERROR = 301,

    // Internal errors
    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class IpasegException : public std::runtime_error {
public:
    explicit IpasegException(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "ipaseg error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public IpasegException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : IpasegException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class NotImplementedError : public IpasegException {
public:
    explicit NotImplementedError(const std::string& message,
                                 const std::string& context = "")
        : IpasegException(ErrorCode::NOT_IMPLEMENTED, message, context) {}
};

// A character that has no entry in the symbol table
class UnknownSymbolError : public IpasegException {
public:
    explicit UnknownSymbolError(char32_t symbol, const std::string& context = "");

    char32_t symbol() const noexcept { return symbol_; }

private:
    char32_t symbol_;
};

class UnsupportedFeatureError : public IpasegException {
public:
    explicit UnsupportedFeatureError(const std::string& message,
                                     const std::string& context = "")
        : IpasegException(ErrorCode::UNSUPPORTED_FEATURE, message, context) {}
};

class ValidationError : public IpasegException {
public:
    explicit ValidationError(const std::string& message,
                             const std::string& context = "")
        : IpasegException(ErrorCode::VALIDATION_FAILED, message, context) {}
};

class IOError : public IpasegException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : IpasegException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class TableFormatError : public IpasegException {
public:
    explicit TableFormatError(const std::string& message,
                              const std::string& context = "")
        : IpasegException(ErrorCode::PARSE_ERROR, message, context) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw IpasegException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define IPASEG_CHECK(condition, code, message) \
    ipaseg::ErrorHandler::check_condition(condition, code, message, __func__)

#define IPASEG_CHECK_ARGUMENT(condition, message) \
    ipaseg::ErrorHandler::check_argument(condition, message, __func__)

#define IPASEG_THROW(code, message) \
    throw ipaseg::IpasegException(code, message, __func__)

} // namespace ipaseg
