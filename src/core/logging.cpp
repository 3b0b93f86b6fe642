#include "ipaseg/logging.hpp"
#include "ipaseg/error.hpp"

#include <algorithm>
#include <cctype>

namespace ipaseg {

LogLevel parse_log_level(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "debug") return LogLevel::DEBUG;
    if (value == "info") return LogLevel::INFO;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "error") return LogLevel::ERROR;
    if (value == "off" || value == "none") return LogLevel::OFF;

    throw InvalidArgumentError("Unknown log level '" + value + "'", __func__,
                               "Use one of: debug, info, warn, error, off");
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF:   return "off";
    }
    return "unknown";
}

} // namespace ipaseg
