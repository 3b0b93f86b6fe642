#include "ipaseg/cli/options.hpp"

#include <cstring>
#include <istream>
#include <ostream>

#ifndef IPASEG_VERSION_STRING
#error "IPASEG_VERSION_STRING must be defined by the build"
#endif

namespace ipaseg::cli {

static bool matches(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

bool parse_options(int argc, char* const argv[], Options& opts,
                   std::istream& in, std::ostream& err) {
    for (int i = 0; i < argc; ++i) {
        const char* arg = argv[i];
        if (matches(arg, "-t", "--table")) {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            opts.table = argv[++i];
        } else if (matches(arg, "-c", "--config")) {
            if (i + 1 >= argc) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            opts.config_file = argv[++i];
        } else if (matches(arg, "-j", "--json")) {
            opts.json = true;
        } else if (matches(arg, "-v", "--verbose")) {
            opts.verbosity = 1;
        } else if (matches(arg, "-vv", "--very-verbose")) {
            opts.verbosity = 2;
        } else if (matches(arg, "-q", "--quiet")) {
            opts.verbosity = -1;
        } else if (std::strcmp(arg, "-") == 0) {
            std::string line;
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (!line.empty()) opts.inputs.push_back(line);
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            err << "Unknown option: " << arg << "\n";
            return false;
        } else {
            opts.inputs.emplace_back(arg);
        }
    }
    return true;
}

int exit_code(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS ? EXIT_OK : EXIT_FAILED;
}

int exit_code(const std::vector<BatchResult>& results) noexcept {
    for (const auto& result : results) {
        if (!result.ok()) return EXIT_FAILED;
    }
    return EXIT_OK;
}

const char* version_string() noexcept {
    return IPASEG_VERSION_STRING;
}

} // namespace ipaseg::cli
