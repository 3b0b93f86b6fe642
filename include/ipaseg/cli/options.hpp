#pragma once

#include "ipaseg/batch.hpp"
#include "ipaseg/error.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace ipaseg::cli {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FAILED = 2;

struct Options {
    std::string table;
    std::string config_file;
    bool json = false;
    int verbosity = 0;   // -1 quiet, 1 info, 2 debug
    std::vector<std::string> inputs;
};

/**
 * Parse the arguments that follow the command name.
 *
 *   -t, --table <csv>     symbol table path
 *   -c, --config <file>   key = value configuration file
 *   -j, --json            JSON output
 *   -v / -vv / -q         info / debug / errors-only logging
 *   -                     read non-empty lines from `in` as inputs
 *
 * Anything not starting with '-' is an input. Returns false on a usage
 * error, after writing the reason to `err`.
 */
bool parse_options(int argc, char* const argv[], Options& opts,
                   std::istream& in, std::ostream& err);

// SUCCESS -> EXIT_OK, any library error -> EXIT_FAILED
int exit_code(ErrorCode code) noexcept;

// EXIT_FAILED if any input failed
int exit_code(const std::vector<BatchResult>& results) noexcept;

// Project version, set by the build
const char* version_string() noexcept;

} // namespace ipaseg::cli
