// =============================================================================
// ipaseg CLI - IPA transcription segmenter
// =============================================================================
//
// Usage:
//   ipaseg <command> [options] <transcription...>
//
// Commands:
//   tokenize    Split transcriptions into segment, boundary and stress entries
//   segments    List well-formed segments with base and diacritics
//   bases       Print base phones only (diacritics and suprasegmentals stripped)
//   classify    Classify each character of the input
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   ipaseg tokenize "[pʰæt kʰaʧ]"
//   ipaseg segments --json "ⁿaˈʧ̥u"
//   ipaseg bases -t my_table.csv "k̪ʰⁿaˈʧ̥uᵊ"
//   cat words.txt | ipaseg tokenize -
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "ipaseg/batch.hpp"
#include "ipaseg/cli/options.hpp"
#include "ipaseg/classifier.hpp"
#include "ipaseg/config.hpp"
#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"
#include "ipaseg/segment.hpp"
#include "ipaseg/symbol_table.hpp"
#include "ipaseg/tokenizer.hpp"
#include "ipaseg/util/utf8.hpp"

namespace json = boost::json;

namespace ipaseg::cli {
    int cmd_tokenize(int argc, char* argv[]);
    int cmd_segments(int argc, char* argv[]);
    int cmd_bases(int argc, char* argv[]);
    int cmd_classify(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

using ipaseg::cli::EXIT_OK;
using ipaseg::cli::EXIT_USAGE;
using ipaseg::cli::Options;

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"tokenize", "Split transcriptions into segment, boundary and stress entries", ipaseg::cli::cmd_tokenize},
    {"segments", "List well-formed segments with base and diacritics", ipaseg::cli::cmd_segments},
    {"bases",    "Print base phones only", ipaseg::cli::cmd_bases},
    {"classify", "Classify each character of the input", ipaseg::cli::cmd_classify},
    {"version",  "Show version information", ipaseg::cli::cmd_version},
    {"help",     "Show this help message", ipaseg::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Setup
// =============================================================================

// Load config, apply verbosity, load the symbol table
static ipaseg::SymbolTable setup(const Options& opts) {
    auto& config = ipaseg::Config::getInstance();
    if (!ipaseg::init_config(opts.config_file)) {
        throw ipaseg::InvalidArgumentError("Invalid configuration", "setup");
    }
    if (!opts.table.empty()) {
        // command line wins over env and config file
        config.set("symbol_table.path", opts.table);
    }

    switch (opts.verbosity) {
        case -1: ipaseg::set_log_level(ipaseg::LogLevel::ERROR); break;
        case 1:  ipaseg::set_log_level(ipaseg::LogLevel::INFO); break;
        case 2:  ipaseg::set_log_level(ipaseg::LogLevel::DEBUG); break;
        default: break;
    }

    if (ipaseg::Logger::getInstance().enabled(ipaseg::LogLevel::INFO)) {
        config.print();
    }

    return ipaseg::SymbolTable::load_csv(config.get<std::string>("symbol_table.path"));
}

static size_t configured_threads() {
    int threads = ipaseg::Config::getInstance().get<int>("batch.threads", 0);
    return threads > 0 ? static_cast<size_t>(threads) : 0;
}

// =============================================================================
// JSON rendering
// =============================================================================

static json::object element_to_json(const ipaseg::PhoElement& element) {
    json::object obj;
    obj["symbol"] = element.symbol();
    obj["display"] = element.display();
    obj["kind"] = ipaseg::element_tag_name(element.tag());
    obj["role"] = ipaseg::role_name(element.role());
    obj["type"] = ipaseg::phonetic_type_name(element.type());
    obj["unicode"] = ipaseg::util::format_codepoint(element.character());
    if (!element.name().empty()) obj["name"] = element.name();
    if (!element.description().empty()) obj["description"] = element.description();

    if (const auto* c = element.as<ipaseg::Consonant>()) {
        obj["voice"] = c->voice;
        obj["place"] = c->place;
        obj["manner"] = c->manner;
        if (c->sonority) obj["sonority"] = *c->sonority;
        if (!c->eml.empty()) obj["eml"] = c->eml;
    } else if (const auto* v = element.as<ipaseg::Vowel>()) {
        obj["voice"] = v->voice;
        obj["backness"] = v->backness;
        obj["height"] = v->height;
        obj["rounding"] = v->rounding;
        obj["rhotic"] = v->rhotic;
        if (v->sonority) obj["sonority"] = *v->sonority;
    } else if (const auto* d = element.as<ipaseg::Diacritic>()) {
        obj["attach"] = d->side == ipaseg::AttachSide::Left ? "left" : "right";
    }
    return obj;
}

static json::array entry_to_json(const ipaseg::Entry& entry) {
    json::array arr;
    for (const auto& element : entry) {
        arr.push_back(element_to_json(element));
    }
    return arr;
}

static json::object segment_to_json(const ipaseg::Segment& segment) {
    json::object obj;
    obj["string"] = segment.string();
    obj["base"] = segment.base_string();
    json::array left, right;
    for (const auto& d : segment.left_diacritics()) left.push_back(json::string(d.symbol()));
    for (const auto& d : segment.right_diacritics()) right.push_back(json::string(d.symbol()));
    obj["left_diacritics"] = std::move(left);
    obj["right_diacritics"] = std::move(right);
    return obj;
}

static json::object failure_to_json(const ipaseg::BatchResult& result) {
    json::object obj;
    obj["input"] = result.input;
    obj["error"] = ipaseg::error_code_name(result.error);
    obj["message"] = result.message;
    return obj;
}

// Runs the batch and prints each result through `render`; returns the exit code
template<typename TextRender, typename JsonRender>
static int run_batch(const Options& opts, TextRender&& text_render, JsonRender&& json_render) {
    ipaseg::SymbolTable table = setup(opts);
    ipaseg::Tokenizer tokenizer(table);
    ipaseg::BatchTokenizer batch(tokenizer, configured_threads());

    std::vector<ipaseg::BatchResult> results = batch.tokenize_all(opts.inputs);

    json::array out;
    for (const auto& result : results) {
        if (!result.ok()) {
            if (opts.json) {
                out.push_back(failure_to_json(result));
            } else {
                std::cerr << result.input << ": " << ipaseg::error_code_name(result.error)
                          << ": " << result.message << "\n";
            }
            continue;
        }
        if (opts.json) {
            json::object obj;
            obj["input"] = result.input;
            json_render(*result.transcript, obj);
            out.push_back(std::move(obj));
        } else {
            text_render(result.input, *result.transcript);
        }
    }

    if (opts.json) {
        std::cout << json::serialize(out) << "\n";
    }
    return ipaseg::cli::exit_code(results);
}

// =============================================================================
// Commands
// =============================================================================

namespace ipaseg::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "ipaseg - IPA transcription segmenter\n";
    std::cout << "Version " << version_string() << "\n\n";
    std::cout << "Usage: ipaseg <command> [options] <transcription...>\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = std::strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nOptions:\n";
    std::cout << "  -t, --table <csv>       Symbol table (default: $IPASEG_SYMBOL_TABLE or bundled table)\n";
    std::cout << "  -c, --config <file>     key = value configuration file\n";
    std::cout << "  -j, --json              JSON output\n";
    std::cout << "  -v, --verbose           Log at info level\n";
    std::cout << "  -vv, --very-verbose     Log at debug level\n";
    std::cout << "  -q, --quiet             Log errors only\n";
    std::cout << "  -                       Read transcriptions from stdin, one per line\n";
    return EXIT_OK;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "ipaseg " << version_string() << "\n";
    return EXIT_OK;
}

int cmd_tokenize(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, std::cin, std::cerr)) return EXIT_USAGE;
    if (opts.inputs.empty()) {
        std::cerr << "tokenize: no transcription given\n";
        return EXIT_USAGE;
    }

    return run_batch(opts,
        [](const std::string& input, const Transcript& transcript) {
            std::cout << "Input: " << input << "\n";
            std::cout << "Result: " << transcript.debug_string() << "\n";
        },
        [](const Transcript& transcript, json::object& obj) {
            json::array entries;
            for (const auto& entry : transcript) {
                entries.push_back(entry_to_json(entry));
            }
            obj["entries"] = std::move(entries);
        });
}

int cmd_segments(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, std::cin, std::cerr)) return EXIT_USAGE;
    if (opts.inputs.empty()) {
        std::cerr << "segments: no transcription given\n";
        return EXIT_USAGE;
    }

    return run_batch(opts,
        [](const std::string& input, const Transcript& transcript) {
            std::cout << "Input: " << input << "\n";
            for (const auto& segment : transcript.segments()) {
                std::cout << "  " << segment << "\n";
            }
        },
        [](const Transcript& transcript, json::object& obj) {
            json::array segments;
            for (const auto& segment : transcript.segments()) {
                segments.push_back(segment_to_json(segment));
            }
            obj["segments"] = std::move(segments);
        });
}

int cmd_bases(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, std::cin, std::cerr)) return EXIT_USAGE;
    if (opts.inputs.empty()) {
        std::cerr << "bases: no transcription given\n";
        return EXIT_USAGE;
    }

    return run_batch(opts,
        [](const std::string&, const Transcript& transcript) {
            std::cout << bases_string(transcript) << "\n";
        },
        [](const Transcript& transcript, json::object& obj) {
            obj["bases"] = bases_string(transcript);
        });
}

int cmd_classify(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts, std::cin, std::cerr)) return EXIT_USAGE;
    if (opts.inputs.empty()) {
        std::cerr << "classify: no characters given\n";
        return EXIT_USAGE;
    }

    SymbolTable table = setup(opts);
    ElementClassifier classifier(table);

    int rc = EXIT_OK;
    json::array out;
    for (const auto& input : opts.inputs) {
        for (char32_t c : util::decode_utf8(input)) {
            try {
                PhoElement element = classifier.classify(c);
                if (opts.json) {
                    out.push_back(element_to_json(element));
                } else {
                    std::cout << util::format_codepoint(c) << "  " << element
                              << "  role=" << role_name(element.role())
                              << " type=" << phonetic_type_name(element.type());
                    if (!element.name().empty()) std::cout << "  " << element.name();
                    std::cout << "\n";
                }
            } catch (const UnknownSymbolError& e) {
                rc = exit_code(e.code());
                if (opts.json) {
                    json::object obj;
                    obj["unicode"] = util::format_codepoint(e.symbol());
                    obj["error"] = error_code_name(e.code());
                    obj["message"] = e.message();
                    out.push_back(std::move(obj));
                } else {
                    std::cerr << e.message() << "\n";
                }
            }
        }
    }

    if (opts.json) {
        std::cout << json::serialize(out) << "\n";
    }
    return rc;
}

} // namespace ipaseg::cli

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        ipaseg::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* name = argv[1];
    if (std::strcmp(name, "-h") == 0 || std::strcmp(name, "--help") == 0) {
        return ipaseg::cli::cmd_help(0, nullptr);
    }
    if (std::strcmp(name, "--version") == 0) {
        return ipaseg::cli::cmd_version(0, nullptr);
    }

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (std::strcmp(cmd->name, name) == 0) {
            try {
                return cmd->handler(argc - 2, argv + 2);
            } catch (const ipaseg::IpasegException& e) {
                std::cerr << e.what() << "\n";
                return ipaseg::cli::exit_code(e.code());
            }
        }
    }

    std::cerr << "Unknown command: " << name << "\n\n";
    ipaseg::cli::cmd_help(0, nullptr);
    return EXIT_USAGE;
}
