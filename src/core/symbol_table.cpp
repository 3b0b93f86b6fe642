#include "ipaseg/symbol_table.hpp"
#include "ipaseg/error.hpp"
#include "ipaseg/logging.hpp"
#include "ipaseg/util/utf8.hpp"

#include <fstream>
#include <optional>
#include <string_view>

namespace ipaseg {

namespace {

// Required and optional column headers of the symbol table CSV
constexpr const char* COL_SYMBOL = "Symbol";
constexpr const char* COL_DESCRIPTION = "Description";
constexpr const char* COL_DISPLAY = "Symbol-Display";
constexpr const char* COL_NAME = "Name";
constexpr const char* COL_UNICODE = "Unicode";
constexpr const char* COL_TYPE = "Type";
constexpr const char* COL_ROLE = "Role";
constexpr const char* COL_VOICE = "Voice";
constexpr const char* COL_PLACE = "Place";
constexpr const char* COL_MANNER = "Manner";
constexpr const char* COL_SONORITY = "Sonority";
constexpr const char* COL_EML = "EML";
constexpr const char* COL_BACKNESS = "Backness";
constexpr const char* COL_HEIGHT = "Height";
constexpr const char* COL_ROUNDING = "Rounding";
constexpr const char* COL_RHOTIC = "Rhotic";

class ColumnMap {
public:
    explicit ColumnMap(const std::vector<std::string>& header) {
        for (size_t i = 0; i < header.size(); ++i) {
            columns_.emplace(header[i], i);
        }
    }

    std::optional<size_t> index(const std::string& name) const {
        auto it = columns_.find(name);
        if (it == columns_.end()) return std::nullopt;
        return it->second;
    }

    // Empty string when the column is absent or the row is short
    std::string get(const std::vector<std::string>& row, const std::string& name) const {
        auto idx = index(name);
        if (!idx || *idx >= row.size()) return "";
        return row[*idx];
    }

private:
    std::unordered_map<std::string, size_t> columns_;
};

std::string strip_line_ending(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    return line;
}

std::vector<char32_t> parse_unicode_column(const std::string& text, const std::string& where) {
    std::vector<char32_t> result;
    std::string token;

    auto flush = [&]() {
        if (token.empty()) return;
        auto cp = util::parse_codepoint(token);
        if (!cp) {
            throw TableFormatError("Invalid Unicode value '" + token + "'", where);
        }
        result.push_back(*cp);
        token.clear();
    };

    for (char c : text) {
        if (c == ' ' || c == ';' || c == ',' || c == '\t' ||
            (c == '+' && !(token == "U" || token == "u"))) {
            flush();
        } else {
            token.push_back(c);
        }
    }
    flush();
    return result;
}

std::optional<int> parse_sonority(const std::string& text, const std::string& where) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the format error below
    }
    throw TableFormatError("Invalid Sonority value '" + text + "'", where);
}

bool parse_flag(const std::string& text) {
    return text == "+" || text == "1" || text == "yes" || text == "true" || text == "TRUE";
}

} // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }

    if (in_quotes) {
        throw TableFormatError("Unterminated quoted field", __func__);
    }

    fields.push_back(std::move(field));
    return fields;
}

SymbolTable SymbolTable::from_records(std::vector<SymbolRecord> records) {
    SymbolTable table;
    table.records_.reserve(records.size());
    table.index_.reserve(records.size());

    for (auto& record : records) {
        if (record.symbol == 0) {
            throw TableFormatError("Symbol record without a symbol", __func__);
        }
        if (util::is_space(record.symbol)) {
            throw TableFormatError("Whitespace " + util::format_codepoint(record.symbol) +
                                   " cannot be a table symbol", __func__);
        }
        if (!table.index_.emplace(record.symbol, table.records_.size()).second) {
            throw TableFormatError("Duplicate symbol '" + util::encode_utf8(record.symbol) +
                                   "' (" + util::format_codepoint(record.symbol) + ")", __func__);
        }
        table.records_.push_back(std::move(record));
    }

    return table;
}

SymbolTable SymbolTable::load_csv(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open symbol table: " + path, __func__,
                      "Set IPASEG_SYMBOL_TABLE or pass --table <csv>");
    }

    SymbolTable table = parse_csv(file, path);
    LOG_INFO("Loaded ", table.size(), " symbols from ", path);
    return table;
}

SymbolTable SymbolTable::parse_csv(std::istream& in, const std::string& source_name) {
    std::string line;
    size_t line_num = 0;

    // Header (skip leading blank lines)
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        ++line_num;
        line = strip_line_ending(line);
        if (line_num == 1 && line.size() >= 3 &&
            static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.erase(0, 3);
        }
        if (line.empty()) continue;
        header = split_csv_line(line);
        break;
    }

    if (header.empty()) {
        throw TableFormatError("Symbol table is empty", source_name);
    }

    ColumnMap columns(header);
    for (const char* required : {COL_SYMBOL, COL_TYPE, COL_ROLE}) {
        if (!columns.index(required)) {
            throw TableFormatError(std::string("Missing required column '") + required + "'",
                                   source_name + ":" + std::to_string(line_num));
        }
    }

    std::vector<SymbolRecord> records;
    while (std::getline(in, line)) {
        ++line_num;
        line = strip_line_ending(line);
        if (line.empty()) continue;

        const std::string where = source_name + ":" + std::to_string(line_num);

        std::vector<std::string> row;
        try {
            row = split_csv_line(line);
        } catch (const TableFormatError& e) {
            throw TableFormatError(e.message(), where);
        }

        std::u32string symbol = util::decode_utf8(columns.get(row, COL_SYMBOL));
        if (symbol.size() != 1) {
            throw TableFormatError("Symbol must be exactly one character, got '" +
                                   columns.get(row, COL_SYMBOL) + "'", where);
        }

        SymbolRecord record;
        record.symbol = symbol[0];
        record.description = columns.get(row, COL_DESCRIPTION);
        record.display = columns.get(row, COL_DISPLAY);
        if (record.display.empty()) {
            record.display = util::encode_utf8(record.symbol);
        }
        record.name = columns.get(row, COL_NAME);
        record.unicode = parse_unicode_column(columns.get(row, COL_UNICODE), where);
        if (record.unicode.empty()) {
            record.unicode.push_back(record.symbol);
        }

        const std::string type_text = columns.get(row, COL_TYPE);
        record.type = parse_phonetic_type(type_text);
        const std::string role_text = columns.get(row, COL_ROLE);
        record.role = parse_role(role_text);
        if (record.role == Role::Unknown) {
            LOG_DEBUG("Symbol ", util::format_codepoint(record.symbol),
                      " has unrecognized role '", role_text, "' at ", where);
        }

        record.voice = columns.get(row, COL_VOICE);
        record.place = columns.get(row, COL_PLACE);
        record.manner = columns.get(row, COL_MANNER);
        record.sonority = parse_sonority(columns.get(row, COL_SONORITY), where);
        record.eml = columns.get(row, COL_EML);
        record.backness = columns.get(row, COL_BACKNESS);
        record.height = columns.get(row, COL_HEIGHT);
        record.rounding = columns.get(row, COL_ROUNDING);
        record.rhotic = parse_flag(columns.get(row, COL_RHOTIC));

        records.push_back(std::move(record));
    }

    try {
        return from_records(std::move(records));
    } catch (const TableFormatError& e) {
        throw TableFormatError(e.message(), source_name);
    }
}

const SymbolRecord* SymbolTable::find(char32_t grapheme) const noexcept {
    auto it = index_.find(grapheme);
    if (it == index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

} // namespace ipaseg
