#pragma once

#include "ipaseg/types.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace ipaseg {

/**
 * Symbol Table - read-only grapheme -> SymbolRecord lookup
 *
 * Built once (from a CSV resource or from in-memory records) and then shared
 * by reference. All lookups are const, so one instance can serve any number
 * of concurrent tokenizers.
 */
class SymbolTable {
public:
    SymbolTable() = default;

    /**
     * Build a table from records
     * @throws TableFormatError on a duplicate or empty symbol
     */
    static SymbolTable from_records(std::vector<SymbolRecord> records);

    /**
     * Load the CSV symbol table
     * @throws IOError if the file cannot be opened
     * @throws TableFormatError on malformed content
     */
    static SymbolTable load_csv(const std::string& path);

    // `source_name` is only used in error messages
    static SymbolTable parse_csv(std::istream& in, const std::string& source_name = "<stream>");

    // nullptr when the grapheme has no entry
    const SymbolRecord* find(char32_t grapheme) const noexcept;

    bool contains(char32_t grapheme) const noexcept {
        return index_.count(grapheme) > 0;
    }

    size_t size() const noexcept { return records_.size(); }
    bool empty() const noexcept { return records_.empty(); }

    // Records in load order
    const std::vector<SymbolRecord>& records() const noexcept { return records_; }

private:
    std::vector<SymbolRecord> records_;
    std::unordered_map<char32_t, size_t> index_;
};

// Split one CSV line into fields (quoted fields, doubled quotes)
std::vector<std::string> split_csv_line(const std::string& line);

} // namespace ipaseg
