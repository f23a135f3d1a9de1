/**
 * SpecTable.hpp - Expected pin operations loaded from CSV
 *
 * Format: a header row followed by `function,pin` rows, e.g.
 *
 *   function,pin
 *   digitalWrite,13
 *   analogRead,A0
 *
 * The first row is always treated as the header. Rows with fewer than two
 * fields are skipped; columns after the second are ignored. Fields follow
 * RFC 4180 quoting ("a,b" and doubled "" inside quotes).
 *
 * Version: 1.0.0
 */

#pragma once

#include "PinNamespace.hpp"
#include <string>
#include <vector>

namespace sketch_probe {

struct SpecEntry {
    std::string function;
    PinId expectedPin;
    std::string expectedText;   // pin field as written, trimmed
};

class SpecTable {
public:
    SpecTable() = default;

    /**
     * Parse CSV text
     */
    static SpecTable parse(const std::string& csvText);

    /**
     * Load and parse a CSV file
     * @throws SourceReadException if the file cannot be read
     */
    static SpecTable fromFile(const std::string& path);

    const std::vector<SpecEntry>& getEntries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Data rows dropped for having fewer than two fields
    size_t getSkippedRows() const { return skippedRows_; }

    void addEntry(const std::string& function, const std::string& pin);

private:
    std::vector<SpecEntry> entries_;
    size_t skippedRows_ = 0;
};

/**
 * Split CSV text into rows of raw fields
 */
std::vector<std::vector<std::string>> parseCsvRows(const std::string& csvText);

} // namespace sketch_probe
