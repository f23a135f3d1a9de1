/**
 * SpecTable.cpp - Implementation of the CSV expectation table
 */

#include "SpecTable.hpp"
#include "PlatformAbstraction.hpp"
#include "ProbeErrors.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

std::vector<std::vector<std::string>> parseCsvRows(const std::string& csvText) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasContent = false;

    auto endField = [&]() {
        row.push_back(field);
        field.clear();
    };
    auto endRow = [&]() {
        endField();
        // A blank line is an empty row, not a row with one empty field
        if (rowHasContent || row.size() > 1) {
            rows.push_back(row);
        } else {
            rows.emplace_back();
        }
        row.clear();
        rowHasContent = false;
    };

    for (size_t i = 0; i < csvText.size(); ++i) {
        char c = csvText[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < csvText.size() && csvText[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                inQuotes = true;
                rowHasContent = true;
                break;
            case ',':
                endField();
                rowHasContent = true;
                break;
            case '\r':
                if (i + 1 < csvText.size() && csvText[i + 1] == '\n') {
                    ++i;
                }
                endRow();
                break;
            case '\n':
                endRow();
                break;
            default:
                field += c;
                rowHasContent = true;
                break;
        }
    }

    if (rowHasContent || !field.empty() || !row.empty()) {
        endRow();
    }
    return rows;
}

SpecTable SpecTable::parse(const std::string& csvText) {
    SpecTable table;
    auto rows = parseCsvRows(csvText);

    for (size_t i = 1; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (row.size() < 2) {
            DEBUG_STREAM << "SpecTable: skipping row " << (i + 1) << " (" << row.size() << " field(s))" << std::endl;
            ++table.skippedRows_;
            continue;
        }
        table.addEntry(row[0], row[1]);
    }
    return table;
}

SpecTable SpecTable::fromFile(const std::string& path) {
    PlatformFile file;
    std::string text;
    if (!file.open(path.c_str(), "r") || !file.readAll(text)) {
        throw SourceReadException(path);
    }
    return parse(text);
}

void SpecTable::addEntry(const std::string& function, const std::string& pin) {
    std::string pinText = trim(pin);
    entries_.push_back(SpecEntry{trim(function), coercePin(pinText), pinText});
}

} // namespace sketch_probe
