/**
 * OutputComparator.cpp - Implementation of line-oriented output grading
 */

#include "OutputComparator.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

static const char* const EXPECTED_NOT_FOUND = "Expected output not found in actual output.";
static const char* const NO_OUTPUT = "No output generated";

std::vector<std::string> normalizeLines(const std::string& text) {
    std::vector<std::string> lines;
    for (const auto& line : splitLines(text)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(trimmed);
        }
    }
    return lines;
}

ComparisonResult compareOutput(const std::string& actual, const std::string& expected,
                               MatchMode mode, double weight) {
    ComparisonResult result;
    result.markFraction = weight;

    std::vector<std::string> actualLines = normalizeLines(actual);
    std::vector<std::string> expectedLines = normalizeLines(expected);

    if (expectedLines.empty()) {
        result.passed = !actualLines.empty();
        if (!result.passed) {
            result.error = NO_OUTPUT;
        }
        return result;
    }

    size_t cursor = 0;
    for (const auto& wanted : expectedLines) {
        bool matched = false;
        size_t from = mode == MatchMode::IN_ORDER ? cursor : 0;
        for (size_t i = from; i < actualLines.size(); ++i) {
            if (actualLines[i].find(wanted) != std::string::npos) {
                matched = true;
                cursor = i + 1;
                break;
            }
        }
        if (!matched) {
            result.missingLines.push_back(wanted);
        }
    }

    result.passed = result.missingLines.empty();
    if (!result.passed) {
        result.error = EXPECTED_NOT_FOUND;
    }
    return result;
}

std::string matchModeToString(MatchMode mode) {
    switch (mode) {
        case MatchMode::SUBSTRING_PER_LINE: return "SUBSTRING_PER_LINE";
        case MatchMode::IN_ORDER: return "IN_ORDER";
        default: return "UNKNOWN";
    }
}

} // namespace sketch_probe
