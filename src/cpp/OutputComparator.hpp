/**
 * OutputComparator.hpp - Grade captured sketch output against expected text
 *
 * Both sides are normalised to their non-blank, trimmed lines before
 * matching. An expected line matches when it appears as a substring of
 * some actual line.
 *
 * Version: 1.0.0
 */

#pragma once

#include "ProbeConfig.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sketch_probe {

enum class MatchMode : uint8_t {
    SUBSTRING_PER_LINE = 0x01,  // each expected line inside any actual line
    IN_ORDER = 0x02             // as above, but as an ordered subsequence
};

struct ComparisonResult {
    bool passed = false;
    double markFraction = 0.0;
    std::vector<std::string> missingLines;
    std::string error;
};

/**
 * Trimmed lines with blank lines removed
 */
std::vector<std::string> normalizeLines(const std::string& text);

/**
 * Compare captured output with the expected output. Empty expected output
 * passes whenever anything at all was printed.
 */
ComparisonResult compareOutput(const std::string& actual, const std::string& expected,
                               MatchMode mode = MatchMode::SUBSTRING_PER_LINE,
                               double weight = Config::DEFAULT_TEST_WEIGHT);

std::string matchModeToString(MatchMode mode);

} // namespace sketch_probe
