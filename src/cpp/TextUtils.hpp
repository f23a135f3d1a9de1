/**
 * TextUtils.hpp - Small string helpers shared by the analysis passes
 */

#pragma once

#include <string>
#include <vector>

namespace sketch_probe {

/**
 * Strip leading and trailing ASCII whitespace
 */
std::string trim(const std::string& text);

/**
 * Split on '\n'; a trailing '\r' on each line is dropped
 */
std::vector<std::string> splitLines(const std::string& text);

std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator);

/**
 * Make arbitrary source text safe inside a C string literal that is also
 * used as a printf-style format: backslash, quote and '%' are escaped and
 * line breaks collapse to spaces.
 */
std::string escapeFormatText(const std::string& text);

} // namespace sketch_probe
