/**
 * InstrumentationRewriter.hpp - Replace digital writes with diagnostic records
 *
 * Each matched call is replaced, span for span, by a logging macro call:
 *
 *   digitalWrite(LED, HIGH);   ->   ESP_LOGI(TAG, "PIN 13, HIGH");
 *
 * The statement terminator belongs to the surrounding expression statement
 * and is left where it was. Edits are computed against the original buffer
 * and applied to a copy from the highest offset down, so earlier offsets
 * never move.
 *
 * Version: 1.0.0
 */

#pragma once

#include "BindingResolver.hpp"
#include "CallSiteFinder.hpp"
#include "ProbeConfig.hpp"
#include <string>
#include <vector>

namespace sketch_probe {

/**
 * Replace bytes [startByte, endByte) of the original with `replacement`
 */
struct Edit {
    size_t startByte;
    size_t endByte;
    std::string replacement;
};

/**
 * Shape of the emitted diagnostic statement
 */
struct DiagnosticFormat {
    std::string macro = Config::DIAGNOSTIC_MACRO;
    std::string tag = Config::DIAGNOSTIC_TAG;
    std::string label = Config::DIAGNOSTIC_LABEL;
    std::string unknownToken = Config::UNKNOWN_ARGUMENT;
};

/**
 * Render one diagnostic, e.g. ESP_LOGI(TAG, "PIN 5, HIGH")
 */
std::string formatDiagnostic(const DiagnosticFormat& format, const std::string& pin, const std::string& value);

/**
 * One edit per call. Calls nested inside an earlier call's span (such as
 * digitalWrite(a, digitalWrite(b, HIGH))) are dropped because the outer
 * replacement already removes them.
 */
std::vector<Edit> planEdits(const SourceBuffer& source, const std::vector<CallSite>& calls,
                            const BindingMap& bindings, const DiagnosticFormat& format = DiagnosticFormat());

/**
 * Apply non-overlapping edits to a copy of `source`
 * @throws InvalidEditException if edits overlap or fall outside the buffer
 */
SourceBuffer applyEdits(const SourceBuffer& source, std::vector<Edit> edits);

/**
 * planEdits + applyEdits. The input buffer is never modified.
 */
SourceBuffer instrument(const SourceBuffer& source, const std::vector<CallSite>& calls,
                        const BindingMap& bindings, const DiagnosticFormat& format = DiagnosticFormat());

} // namespace sketch_probe
