#pragma once

#include <cstddef>
#include <cstdint>

namespace sketch_probe {

/**
 * Configuration constants for SketchProbe
 *
 * This file centralizes all configurable parameters to avoid hard-coded
 * values scattered throughout the codebase.
 */
namespace Config {

    // =============================================================================
    // INSTRUMENTATION
    // =============================================================================

    /** Arduino primitive whose call sites are replaced by diagnostics */
    constexpr const char* DIGITAL_OUTPUT_FUNCTION = "digitalWrite";

    /** Logging macro emitted in place of each digital write */
    constexpr const char* DIAGNOSTIC_MACRO = "ESP_LOGI";

    /** Tag argument passed to the logging macro (declared by the ESP-IDF prelude) */
    constexpr const char* DIAGNOSTIC_TAG = "TAG";

    /** Leading word of the diagnostic format string */
    constexpr const char* DIAGNOSTIC_LABEL = "PIN";

    /** Rendered for any argument position the call does not supply */
    constexpr const char* UNKNOWN_ARGUMENT = "unknown";

    // =============================================================================
    // EVALUATION
    // =============================================================================

    /** Build + emulation budget for one sketch (in milliseconds) */
    constexpr uint32_t DEFAULT_HARNESS_TIMEOUT_MS = 20000;

    /** Exit status reported by coreutils timeout(1) when the limit is hit */
    constexpr int TIMEOUT_EXIT_STATUS = 124;

    /** Mark weight of a test case when the caller supplies none */
    constexpr double DEFAULT_TEST_WEIGHT = 1.0;

    // =============================================================================
    // DEBUG AND LOGGING
    // =============================================================================

    /** Print namespace notes alongside the verification report */
    constexpr bool DEFAULT_VERBOSE = false;

    /** Dump the parsed tree and bindings while analysing */
    constexpr bool DEFAULT_DEBUG = false;

} // namespace Config
} // namespace sketch_probe
