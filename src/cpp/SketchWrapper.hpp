/**
 * SketchWrapper.hpp - Prelude/epilogue generation for sketch builds
 *
 * An instrumented sketch still needs the declarations its diagnostics
 * refer to before it can be compiled:
 *
 *   ESP_IDF  Arduino-as-component build: pulls in Arduino.h and esp_log.h
 *            and declares the TAG used by every ESP_LOGI record
 *   HOST     plain C++ build for the host: replaces the Arduino header with
 *            the handful of pin constants sketches use and exports
 *            run_setup()/run_loop() for a test driver
 *
 * Version: 1.0.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace sketch_probe {

enum class SketchWrapping : uint8_t {
    NONE = 0x00,
    ESP_IDF = 0x01,
    HOST = 0x02
};

std::string wrapForEspIdf(const std::string& sketch);

std::string wrapForHost(const std::string& sketch);

/**
 * Dispatch on `wrapping`; NONE returns the sketch unchanged
 */
std::string wrapSketch(SketchWrapping wrapping, const std::string& sketch);

std::string sketchWrappingToString(SketchWrapping wrapping);

} // namespace sketch_probe
