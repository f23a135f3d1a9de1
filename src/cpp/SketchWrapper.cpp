/**
 * SketchWrapper.cpp - Implementation of build preludes
 */

#include "SketchWrapper.hpp"
#include "PlatformAbstraction.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

static const char* const ESP_IDF_PRELUDE =
    "//file: main.cpp\n"
    "#include \"Arduino.h\"\n"
    "#include \"esp_log.h\"\n"
    "static const char *TAG = \"APP\";\n"
    "\n";

static const char* const HOST_HEADER =
    "// ===== Auto-generated from Arduino .ino =====\n"
    "#include <stdio.h>\n"
    "\n"
    "#define INPUT 0\n"
    "#define OUTPUT 1\n"
    "#define INPUT_PULLUP 2\n"
    "#define HIGH 1\n"
    "#define LOW 0\n"
    "\n"
    "// Arduino API functions are provided by the test harness\n";

static const char* const HOST_FOOTER =
    "// Evaluator wrappers\n"
    "#ifdef __cplusplus\n"
    "extern \"C\" {\n"
    "#endif\n"
    "\n"
    "void run_setup() { setup(); }\n"
    "void run_loop()  { loop(); }\n"
    "\n"
    "#ifdef __cplusplus\n"
    "}\n"
    "#endif\n";

std::string wrapForEspIdf(const std::string& sketch) {
    return std::string(ESP_IDF_PRELUDE) + sketch;
}

std::string wrapForHost(const std::string& sketch) {
    STRING_BUILD_START(out);
    STRING_BUILD_APPEND(out, HOST_HEADER);

    std::vector<std::string> lines = splitLines(sketch);
    // splitLines yields one empty trailing element for newline-terminated text
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    for (const auto& line : lines) {
        if (trim(line) == "#include <Arduino.h>") {
            STRING_BUILD_APPEND(out, "// Arduino.h removed\n");
        } else {
            STRING_BUILD_APPEND(out, line << "\n");
        }
    }

    STRING_BUILD_APPEND(out, HOST_FOOTER);
    return STRING_BUILD_FINISH(out);
}

std::string wrapSketch(SketchWrapping wrapping, const std::string& sketch) {
    switch (wrapping) {
        case SketchWrapping::ESP_IDF: return wrapForEspIdf(sketch);
        case SketchWrapping::HOST: return wrapForHost(sketch);
        case SketchWrapping::NONE:
        default: return sketch;
    }
}

std::string sketchWrappingToString(SketchWrapping wrapping) {
    switch (wrapping) {
        case SketchWrapping::NONE: return "NONE";
        case SketchWrapping::ESP_IDF: return "ESP_IDF";
        case SketchWrapping::HOST: return "HOST";
        default: return "UNKNOWN";
    }
}

} // namespace sketch_probe
