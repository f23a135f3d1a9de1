/**
 * PlatformAbstraction.hpp - Host platform layer for SketchProbe
 *
 * Provides the debug/error output macros and the file wrapper used by the
 * analysis pipeline. SketchProbe only runs on the development host (it
 * rewrites sketches before they are built for the target), so the embedded
 * and WebAssembly branches of the interpreter layer are not carried here.
 *
 * Version: 1.0.0
 */

#pragma once

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

// =============================================================================
// DEBUG OUTPUT ABSTRACTION
// =============================================================================

// Conditional debug output based on SKETCH_PROBE_DEBUG_OUTPUT flag
#ifndef SKETCH_PROBE_DEBUG_OUTPUT
    #define SKETCH_PROBE_DEBUG_OUTPUT 0  // Disabled so report output stays clean
#endif

#if SKETCH_PROBE_DEBUG_OUTPUT

    #define DEBUG_STREAM std::cerr

#else
    // Debug output completely disabled
    class NullStreamProxy {
    public:
        template<typename T>
        NullStreamProxy& operator<<(const T&) { return *this; }
        NullStreamProxy& operator<<(std::ostream& (*)(std::ostream&)) { return *this; }
    };
    #define DEBUG_STREAM (NullStreamProxy())
#endif

// Error output (always enabled)
#define ERROR_PRINTLN(x) std::cerr << x << std::endl

// Report output (always enabled, the CLI's stdout channel)
#define OUTPUT_STREAM std::cout

// =============================================================================
// STRING BUILDING ABSTRACTION
// =============================================================================

#define STRING_BUILD_START(name) std::ostringstream name
#define STRING_BUILD_APPEND(name, val) name << val
#define STRING_BUILD_FINISH(name) name.str()

using StringBuildStream = std::ostringstream;

// =============================================================================
// FILE I/O ABSTRACTION
// =============================================================================

/**
 * Binary file handle. Sketches are read and written byte-for-byte, so no
 * newline translation may happen on either side.
 */
class PlatformFile {
private:
    std::fstream file_;

public:
    bool open(const char* path, const char* mode = "w") {
        std::ios::openmode flags = std::ios::binary;
        if (mode[0] == 'r') {
            flags |= std::ios::in;
        } else {
            flags |= std::ios::out | std::ios::trunc;
        }
        file_.open(path, flags);
        return file_.is_open();
    }

    bool readAll(std::string& out) {
        if (!file_.is_open()) return false;
        std::ostringstream contents;
        contents << file_.rdbuf();
        if (file_.bad()) return false;
        out = contents.str();
        return true;
    }

    bool write(const std::string& data) {
        file_.write(data.data(), static_cast<std::streamsize>(data.size()));
        return static_cast<bool>(file_);
    }

    void close() {
        if (file_.is_open()) {
            file_.close();
        }
    }

    ~PlatformFile() {
        close();
    }
};
