/**
 * ProbeErrors.hpp - Exception hierarchy for SketchProbe
 *
 * Only conditions outside the analysis core are fatal: unreadable or
 * unwritable files and a parser that cannot produce a tree. Everything the
 * core meets in a sketch, malformed syntax included, degrades to "unknown"
 * instead.
 */

#pragma once

#include <exception>
#include <string>

namespace sketch_probe {

class ProbeException : public std::exception {
private:
    std::string message_;

public:
    explicit ProbeException(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }
};

class SourceReadException : public ProbeException {
public:
    explicit SourceReadException(const std::string& path)
        : ProbeException("Cannot read file: " + path) {}
};

class SourceWriteException : public ProbeException {
public:
    explicit SourceWriteException(const std::string& path)
        : ProbeException("Cannot write file: " + path) {}
};

class SketchParseException : public ProbeException {
public:
    explicit SketchParseException(const std::string& detail)
        : ProbeException("Cannot parse sketch: " + detail) {}
};

class InvalidEditException : public ProbeException {
private:
    size_t startByte_;
    size_t endByte_;

public:
    InvalidEditException(const std::string& detail, size_t startByte, size_t endByte)
        : ProbeException("Edit [" + std::to_string(startByte) + ", " + std::to_string(endByte) +
                         ") " + detail),
          startByte_(startByte), endByte_(endByte) {}

    size_t getStartByte() const { return startByte_; }
    size_t getEndByte() const { return endByte_; }
};

} // namespace sketch_probe
