/**
 * ExecutionHarness.hpp - Build and run an instrumented sketch
 *
 * The analysis pipeline does not know how a sketch is compiled or where it
 * runs (ESP-IDF + QEMU, a host build, a fake in tests). Callers plug in an
 * ExecutionHarness; SketchEvaluator only sees the HarnessResult.
 *
 * Usage:
 *   ScriptHarness harness(ScriptHarnessConfig{"ino_to_running.sh", "arduino_to_esp",
 *                                             "output.txt", "build.log"});
 *   evaluator.setHarness(&harness);
 *
 * Version: 1.0.0
 */

#pragma once

#include "ProbeConfig.hpp"
#include <chrono>
#include <string>

namespace sketch_probe {

struct HarnessResult {
    int exitStatus = -1;
    bool timedOut = false;
    std::string stdoutText;
    std::string stderrText;
    std::string outputText;   // what the sketch printed (emulator capture or stdout)
    std::string buildLog;

    bool usable() const { return !timedOut && exitStatus == 0; }
};

/**
 * Interface for anything that can build and execute one sketch file
 */
class ExecutionHarness {
public:
    virtual ~ExecutionHarness() = default;

    /**
     * Build and run the sketch at `sketchPath`, giving up after `timeout`.
     * Failures are reported in the result, never thrown.
     */
    virtual HarnessResult run(const std::string& sketchPath, std::chrono::milliseconds timeout) = 0;

    virtual std::string getName() const = 0;
};

struct ScriptHarnessConfig {
    std::string scriptPath;         // bash script taking the sketch path; relative paths resolve from workingDirectory
    std::string workingDirectory;   // script runs from here; relative files below resolve against it
    std::string outputFile;         // capture file written by the script, empty = use stdout
    std::string buildLogFile;       // optional build log, attached to failing results
};

/**
 * Runs a build-and-emulate shell script under coreutils timeout(1)
 */
class ScriptHarness : public ExecutionHarness {
private:
    ScriptHarnessConfig config_;

    std::string resolve(const std::string& path) const;

public:
    explicit ScriptHarness(ScriptHarnessConfig config) : config_(std::move(config)) {}

    HarnessResult run(const std::string& sketchPath, std::chrono::milliseconds timeout) override;
    std::string getName() const override { return "ScriptHarness"; }

    const ScriptHarnessConfig& getConfig() const { return config_; }
};

/**
 * Quote a string for a POSIX shell command line
 */
std::string shellQuote(const std::string& text);

} // namespace sketch_probe
