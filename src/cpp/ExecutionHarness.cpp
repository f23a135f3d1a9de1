/**
 * ExecutionHarness.cpp - Implementation of the script-driven harness
 */

#include "ExecutionHarness.hpp"
#include "PlatformAbstraction.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>

namespace sketch_probe {

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

static bool readWholeFile(const std::string& path, std::string& out) {
    PlatformFile file;
    if (!file.open(path.c_str(), "r")) {
        return false;
    }
    return file.readAll(out);
}

std::string ScriptHarness::resolve(const std::string& path) const {
    if (path.empty() || path[0] == '/' || config_.workingDirectory.empty()) {
        return path;
    }
    return config_.workingDirectory + "/" + path;
}

HarnessResult ScriptHarness::run(const std::string& sketchPath, std::chrono::milliseconds timeout) {
    HarnessResult result;

    std::string outputPath = resolve(config_.outputFile);
    if (!outputPath.empty()) {
        // Stale capture from a previous run must not be graded
        std::remove(outputPath.c_str());
    }

    char stderrTemplate[] = "/tmp/sketch_probe_stderr_XXXXXX";
    int stderrFd = mkstemp(stderrTemplate);
    if (stderrFd < 0) {
        result.stderrText = "Cannot create temporary file for stderr";
        ERROR_PRINTLN("ScriptHarness: " << result.stderrText);
        return result;
    }
    close(stderrFd);
    std::string stderrPath = stderrTemplate;

    // Whole seconds, rounded up; timeout(1) treats 0 as "no limit"
    long long seconds = (timeout.count() + 999) / 1000;
    if (seconds < 1) {
        seconds = 1;
    }

    // The script runs from the working directory, so pin the sketch path down first
    std::string sketchArgument = sketchPath;
    if (!sketchArgument.empty() && sketchArgument[0] != '/' && !config_.workingDirectory.empty()) {
        std::array<char, 4096> cwd;
        if (getcwd(cwd.data(), cwd.size())) {
            sketchArgument = std::string(cwd.data()) + "/" + sketchArgument;
        }
    }

    STRING_BUILD_START(command);
    if (!config_.workingDirectory.empty()) {
        STRING_BUILD_APPEND(command, "cd " << shellQuote(config_.workingDirectory) << " && ");
    }
    STRING_BUILD_APPEND(command, "timeout " << seconds << "s bash " << shellQuote(config_.scriptPath)
                                            << " " << shellQuote(sketchArgument)
                                            << " 2>" << shellQuote(stderrPath));
    std::string commandLine = STRING_BUILD_FINISH(command);

    DEBUG_STREAM << "ScriptHarness: " << commandLine << std::endl;

    auto started = std::chrono::steady_clock::now();
    FILE* pipe = popen(commandLine.c_str(), "r");
    if (!pipe) {
        std::remove(stderrPath.c_str());
        result.stderrText = "Cannot start harness script: " + config_.scriptPath;
        ERROR_PRINTLN("ScriptHarness: " << result.stderrText);
        return result;
    }

    std::array<char, 4096> buffer;
    size_t count;
    while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.stdoutText.append(buffer.data(), count);
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (status != -1 && WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    // timeout(1) exits 124 when it kills the script, but a script may also
    // exit 124 on its own; only a run that lasted the full limit counts
    result.timedOut = result.exitStatus == Config::TIMEOUT_EXIT_STATUS &&
                      elapsed >= std::chrono::seconds(seconds);

    if (!readWholeFile(stderrPath, result.stderrText)) {
        DEBUG_STREAM << "ScriptHarness: stderr capture unreadable" << std::endl;
    }
    std::remove(stderrPath.c_str());

    if (outputPath.empty()) {
        result.outputText = result.stdoutText;
    } else if (!readWholeFile(outputPath, result.outputText)) {
        DEBUG_STREAM << "ScriptHarness: no capture file at " << outputPath << std::endl;
    }

    std::string logPath = resolve(config_.buildLogFile);
    if (!result.usable() && !logPath.empty() && !readWholeFile(logPath, result.buildLog)) {
        DEBUG_STREAM << "ScriptHarness: no build log at " << logPath << std::endl;
    }

    DEBUG_STREAM << "ScriptHarness: exit " << result.exitStatus
                 << (result.timedOut ? " (timed out)" : "") << ", "
                 << result.outputText.size() << " output bytes" << std::endl;
    return result;
}

} // namespace sketch_probe
