/**
 * sketch_probe_main.cpp - Command line front end
 *
 * Usage:
 *   sketch_probe <input.ino> <output.ino> <check.csv> [--verbose] [--debug]
 *
 * Writes the instrumented sketch to <output.ino>, then prints one report
 * line per row of <check.csv>.
 *
 * Exit codes:
 *   0  success (regardless of FOUND/MISSING classifications)
 *   1  usage error
 *   2  input/output or parse failure
 */

#include "SketchProbe.h"
#include <string>
#include <vector>

using namespace sketch_probe;

static void printUsage(const char* program) {
    ERROR_PRINTLN("Usage: " << program << " <input.ino> <output.ino> <check.csv> [--verbose] [--debug]");
}

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    ProbeOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            ERROR_PRINTLN("Unknown option: " << arg);
            printUsage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string& inputPath = positional[0];
    const std::string& outputPath = positional[1];
    const std::string& tablePath = positional[2];

    SketchEvaluator evaluator(options);

    try {
        SourceBuffer source = SourceBuffer::fromFile(inputPath);

        SketchInspection inspection = evaluator.inspect(source);
        const AnalysisReport& analysis = inspection.analysis;
        analysis.instrumented.writeToFile(outputPath);
        OUTPUT_STREAM << "[OK] Written instrumented file: " << outputPath << std::endl;

        if (options.verbose) {
            OUTPUT_STREAM << "Instrumented " << analysis.editCount << " of " << analysis.callCount << " "
                          << options.digitalOutputFunction << " call(s)" << std::endl;
        }

        SpecTable table = SpecTable::fromFile(tablePath);
        if (table.getSkippedRows() > 0 && options.verbose) {
            ERROR_PRINTLN("Skipped " << table.getSkippedRows() << " malformed row(s) in " << tablePath);
        }

        for (const auto& line : evaluator.formatReport(evaluator.verify(inspection, table))) {
            OUTPUT_STREAM << line << std::endl;
        }
    } catch (const ProbeException& e) {
        ERROR_PRINTLN("Error: " << e.what());
        return 2;
    }

    return 0;
}
