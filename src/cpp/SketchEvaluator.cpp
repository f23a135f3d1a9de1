/**
 * SketchEvaluator.cpp - Implementation of the end-to-end pipeline
 */

#include "SketchEvaluator.hpp"
#include "SyntaxParser.hpp"
#include "CallSiteFinder.hpp"
#include "PlatformAbstraction.hpp"
#include "ProbeErrors.hpp"

namespace sketch_probe {

using sketch_ast::SyntaxParser;
using sketch_ast::SourceBuffer;
using sketch_ast::SyntaxTree;

AnalysisReport SketchEvaluator::analyzeTree(const SyntaxTree& tree) const {
    AnalysisReport report;
    report.hasSyntaxErrors = tree.hasErrors();
    report.bindings = resolveBindings(tree);

    auto calls = findCalls(tree, options_.digitalOutputFunction);
    auto edits = planEdits(tree.getSource(), calls, report.bindings, options_.format);
    report.callCount = calls.size();
    report.editCount = edits.size();
    report.instrumented = applyEdits(tree.getSource(), std::move(edits));

    if (options_.debug) {
        DEBUG_STREAM << tree.toSExpression() << std::endl;
        for (const auto& binding : report.bindings) {
            DEBUG_STREAM << "  " << binding.first << " -> " << binding.second << std::endl;
        }
    }
    if (report.hasSyntaxErrors && options_.verbose) {
        ERROR_PRINTLN("Warning: sketch contains syntax the parser did not recognise; affected statements are skipped");
    }
    return report;
}

SketchInspection SketchEvaluator::inspect(const SourceBuffer& source) const {
    SyntaxParser parser;
    SyntaxTree tree = parser.parse(source);
    AnalysisReport analysis = analyzeTree(tree);
    return SketchInspection{std::move(tree), std::move(analysis)};
}

AnalysisReport SketchEvaluator::analyze(const SourceBuffer& source) const {
    return inspect(source).analysis;
}

std::vector<VerificationResult> SketchEvaluator::verify(const SourceBuffer& source, const SpecTable& table) const {
    SyntaxParser parser;
    SyntaxTree tree = parser.parse(source);
    BindingMap bindings = resolveBindings(tree);
    return sketch_probe::verify(tree, bindings, table);
}

std::vector<VerificationResult> SketchEvaluator::verify(const SketchInspection& inspection, const SpecTable& table) const {
    return sketch_probe::verify(inspection.tree, inspection.analysis.bindings, table);
}

AnalysisReport SketchEvaluator::instrumentFile(const std::string& inputPath, const std::string& outputPath) const {
    AnalysisReport report = analyze(SourceBuffer::fromFile(inputPath));
    report.instrumented.writeToFile(outputPath);

    DEBUG_STREAM << "instrumentFile: " << report.editCount << " edit(s) written to " << outputPath << std::endl;
    return report;
}

EvaluationReport SketchEvaluator::evaluate(const std::string& inputPath, const std::string& outputPath,
                                           const std::string& expectedOutput, double weight) {
    EvaluationReport report;
    report.analysis = analyze(SourceBuffer::fromFile(inputPath));

    SourceBuffer wrapped(wrapSketch(options_.wrapping, report.analysis.instrumented.bytes()));
    wrapped.writeToFile(outputPath);

    if (!harness_) {
        report.error = "No execution harness configured";
        return report;
    }

    std::chrono::milliseconds timeout(options_.harnessTimeoutMs);
    report.harness = harness_->run(outputPath, timeout);

    if (report.harness.timedOut) {
        report.error = "Timeout: Compilation/execution exceeded " +
                       std::to_string(options_.harnessTimeoutMs / 1000) + "s time limit.";
        ERROR_PRINTLN(harness_->getName() << ": " << report.error);
        return report;
    }

    if (report.harness.exitStatus != 0) {
        STRING_BUILD_START(message);
        STRING_BUILD_APPEND(message, "Script failed with exit code " << report.harness.exitStatus << ".\n");
        STRING_BUILD_APPEND(message, "STDERR:\n" << report.harness.stderrText << "\n");
        STRING_BUILD_APPEND(message, "STDOUT:\n" << report.harness.stdoutText);
        if (!report.harness.buildLog.empty()) {
            STRING_BUILD_APPEND(message, "\n\nBuild Log:\n" << report.harness.buildLog);
        }
        report.error = STRING_BUILD_FINISH(message);
        ERROR_PRINTLN(harness_->getName() << ": exit code " << report.harness.exitStatus);
        return report;
    }

    if (report.harness.outputText.empty()) {
        report.error = "No output generated";
        return report;
    }

    report.comparison = compareOutput(report.harness.outputText, expectedOutput, options_.matchMode, weight);
    report.passed = report.comparison.passed;
    report.error = report.comparison.error;

    if (options_.verbose) {
        for (const auto& line : report.comparison.missingLines) {
            ERROR_PRINTLN("Expected line not found in output: '" << line << "'");
        }
    }
    return report;
}

std::vector<std::string> SketchEvaluator::formatReport(const std::vector<VerificationResult>& results) const {
    std::vector<std::string> lines;
    for (const auto& result : results) {
        lines.push_back(formatResult(result));

        if (!options_.verbose) {
            continue;
        }
        for (const auto& pin : result.unconventionalPins) {
            lines.push_back("  note: pin " + pin + " is outside the usual namespace for " + result.entry.function);
        }
    }
    return lines;
}

} // namespace sketch_probe
