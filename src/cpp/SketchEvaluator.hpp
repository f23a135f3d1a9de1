/**
 * SketchEvaluator.hpp - End-to-end sketch analysis, verification and grading
 *
 * Composes the pipeline:
 *
 *   bytes -> SyntaxParser -> SyntaxTree                 inspect()
 *         -> resolveBindings / findCalls
 *         -> instrument (digitalWrite -> ESP_LOGI)      analyze()
 *         -> verify against a SpecTable                 verify()
 *         -> wrap, build and run through a harness,
 *            compare captured output                    evaluate()
 *
 * All analysis is pure; only instrumentFile() and evaluate() touch the
 * filesystem, and only evaluate() runs anything.
 *
 * Version: 1.0.0
 */

#pragma once

#include "BindingResolver.hpp"
#include "ExecutionHarness.hpp"
#include "InstrumentationRewriter.hpp"
#include "OutputComparator.hpp"
#include "PinUsageVerifier.hpp"
#include "ProbeConfig.hpp"
#include "SketchWrapper.hpp"
#include "SpecTable.hpp"
#include "SyntaxNodes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sketch_probe {

struct ProbeOptions {
    bool verbose = Config::DEFAULT_VERBOSE;       // Namespace notes in reports
    bool debug = Config::DEFAULT_DEBUG;           // Dump tree and bindings
    std::string digitalOutputFunction = Config::DIGITAL_OUTPUT_FUNCTION;
    DiagnosticFormat format;
    uint32_t harnessTimeoutMs = Config::DEFAULT_HARNESS_TIMEOUT_MS;
    MatchMode matchMode = MatchMode::SUBSTRING_PER_LINE;
    SketchWrapping wrapping = SketchWrapping::NONE;  // Applied before the harness sees the file
};

struct AnalysisReport {
    sketch_ast::SourceBuffer instrumented;
    size_t callCount = 0;
    size_t editCount = 0;
    BindingMap bindings;
    bool hasSyntaxErrors = false;
};

/**
 * Parsed sketch kept alongside its analysis, so a later verify() can reuse
 * the tree instead of parsing the bytes again
 */
struct SketchInspection {
    sketch_ast::SyntaxTree tree;
    AnalysisReport analysis;
};

struct EvaluationReport {
    AnalysisReport analysis;
    HarnessResult harness;
    ComparisonResult comparison;
    bool passed = false;
    std::string error;
};

class SketchEvaluator {
private:
    ProbeOptions options_;
    ExecutionHarness* harness_ = nullptr;  // not owned

    AnalysisReport analyzeTree(const sketch_ast::SyntaxTree& tree) const;

public:
    explicit SketchEvaluator(const ProbeOptions& options = ProbeOptions()) : options_(options) {}

    const ProbeOptions& getOptions() const { return options_; }

    /**
     * Set the harness used by evaluate() (or nullptr to disable execution)
     */
    void setHarness(ExecutionHarness* harness) { harness_ = harness; }
    ExecutionHarness* getHarness() const { return harness_; }

    /**
     * Parse `source` once and instrument every digital write in it
     * @throws SketchParseException if no syntax tree can be built
     */
    SketchInspection inspect(const sketch_ast::SourceBuffer& source) const;

    /**
     * Instrument every digital write in `source`
     * @throws SketchParseException if no syntax tree can be built
     */
    AnalysisReport analyze(const sketch_ast::SourceBuffer& source) const;

    /**
     * Classify every row of `table` against `source`
     * @throws SketchParseException if no syntax tree can be built
     */
    std::vector<VerificationResult> verify(const sketch_ast::SourceBuffer& source, const SpecTable& table) const;

    /**
     * Classify every row of `table` against an already inspected sketch
     */
    std::vector<VerificationResult> verify(const SketchInspection& inspection, const SpecTable& table) const;

    /**
     * Read `inputPath`, instrument it and write the result to `outputPath`
     * @throws SourceReadException, SketchParseException, SourceWriteException
     */
    AnalysisReport instrumentFile(const std::string& inputPath, const std::string& outputPath) const;

    /**
     * Instrument, wrap and write the sketch, run it through the harness and
     * grade the captured output. Harness failures are reported in the
     * result; file and parse problems throw as for instrumentFile().
     */
    EvaluationReport evaluate(const std::string& inputPath, const std::string& outputPath,
                              const std::string& expectedOutput,
                              double weight = Config::DEFAULT_TEST_WEIGHT);

    /**
     * Report lines for verification results, with namespace notes when verbose
     */
    std::vector<std::string> formatReport(const std::vector<VerificationResult>& results) const;
};

} // namespace sketch_probe
