/**
 * SketchProbe.h - Main Library Header
 *
 * Single include file for tools that analyse Arduino sketches with
 * SketchProbe: parsing, digital-write instrumentation, pin verification
 * and output grading.
 *
 * Usage:
 *   #include <SketchProbe.h>
 *
 *   SketchEvaluator evaluator;
 *   evaluator.instrumentFile("blink.ino", "blink_instrumented.ino");
 *
 * Version: 1.0.0
 * Platform: Linux/Desktop
 * License: MIT
 */

#pragma once

// Core components
#include "cpp/SyntaxNodes.hpp"
#include "cpp/SyntaxParser.hpp"
#include "cpp/CallSiteFinder.hpp"
#include "cpp/BindingResolver.hpp"
#include "cpp/InstrumentationRewriter.hpp"
#include "cpp/PinUsageVerifier.hpp"
#include "cpp/SketchEvaluator.hpp"
#include "cpp/PlatformAbstraction.hpp"

// Bring the common names into scope for convenience
using sketch_ast::SyntaxParser;
using sketch_ast::SourceBuffer;
using sketch_ast::SyntaxTree;
using sketch_probe::SketchEvaluator;
using sketch_probe::SketchInspection;
using sketch_probe::ProbeOptions;
using sketch_probe::SpecTable;
using sketch_probe::ExecutionHarness;

// Version information
#define SKETCH_PROBE_VERSION "1.0.0"
#define SKETCH_PROBE_VERSION_MAJOR 1
#define SKETCH_PROBE_VERSION_MINOR 0
#define SKETCH_PROBE_VERSION_PATCH 0

/**
 * Quick Start Guide:
 *
 * 1. Instrument a sketch:
 *    SketchEvaluator evaluator;
 *    AnalysisReport report = evaluator.instrumentFile("in.ino", "out.ino");
 *
 * 2. Verify expected pin usage:
 *    SpecTable table = SpecTable::fromFile("check.csv");
 *    SketchInspection inspection = evaluator.inspect(SourceBuffer::fromFile("in.ino"));
 *    auto results = evaluator.verify(inspection, table);
 *    for (const auto& line : evaluator.formatReport(results)) {
 *        std::cout << line << std::endl;
 *    }
 *
 * 3. Build, run and grade (needs an ExecutionHarness):
 *    ScriptHarness harness(ScriptHarnessConfig{"ino_to_running.sh", "arduino_to_esp",
 *                                              "output.txt", "build.log"});
 *    evaluator.setHarness(&harness);
 *    EvaluationReport result = evaluator.evaluate("in.ino", "submission.ino", "LED on");
 *
 * 4. See examples/ folder for sample sketches and tables
 */
