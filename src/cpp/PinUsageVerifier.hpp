/**
 * PinUsageVerifier.hpp - Check a sketch against an expectation table
 *
 * For each table row the verifier collects the pins actually passed to the
 * row's function (first argument, resolved one hop through the binding
 * map, coerced to an integer where possible) and classifies the row:
 *
 *   FOUND              expected pin is among the observed pins
 *   PRESENT_DIFFERENT  function is called, but only with other pins
 *   MISSING            function is never called
 *
 * Version: 1.0.0
 */

#pragma once

#include "BindingResolver.hpp"
#include "SpecTable.hpp"
#include "SyntaxNodes.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace sketch_probe {

enum class VerificationStatus : uint8_t {
    FOUND = 0x01,
    PRESENT_DIFFERENT = 0x02,
    MISSING = 0x03
};

struct VerificationResult {
    SpecEntry entry;
    VerificationStatus status;
    std::set<std::string> observedPins;        // canonical string forms, sorted
    std::set<std::string> unconventionalPins;  // observed pins outside the function's namespace
    size_t callCount = 0;
};

/**
 * Classify one table entry
 */
VerificationResult verifyEntry(const sketch_ast::SourceBuffer& source, const sketch_ast::SyntaxNode& root,
                               const BindingMap& bindings, const SpecEntry& entry);

/**
 * Classify every entry, in table order
 */
std::vector<VerificationResult> verify(const sketch_ast::SourceBuffer& source, const sketch_ast::SyntaxNode& root,
                                       const BindingMap& bindings, const SpecTable& table);

inline std::vector<VerificationResult> verify(const sketch_ast::SyntaxTree& tree, const BindingMap& bindings,
                                              const SpecTable& table) {
    return verify(tree.getSource(), tree.getRoot(), bindings, table);
}

/**
 * Report line, e.g. "[FOUND] digitalWrite(13) is present in the code."
 */
std::string formatResult(const VerificationResult& result);

std::string verificationStatusToString(VerificationStatus status);

} // namespace sketch_probe
