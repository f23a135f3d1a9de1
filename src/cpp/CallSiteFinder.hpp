/**
 * CallSiteFinder.hpp - Locate call expressions and read their arguments
 *
 * A call matches when the raw source text of its callee equals the
 * requested name exactly. No overload, alias or namespace handling is
 * attempted: "ns::digitalWrite" and "digitalWrite" are different names.
 *
 * Usage:
 *   auto calls = findCalls(tree, "digitalWrite");
 *   for (const auto& call : calls) {
 *       ArgumentList args = extractArgs(tree.getSource(), call.node);
 *   }
 *
 * Version: 1.0.0
 */

#pragma once

#include "SyntaxNodes.hpp"
#include <string>
#include <vector>

namespace sketch_probe {

using sketch_ast::SourceBuffer;
using sketch_ast::SyntaxNode;
using sketch_ast::SyntaxTree;

/**
 * One matched call. The node handle is valid while the tree lives.
 */
struct CallSite {
    SyntaxNode node;
    std::string calleeName;
    size_t startByte;
    size_t endByte;
};

/**
 * Raw argument texts in source order, delimiters excluded, trimmed.
 * Index 0 is the pin and index 1 the value for pin primitives.
 */
using ArgumentList = std::vector<std::string>;

/**
 * Collect every call to `name` in document order
 */
std::vector<CallSite> findCalls(const SourceBuffer& source, const SyntaxNode& root,
                                const std::string& name);

inline std::vector<CallSite> findCalls(const SyntaxTree& tree, const std::string& name) {
    return findCalls(tree.getSource(), tree.getRoot(), name);
}

/**
 * Arguments of a call expression. A call without an argument list yields
 * an empty list; comments inside the parentheses are not arguments.
 */
ArgumentList extractArgs(const SourceBuffer& source, const SyntaxNode& call);

} // namespace sketch_probe
