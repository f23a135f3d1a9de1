/**
 * CallSiteFinder.cpp - Implementation of call-site lookup and argument extraction
 */

#include "CallSiteFinder.hpp"
#include "PlatformAbstraction.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

using sketch_ast::SyntaxField;
using sketch_ast::SyntaxKind;

std::vector<CallSite> findCalls(const SourceBuffer& source, const SyntaxNode& root,
                                const std::string& name) {
    std::vector<CallSite> calls;

    sketch_ast::walkPreOrder(root, [&](const SyntaxNode& node) {
        if (node.getKind() != SyntaxKind::CALL_EXPRESSION) {
            return;
        }
        SyntaxNode callee = node.childByField(SyntaxField::FUNCTION);
        if (!callee) {
            return;
        }
        if (sketch_ast::nodeText(source, callee) != name) {
            return;
        }
        calls.push_back(CallSite{node, name, node.getStartByte(), node.getEndByte()});
    });

    DEBUG_STREAM << "findCalls(" << name << "): " << calls.size() << " match(es)" << std::endl;
    return calls;
}

ArgumentList extractArgs(const SourceBuffer& source, const SyntaxNode& call) {
    ArgumentList args;

    SyntaxNode arguments = call.childByField(SyntaxField::ARGUMENTS);
    if (!arguments) {
        return args;
    }

    for (const SyntaxNode& child : arguments.getChildren()) {
        switch (child.getKind()) {
            case SyntaxKind::LPAREN:
            case SyntaxKind::RPAREN:
            case SyntaxKind::COMMA:
            case SyntaxKind::COMMENT:
                continue;
            default:
                if (child.isMissing()) {
                    continue;
                }
                args.push_back(trim(sketch_ast::nodeText(source, child)));
                break;
        }
    }
    return args;
}

} // namespace sketch_probe
