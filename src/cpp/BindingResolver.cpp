/**
 * BindingResolver.cpp - Implementation of single-hop literal propagation
 */

#include "BindingResolver.hpp"
#include "PlatformAbstraction.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

using sketch_ast::SourceBuffer;
using sketch_ast::SyntaxField;
using sketch_ast::SyntaxKind;
using sketch_ast::SyntaxNode;

std::string declaredName(const SourceBuffer& source, SyntaxNode declarator) {
    while (declarator) {
        switch (declarator.getKind()) {
            case SyntaxKind::IDENTIFIER:
            case SyntaxKind::QUALIFIED_IDENTIFIER:
            case SyntaxKind::FIELD_IDENTIFIER:
                return sketch_ast::nodeText(source, declarator);

            case SyntaxKind::POINTER_DECLARATOR:
            case SyntaxKind::REFERENCE_DECLARATOR:
            case SyntaxKind::ARRAY_DECLARATOR:
            case SyntaxKind::PARENTHESIZED_DECLARATOR:
            case SyntaxKind::INIT_DECLARATOR:
                declarator = declarator.childByField(SyntaxField::DECLARATOR);
                break;

            default:
                return "";
        }
    }
    return "";
}

// Text of an initializer when it is one of the recognised simple forms
static bool simpleInitializerText(const SourceBuffer& source, const SyntaxNode& value, std::string& out) {
    switch (value.getKind()) {
        case SyntaxKind::NUMBER_LITERAL:
        case SyntaxKind::IDENTIFIER:
        case SyntaxKind::FIELD_IDENTIFIER:
        case SyntaxKind::FIELD_EXPRESSION:
            out = trim(sketch_ast::nodeText(source, value));
            return true;

        case SyntaxKind::ASSIGNMENT_EXPRESSION: {
            SyntaxNode right = value.childByField(SyntaxField::RIGHT);
            if (!right) {
                return false;
            }
            out = trim(sketch_ast::nodeText(source, right));
            return true;
        }

        default:
            return false;
    }
}

BindingMap resolveBindings(const SourceBuffer& source, const SyntaxNode& root) {
    BindingMap bindings;

    sketch_ast::walkPreOrder(root, [&](const SyntaxNode& node) {
        if (node.getKind() != SyntaxKind::DECLARATION) {
            return;
        }

        for (const SyntaxNode& declarator : node.childrenByField(SyntaxField::DECLARATOR)) {
            if (declarator.getKind() != SyntaxKind::INIT_DECLARATOR) {
                continue;
            }
            SyntaxNode value = declarator.childByField(SyntaxField::VALUE);
            if (!value) {
                continue;
            }

            std::string name = declaredName(source, declarator.childByField(SyntaxField::DECLARATOR));
            std::string text;
            if (name.empty() || !simpleInitializerText(source, value, text)) {
                continue;
            }

            DEBUG_STREAM << "binding " << name << " = " << text << std::endl;
            bindings[name] = text;
        }
    });

    return bindings;
}

std::string resolvePin(const BindingMap& bindings, const std::string& argument) {
    auto it = bindings.find(argument);
    return it != bindings.end() ? it->second : argument;
}

} // namespace sketch_probe
