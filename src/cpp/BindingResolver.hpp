/**
 * BindingResolver.hpp - Single-hop literal propagation for sketch variables
 *
 * Records, for every declared variable with a simple initializer, the raw
 * text of that initializer:
 *
 *   int PIN = 5;          ->  PIN : "5"
 *   int LED = PIN;        ->  LED : "PIN"      (one hop only, never "5")
 *   int x = y = 7;        ->  x   : "7"        (right side of the assignment)
 *   int r = analogRead(0) ->  (not recorded)
 *
 * Scope is not modelled: a later declaration of the same name, anywhere in
 * the file, replaces the earlier one.
 *
 * Version: 1.0.0
 */

#pragma once

#include "SyntaxNodes.hpp"
#include <map>
#include <string>

namespace sketch_probe {

using BindingMap = std::map<std::string, std::string>;

/**
 * Walk the tree once in document order and collect bindings
 */
BindingMap resolveBindings(const sketch_ast::SourceBuffer& source, const sketch_ast::SyntaxNode& root);

inline BindingMap resolveBindings(const sketch_ast::SyntaxTree& tree) {
    return resolveBindings(tree.getSource(), tree.getRoot());
}

/**
 * Substitute an argument through the map once; unbound text is returned as is
 */
std::string resolvePin(const BindingMap& bindings, const std::string& argument);

/**
 * Name declared by a declarator subtree (pointer, array and reference
 * wrappers are looked through). Empty when none can be found.
 */
std::string declaredName(const sketch_ast::SourceBuffer& source, sketch_ast::SyntaxNode declarator);

} // namespace sketch_probe
