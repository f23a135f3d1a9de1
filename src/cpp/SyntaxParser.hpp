/**
 * SyntaxParser.hpp - tree-sitter C++ parser wrapper
 *
 * Owns one TSParser configured with the tree-sitter-cpp grammar and turns
 * sketch bytes into a SyntaxTree. tree-sitter recovers from any input by
 * inserting ERROR and MISSING nodes, so a sketch that does not compile
 * still produces a tree; SyntaxTree::hasErrors() reports when that
 * happened.
 *
 * Usage:
 *   SyntaxParser parser;
 *   SyntaxTree tree = parser.parseFile("blink.ino");
 *
 * Version: 1.0.0
 */

#pragma once

#include "SyntaxNodes.hpp"
#include <tree_sitter/api.h>
#include <memory>
#include <string>

// Grammar entry point exported by the tree-sitter-cpp library
extern "C" const TSLanguage* tree_sitter_cpp(void);

namespace sketch_ast {

class SyntaxParser {
public:
    /**
     * @throws sketch_probe::SketchParseException if the grammar is
     *         incompatible with the linked tree-sitter runtime
     */
    SyntaxParser();

    // Non-copyable, movable
    SyntaxParser(const SyntaxParser&) = delete;
    SyntaxParser& operator=(const SyntaxParser&) = delete;
    SyntaxParser(SyntaxParser&&) = default;
    SyntaxParser& operator=(SyntaxParser&&) = default;

    /**
     * Parse a complete sketch. The returned tree owns the buffer.
     * @throws sketch_probe::SketchParseException if no tree could be built
     */
    SyntaxTree parse(SourceBuffer source);

    /**
     * Read and parse a sketch file
     * @throws sketch_probe::SourceReadException if the file cannot be read
     */
    SyntaxTree parseFile(const std::string& path);

private:
    struct ParserDeleter {
        void operator()(TSParser* parser) const { ts_parser_delete(parser); }
    };

    std::unique_ptr<TSParser, ParserDeleter> parser_;
};

} // namespace sketch_ast
