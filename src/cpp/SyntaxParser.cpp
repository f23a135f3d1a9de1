/**
 * SyntaxParser.cpp - tree-sitter C++ parser wrapper implementation
 */

#include "SyntaxParser.hpp"
#include "PlatformAbstraction.hpp"
#include "ProbeErrors.hpp"
#include <limits>

namespace sketch_ast {

SyntaxParser::SyntaxParser() : parser_(ts_parser_new()) {
    if (!parser_) {
        throw sketch_probe::SketchParseException("cannot create tree-sitter parser");
    }
    if (!ts_parser_set_language(parser_.get(), tree_sitter_cpp())) {
        throw sketch_probe::SketchParseException("tree-sitter-cpp grammar version is not supported by the runtime");
    }
}

SyntaxTree SyntaxParser::parse(SourceBuffer source) {
    if (source.size() > std::numeric_limits<uint32_t>::max()) {
        throw sketch_probe::SketchParseException("sketch exceeds " +
            std::to_string(std::numeric_limits<uint32_t>::max()) + " bytes");
    }

    TSTree* tree = ts_parser_parse_string(parser_.get(), nullptr, source.bytes().data(),
                                          static_cast<uint32_t>(source.size()));
    if (!tree) {
        throw sketch_probe::SketchParseException("tree-sitter returned no tree");
    }

    SyntaxTree result(std::move(source), tree);
    if (result.hasErrors()) {
        DEBUG_STREAM << "SyntaxParser: tree contains ERROR or MISSING nodes" << std::endl;
    }
    return result;
}

SyntaxTree SyntaxParser::parseFile(const std::string& path) {
    return parse(SourceBuffer::fromFile(path));
}

} // namespace sketch_ast
