/**
 * SyntaxNodes.cpp - Syntax tree adapter implementation
 *
 * Version: 1.0.0
 */

#include "SyntaxNodes.hpp"
#include "PlatformAbstraction.hpp"
#include "ProbeErrors.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <unordered_map>

namespace sketch_ast {

// =============================================================================
// SOURCE BUFFER IMPLEMENTATION
// =============================================================================

SourceBuffer SourceBuffer::fromFile(const std::string& path) {
    PlatformFile file;
    if (!file.open(path.c_str(), "r")) {
        throw sketch_probe::SourceReadException(path);
    }

    std::string bytes;
    if (!file.readAll(bytes)) {
        throw sketch_probe::SourceReadException(path);
    }

    DEBUG_STREAM << "SourceBuffer: read " << bytes.size() << " bytes from " << path << std::endl;
    return SourceBuffer(std::move(bytes));
}

void SourceBuffer::writeToFile(const std::string& path) const {
    PlatformFile file;
    if (!file.open(path.c_str(), "w")) {
        throw sketch_probe::SourceWriteException(path);
    }
    if (!file.write(bytes_)) {
        throw sketch_probe::SourceWriteException(path);
    }
    file.close();
}

std::string SourceBuffer::slice(size_t start, size_t end) const {
    start = std::min(start, bytes_.size());
    end = std::min(end, bytes_.size());
    if (end <= start) {
        return std::string();
    }
    return bytes_.substr(start, end - start);
}

// =============================================================================
// TREE CURSOR
// =============================================================================

namespace {

// Owns a TSTreeCursor for the duration of one traversal
class CursorGuard {
public:
    explicit CursorGuard(TSNode node) : cursor_(ts_tree_cursor_new(node)) {}
    ~CursorGuard() { ts_tree_cursor_delete(&cursor_); }

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

    TSTreeCursor* get() { return &cursor_; }

private:
    TSTreeCursor cursor_;
};

} // namespace

// =============================================================================
// SYNTAX NODE IMPLEMENTATION
// =============================================================================

SyntaxNode::SyntaxNode() : node_() {}

SyntaxKind SyntaxNode::getKind() const {
    if (isNull()) {
        return SyntaxKind::UNKNOWN;
    }
    return syntaxKindFromType(ts_node_type(node_), ts_node_is_named(node_));
}

std::string SyntaxNode::getType() const {
    return isNull() ? std::string() : std::string(ts_node_type(node_));
}

bool SyntaxNode::isNamed() const {
    return !isNull() && ts_node_is_named(node_);
}

bool SyntaxNode::isMissing() const {
    return !isNull() && ts_node_is_missing(node_);
}

size_t SyntaxNode::getStartByte() const {
    return isNull() ? 0 : ts_node_start_byte(node_);
}

size_t SyntaxNode::getEndByte() const {
    return isNull() ? 0 : ts_node_end_byte(node_);
}

size_t SyntaxNode::childCount() const {
    return isNull() ? 0 : ts_node_child_count(node_);
}

SyntaxNode SyntaxNode::childAt(size_t index) const {
    if (index >= childCount()) {
        return SyntaxNode();
    }
    return SyntaxNode(ts_node_child(node_, static_cast<uint32_t>(index)));
}

std::vector<SyntaxNode> SyntaxNode::getChildren() const {
    std::vector<SyntaxNode> children;
    size_t count = childCount();
    children.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        children.push_back(SyntaxNode(ts_node_child(node_, static_cast<uint32_t>(i))));
    }
    return children;
}

SyntaxNode SyntaxNode::childByField(SyntaxField field) const {
    if (isNull() || field == SyntaxField::NONE) {
        return SyntaxNode();
    }
    std::string name = syntaxFieldToString(field);
    return SyntaxNode(ts_node_child_by_field_name(node_, name.c_str(), static_cast<uint32_t>(name.size())));
}

std::vector<SyntaxNode> SyntaxNode::childrenByField(SyntaxField field) const {
    std::vector<SyntaxNode> result;
    if (isNull() || field == SyntaxField::NONE) {
        return result;
    }

    std::string name = syntaxFieldToString(field);
    CursorGuard cursor(node_);
    if (!ts_tree_cursor_goto_first_child(cursor.get())) {
        return result;
    }
    do {
        const char* current = ts_tree_cursor_current_field_name(cursor.get());
        if (current && name == current) {
            result.push_back(SyntaxNode(ts_tree_cursor_current_node(cursor.get())));
        }
    } while (ts_tree_cursor_goto_next_sibling(cursor.get()));
    return result;
}

bool SyntaxNode::operator==(const SyntaxNode& other) const {
    if (isNull() || other.isNull()) {
        return isNull() == other.isNull();
    }
    return ts_node_eq(node_, other.node_);
}

std::string SyntaxNode::toString() const {
    if (isNull()) {
        return "null";
    }

    StringBuildStream oss;
    oss << getType() << " [" << getStartByte() << ", " << getEndByte() << ")";

    size_t count = childCount();
    if (count > 0) {
        oss << " [" << count << " children]";
    }

    return oss.str();
}

// =============================================================================
// SYNTAX TREE IMPLEMENTATION
// =============================================================================

SyntaxTree::SyntaxTree(SourceBuffer source, TSTree* tree)
    : source_(std::move(source)), tree_(tree) {
    if (!tree_) {
        throw sketch_probe::SketchParseException("no syntax tree was produced");
    }
}

SyntaxNode SyntaxTree::getRoot() const {
    return SyntaxNode(ts_tree_root_node(tree_.get()));
}

size_t SyntaxTree::nodeCount() const {
    size_t count = 0;
    walkPreOrder(getRoot(), [&count](const SyntaxNode&) { ++count; });
    return count;
}

bool SyntaxTree::hasErrors() const {
    return ts_node_has_error(ts_tree_root_node(tree_.get()));
}

std::string SyntaxTree::toSExpression() const {
    char* rendered = ts_node_string(ts_tree_root_node(tree_.get()));
    if (!rendered) {
        return std::string();
    }
    std::string out(rendered);
    std::free(rendered);
    return out;
}

// =============================================================================
// UTILITY FUNCTIONS
// =============================================================================

void walkPreOrder(const SyntaxNode& root, const std::function<void(const SyntaxNode&)>& visit) {
    if (root.isNull()) {
        return;
    }

    CursorGuard cursor(root.raw());
    for (;;) {
        visit(SyntaxNode(ts_tree_cursor_current_node(cursor.get())));

        if (ts_tree_cursor_goto_first_child(cursor.get())) {
            continue;
        }
        // Climb until a next sibling exists; the cursor cannot leave `root`
        while (!ts_tree_cursor_goto_next_sibling(cursor.get())) {
            if (!ts_tree_cursor_goto_parent(cursor.get())) {
                return;
            }
        }
    }
}

bool isAnonymousKind(SyntaxKind kind) {
    switch (kind) {
        case SyntaxKind::LPAREN:
        case SyntaxKind::RPAREN:
        case SyntaxKind::COMMA:
        case SyntaxKind::TOKEN:
            return true;
        default:
            return false;
    }
}

SyntaxKind syntaxKindFromType(const char* type, bool named) {
    if (!type) {
        return SyntaxKind::UNKNOWN;
    }

    if (!named) {
        if (std::strcmp(type, "(") == 0) return SyntaxKind::LPAREN;
        if (std::strcmp(type, ")") == 0) return SyntaxKind::RPAREN;
        if (std::strcmp(type, ",") == 0) return SyntaxKind::COMMA;
        return SyntaxKind::TOKEN;
    }

    static const std::unordered_map<std::string, SyntaxKind> kinds = {
        {"translation_unit", SyntaxKind::TRANSLATION_UNIT},
        {"ERROR", SyntaxKind::ERROR_NODE},
        {"comment", SyntaxKind::COMMENT},
        {"preproc_include", SyntaxKind::PREPROC_INCLUDE},
        {"preproc_def", SyntaxKind::PREPROC_DEF},
        {"preproc_function_def", SyntaxKind::PREPROC_FUNCTION_DEF},
        {"preproc_call", SyntaxKind::PREPROC_CALL},
        {"preproc_if", SyntaxKind::PREPROC_CONDITIONAL},
        {"preproc_ifdef", SyntaxKind::PREPROC_CONDITIONAL},
        {"preproc_else", SyntaxKind::PREPROC_CONDITIONAL},
        {"preproc_elif", SyntaxKind::PREPROC_CONDITIONAL},
        {"compound_statement", SyntaxKind::COMPOUND_STMT},
        {"expression_statement", SyntaxKind::EXPRESSION_STMT},
        {"if_statement", SyntaxKind::IF_STMT},
        {"while_statement", SyntaxKind::WHILE_STMT},
        {"do_statement", SyntaxKind::DO_WHILE_STMT},
        {"for_statement", SyntaxKind::FOR_STMT},
        {"for_range_loop", SyntaxKind::RANGE_FOR_STMT},
        {"switch_statement", SyntaxKind::SWITCH_STMT},
        {"case_statement", SyntaxKind::CASE_STMT},
        {"return_statement", SyntaxKind::RETURN_STMT},
        {"break_statement", SyntaxKind::BREAK_STMT},
        {"continue_statement", SyntaxKind::CONTINUE_STMT},
        {"goto_statement", SyntaxKind::GOTO_STMT},
        {"labeled_statement", SyntaxKind::LABELED_STMT},
        {"declaration", SyntaxKind::DECLARATION},
        {"function_definition", SyntaxKind::FUNCTION_DEFINITION},
        {"init_declarator", SyntaxKind::INIT_DECLARATOR},
        {"function_declarator", SyntaxKind::FUNCTION_DECLARATOR},
        {"array_declarator", SyntaxKind::ARRAY_DECLARATOR},
        {"pointer_declarator", SyntaxKind::POINTER_DECLARATOR},
        {"reference_declarator", SyntaxKind::REFERENCE_DECLARATOR},
        {"parenthesized_declarator", SyntaxKind::PARENTHESIZED_DECLARATOR},
        {"parameter_list", SyntaxKind::PARAMETER_LIST},
        {"parameter_declaration", SyntaxKind::PARAMETER_DECLARATION},
        {"field_declaration", SyntaxKind::FIELD_DECLARATION},
        {"field_declaration_list", SyntaxKind::FIELD_DECLARATION_LIST},
        {"type_definition", SyntaxKind::TYPE_DEFINITION},
        {"namespace_definition", SyntaxKind::NAMESPACE_DEFINITION},
        {"template_declaration", SyntaxKind::TEMPLATE_DECLARATION},
        {"linkage_specification", SyntaxKind::LINKAGE_SPECIFICATION},
        {"primitive_type", SyntaxKind::PRIMITIVE_TYPE},
        {"type_identifier", SyntaxKind::TYPE_IDENTIFIER},
        {"sized_type_specifier", SyntaxKind::SIZED_TYPE_SPECIFIER},
        {"type_qualifier", SyntaxKind::TYPE_QUALIFIER},
        {"storage_class_specifier", SyntaxKind::STORAGE_CLASS_SPECIFIER},
        {"class_specifier", SyntaxKind::CLASS_SPECIFIER},
        {"struct_specifier", SyntaxKind::STRUCT_SPECIFIER},
        {"enum_specifier", SyntaxKind::ENUM_SPECIFIER},
        {"call_expression", SyntaxKind::CALL_EXPRESSION},
        {"argument_list", SyntaxKind::ARGUMENT_LIST},
        {"assignment_expression", SyntaxKind::ASSIGNMENT_EXPRESSION},
        {"binary_expression", SyntaxKind::BINARY_EXPRESSION},
        {"unary_expression", SyntaxKind::UNARY_EXPRESSION},
        {"update_expression", SyntaxKind::UPDATE_EXPRESSION},
        {"conditional_expression", SyntaxKind::CONDITIONAL_EXPRESSION},
        {"cast_expression", SyntaxKind::CAST_EXPRESSION},
        {"subscript_expression", SyntaxKind::SUBSCRIPT_EXPRESSION},
        {"field_expression", SyntaxKind::FIELD_EXPRESSION},
        {"parenthesized_expression", SyntaxKind::PARENTHESIZED_EXPRESSION},
        {"initializer_list", SyntaxKind::INITIALIZER_LIST},
        {"qualified_identifier", SyntaxKind::QUALIFIED_IDENTIFIER},
        {"number_literal", SyntaxKind::NUMBER_LITERAL},
        {"string_literal", SyntaxKind::STRING_LITERAL},
        {"raw_string_literal", SyntaxKind::STRING_LITERAL},
        {"char_literal", SyntaxKind::CHAR_LITERAL},
        {"true", SyntaxKind::TRUE_LITERAL},
        {"false", SyntaxKind::FALSE_LITERAL},
        {"null", SyntaxKind::NULL_LITERAL},
        {"nullptr", SyntaxKind::NULL_LITERAL},
        {"identifier", SyntaxKind::IDENTIFIER},
        {"field_identifier", SyntaxKind::FIELD_IDENTIFIER},
    };

    auto it = kinds.find(type);
    return it != kinds.end() ? it->second : SyntaxKind::OTHER;
}

std::string syntaxKindToString(SyntaxKind kind) {
    switch (kind) {
        case SyntaxKind::TRANSLATION_UNIT: return "translation_unit";
        case SyntaxKind::ERROR_NODE: return "ERROR";
        case SyntaxKind::COMMENT: return "comment";
        case SyntaxKind::PREPROC_INCLUDE: return "preproc_include";
        case SyntaxKind::PREPROC_DEF: return "preproc_def";
        case SyntaxKind::PREPROC_FUNCTION_DEF: return "preproc_function_def";
        case SyntaxKind::PREPROC_CALL: return "preproc_call";
        case SyntaxKind::PREPROC_CONDITIONAL: return "preproc_conditional";
        case SyntaxKind::COMPOUND_STMT: return "compound_statement";
        case SyntaxKind::EXPRESSION_STMT: return "expression_statement";
        case SyntaxKind::IF_STMT: return "if_statement";
        case SyntaxKind::WHILE_STMT: return "while_statement";
        case SyntaxKind::DO_WHILE_STMT: return "do_statement";
        case SyntaxKind::FOR_STMT: return "for_statement";
        case SyntaxKind::RANGE_FOR_STMT: return "for_range_loop";
        case SyntaxKind::SWITCH_STMT: return "switch_statement";
        case SyntaxKind::CASE_STMT: return "case_statement";
        case SyntaxKind::RETURN_STMT: return "return_statement";
        case SyntaxKind::BREAK_STMT: return "break_statement";
        case SyntaxKind::CONTINUE_STMT: return "continue_statement";
        case SyntaxKind::GOTO_STMT: return "goto_statement";
        case SyntaxKind::LABELED_STMT: return "labeled_statement";
        case SyntaxKind::DECLARATION: return "declaration";
        case SyntaxKind::FUNCTION_DEFINITION: return "function_definition";
        case SyntaxKind::INIT_DECLARATOR: return "init_declarator";
        case SyntaxKind::FUNCTION_DECLARATOR: return "function_declarator";
        case SyntaxKind::ARRAY_DECLARATOR: return "array_declarator";
        case SyntaxKind::POINTER_DECLARATOR: return "pointer_declarator";
        case SyntaxKind::REFERENCE_DECLARATOR: return "reference_declarator";
        case SyntaxKind::PARENTHESIZED_DECLARATOR: return "parenthesized_declarator";
        case SyntaxKind::PARAMETER_LIST: return "parameter_list";
        case SyntaxKind::PARAMETER_DECLARATION: return "parameter_declaration";
        case SyntaxKind::FIELD_DECLARATION: return "field_declaration";
        case SyntaxKind::FIELD_DECLARATION_LIST: return "field_declaration_list";
        case SyntaxKind::TYPE_DEFINITION: return "type_definition";
        case SyntaxKind::NAMESPACE_DEFINITION: return "namespace_definition";
        case SyntaxKind::TEMPLATE_DECLARATION: return "template_declaration";
        case SyntaxKind::LINKAGE_SPECIFICATION: return "linkage_specification";
        case SyntaxKind::PRIMITIVE_TYPE: return "primitive_type";
        case SyntaxKind::TYPE_IDENTIFIER: return "type_identifier";
        case SyntaxKind::SIZED_TYPE_SPECIFIER: return "sized_type_specifier";
        case SyntaxKind::TYPE_QUALIFIER: return "type_qualifier";
        case SyntaxKind::STORAGE_CLASS_SPECIFIER: return "storage_class_specifier";
        case SyntaxKind::CLASS_SPECIFIER: return "class_specifier";
        case SyntaxKind::STRUCT_SPECIFIER: return "struct_specifier";
        case SyntaxKind::ENUM_SPECIFIER: return "enum_specifier";
        case SyntaxKind::CALL_EXPRESSION: return "call_expression";
        case SyntaxKind::ARGUMENT_LIST: return "argument_list";
        case SyntaxKind::ASSIGNMENT_EXPRESSION: return "assignment_expression";
        case SyntaxKind::BINARY_EXPRESSION: return "binary_expression";
        case SyntaxKind::UNARY_EXPRESSION: return "unary_expression";
        case SyntaxKind::UPDATE_EXPRESSION: return "update_expression";
        case SyntaxKind::CONDITIONAL_EXPRESSION: return "conditional_expression";
        case SyntaxKind::CAST_EXPRESSION: return "cast_expression";
        case SyntaxKind::SUBSCRIPT_EXPRESSION: return "subscript_expression";
        case SyntaxKind::FIELD_EXPRESSION: return "field_expression";
        case SyntaxKind::PARENTHESIZED_EXPRESSION: return "parenthesized_expression";
        case SyntaxKind::INITIALIZER_LIST: return "initializer_list";
        case SyntaxKind::QUALIFIED_IDENTIFIER: return "qualified_identifier";
        case SyntaxKind::NUMBER_LITERAL: return "number_literal";
        case SyntaxKind::STRING_LITERAL: return "string_literal";
        case SyntaxKind::CHAR_LITERAL: return "char_literal";
        case SyntaxKind::TRUE_LITERAL: return "true";
        case SyntaxKind::FALSE_LITERAL: return "false";
        case SyntaxKind::NULL_LITERAL: return "null";
        case SyntaxKind::IDENTIFIER: return "identifier";
        case SyntaxKind::FIELD_IDENTIFIER: return "field_identifier";
        case SyntaxKind::LPAREN: return "(";
        case SyntaxKind::RPAREN: return ")";
        case SyntaxKind::COMMA: return ",";
        case SyntaxKind::TOKEN: return "token";
        case SyntaxKind::OTHER: return "other";
        case SyntaxKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string syntaxFieldToString(SyntaxField field) {
    switch (field) {
        case SyntaxField::NONE: return "";
        case SyntaxField::FUNCTION: return "function";
        case SyntaxField::ARGUMENTS: return "arguments";
        case SyntaxField::TYPE: return "type";
        case SyntaxField::DECLARATOR: return "declarator";
        case SyntaxField::VALUE: return "value";
        case SyntaxField::LEFT: return "left";
        case SyntaxField::RIGHT: return "right";
        case SyntaxField::OPERATOR: return "operator";
        case SyntaxField::ARGUMENT: return "argument";
        case SyntaxField::FIELD: return "field";
        case SyntaxField::INDEX: return "index";
        case SyntaxField::BODY: return "body";
        case SyntaxField::CONDITION: return "condition";
        case SyntaxField::CONSEQUENCE: return "consequence";
        case SyntaxField::ALTERNATIVE: return "alternative";
        case SyntaxField::INITIALIZER: return "initializer";
        case SyntaxField::UPDATE: return "update";
        case SyntaxField::NAME: return "name";
        case SyntaxField::PARAMETERS: return "parameters";
        case SyntaxField::SCOPE: return "scope";
        case SyntaxField::SIZE: return "size";
        case SyntaxField::LABEL: return "label";
    }
    return "";
}

} // namespace sketch_ast
