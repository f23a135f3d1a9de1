/**
 * SyntaxNodes.hpp - Syntax tree adapter over tree-sitter
 *
 * Sketches are parsed by tree-sitter with the C++ grammar. This layer
 * presents the resulting concrete syntax tree with the vocabulary the
 * analysis passes use: a closed SyntaxKind enumeration, named fields, and
 * half-open byte spans into the SourceBuffer the tree was parsed from.
 *
 * SyntaxNode is a small value handle around a TSNode. It is only valid
 * while the SyntaxTree it came from is alive.
 *
 * Version: 1.0.0
 */

#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sketch_ast {

// =============================================================================
// ENUMS AND TYPES
// =============================================================================

/**
 * Syntax node kinds. Named grammar nodes the analysis never looks at map to
 * OTHER; anonymous tokens other than the argument-list delimiters map to
 * TOKEN.
 */
enum class SyntaxKind : uint8_t {
    // Program structure
    TRANSLATION_UNIT = 0x01,
    ERROR_NODE = 0x02,
    COMMENT = 0x03,

    // Preprocessor
    PREPROC_INCLUDE = 0x08,
    PREPROC_DEF = 0x09,
    PREPROC_FUNCTION_DEF = 0x0A,
    PREPROC_CALL = 0x0B,
    PREPROC_CONDITIONAL = 0x0C,

    // Statements
    COMPOUND_STMT = 0x10,
    EXPRESSION_STMT = 0x11,
    IF_STMT = 0x12,
    WHILE_STMT = 0x13,
    DO_WHILE_STMT = 0x14,
    FOR_STMT = 0x15,
    RANGE_FOR_STMT = 0x16,
    SWITCH_STMT = 0x17,
    CASE_STMT = 0x18,
    RETURN_STMT = 0x19,
    BREAK_STMT = 0x1A,
    CONTINUE_STMT = 0x1B,
    GOTO_STMT = 0x1C,
    LABELED_STMT = 0x1D,

    // Declarations
    DECLARATION = 0x20,
    FUNCTION_DEFINITION = 0x21,
    INIT_DECLARATOR = 0x22,
    FUNCTION_DECLARATOR = 0x23,
    ARRAY_DECLARATOR = 0x24,
    POINTER_DECLARATOR = 0x25,
    REFERENCE_DECLARATOR = 0x26,
    PARENTHESIZED_DECLARATOR = 0x27,
    PARAMETER_LIST = 0x28,
    PARAMETER_DECLARATION = 0x29,
    FIELD_DECLARATION = 0x2A,
    FIELD_DECLARATION_LIST = 0x2B,
    TYPE_DEFINITION = 0x2C,
    NAMESPACE_DEFINITION = 0x2D,
    TEMPLATE_DECLARATION = 0x2E,
    LINKAGE_SPECIFICATION = 0x2F,

    // Types
    PRIMITIVE_TYPE = 0x40,
    TYPE_IDENTIFIER = 0x41,
    SIZED_TYPE_SPECIFIER = 0x42,
    TYPE_QUALIFIER = 0x43,
    STORAGE_CLASS_SPECIFIER = 0x44,
    CLASS_SPECIFIER = 0x45,
    STRUCT_SPECIFIER = 0x46,
    ENUM_SPECIFIER = 0x47,

    // Expressions
    CALL_EXPRESSION = 0x50,
    ARGUMENT_LIST = 0x51,
    ASSIGNMENT_EXPRESSION = 0x52,
    BINARY_EXPRESSION = 0x53,
    UNARY_EXPRESSION = 0x54,
    UPDATE_EXPRESSION = 0x55,
    CONDITIONAL_EXPRESSION = 0x56,
    CAST_EXPRESSION = 0x57,
    SUBSCRIPT_EXPRESSION = 0x58,
    FIELD_EXPRESSION = 0x59,
    PARENTHESIZED_EXPRESSION = 0x5A,
    INITIALIZER_LIST = 0x5B,
    QUALIFIED_IDENTIFIER = 0x5C,

    // Literals and names
    NUMBER_LITERAL = 0x70,
    STRING_LITERAL = 0x71,
    CHAR_LITERAL = 0x72,
    TRUE_LITERAL = 0x73,
    FALSE_LITERAL = 0x74,
    NULL_LITERAL = 0x75,
    IDENTIFIER = 0x76,
    FIELD_IDENTIFIER = 0x77,

    // Anonymous tokens
    LPAREN = 0xE0,
    RPAREN = 0xE1,
    COMMA = 0xE2,
    TOKEN = 0xE3,

    // Any other named grammar node
    OTHER = 0xFE,
    // Null handle
    UNKNOWN = 0xFF
};

/**
 * Role of a child within its parent (tree-sitter field names)
 */
enum class SyntaxField : uint8_t {
    NONE = 0,
    FUNCTION,
    ARGUMENTS,
    TYPE,
    DECLARATOR,
    VALUE,
    LEFT,
    RIGHT,
    OPERATOR,
    ARGUMENT,
    FIELD,
    INDEX,
    BODY,
    CONDITION,
    CONSEQUENCE,
    ALTERNATIVE,
    INITIALIZER,
    UPDATE,
    NAME,
    PARAMETERS,
    SCOPE,
    SIZE,
    LABEL
};

// =============================================================================
// SOURCE BUFFER
// =============================================================================

/**
 * Immutable byte sequence of one source file
 */
class SourceBuffer {
public:
    SourceBuffer() = default;
    explicit SourceBuffer(std::string bytes) : bytes_(std::move(bytes)) {}

    /**
     * Load a file byte-for-byte
     * @throws sketch_probe::SourceReadException if the file cannot be read
     */
    static SourceBuffer fromFile(const std::string& path);

    /**
     * Write the buffer byte-for-byte
     * @throws sketch_probe::SourceWriteException if the file cannot be written
     */
    void writeToFile(const std::string& path) const;

    const std::string& bytes() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    char at(size_t offset) const { return bytes_[offset]; }

    // Copy of [start, end), clamped to the buffer
    std::string slice(size_t start, size_t end) const;

    bool operator==(const SourceBuffer& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const SourceBuffer& other) const { return bytes_ != other.bytes_; }

private:
    std::string bytes_;
};

// =============================================================================
// SYNTAX NODE
// =============================================================================

/**
 * Handle to one node of a parsed tree. A default-constructed handle is
 * null; field lookups that find nothing also return a null handle.
 */
class SyntaxNode {
public:
    SyntaxNode();
    explicit SyntaxNode(TSNode node) : node_(node) {}

    bool isNull() const { return ts_node_is_null(node_); }
    explicit operator bool() const { return !isNull(); }

    // Core properties
    SyntaxKind getKind() const;
    std::string getType() const;
    bool isNamed() const;
    bool isMissing() const;
    size_t getStartByte() const;
    size_t getEndByte() const;
    size_t length() const { return getEndByte() - getStartByte(); }

    // Children
    size_t childCount() const;
    SyntaxNode childAt(size_t index) const;
    std::vector<SyntaxNode> getChildren() const;

    /**
     * First child tagged with the given field, or a null handle
     */
    SyntaxNode childByField(SyntaxField field) const;

    /**
     * All children tagged with the given field, in order
     */
    std::vector<SyntaxNode> childrenByField(SyntaxField field) const;

    const TSNode& raw() const { return node_; }

    bool operator==(const SyntaxNode& other) const;
    bool operator!=(const SyntaxNode& other) const { return !(*this == other); }

    // Debug support
    std::string toString() const;

private:
    TSNode node_;
};

// =============================================================================
// SYNTAX TREE
// =============================================================================

/**
 * Parsed tree together with the buffer its spans refer to. The tree owns
 * both, so node handles can never outlive the bytes they describe.
 */
class SyntaxTree {
public:
    SyntaxTree(SourceBuffer source, TSTree* tree);

    // Non-copyable, movable
    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;
    SyntaxTree(SyntaxTree&&) = default;
    SyntaxTree& operator=(SyntaxTree&&) = default;

    const SourceBuffer& getSource() const { return source_; }
    SyntaxNode getRoot() const;

    std::string text(const SyntaxNode& node) const {
        return source_.slice(node.getStartByte(), node.getEndByte());
    }

    size_t nodeCount() const;

    /**
     * tree-sitter S-expression of named nodes with field labels, e.g.
     * (translation_unit (declaration type: (primitive_type) declarator: (init_declarator ...)))
     */
    std::string toSExpression() const;

    /**
     * True when the parser had to insert ERROR or MISSING nodes
     */
    bool hasErrors() const;

private:
    struct TreeDeleter {
        void operator()(TSTree* tree) const { ts_tree_delete(tree); }
    };

    SourceBuffer source_;
    std::unique_ptr<TSTree, TreeDeleter> tree_;
};

// =============================================================================
// UTILITY FUNCTIONS
// =============================================================================

/**
 * Raw source text of a node
 */
inline std::string nodeText(const SourceBuffer& source, const SyntaxNode& node) {
    return source.slice(node.getStartByte(), node.getEndByte());
}

/**
 * Visit every node in document order: node before children, children
 * left-to-right. Driven by a tree cursor, so deeply nested expressions do
 * not grow the call stack.
 */
void walkPreOrder(const SyntaxNode& root, const std::function<void(const SyntaxNode&)>& visit);

/**
 * Anonymous tokens carry no grammar meaning of their own
 */
bool isAnonymousKind(SyntaxKind kind);

/**
 * Map a tree-sitter node type name onto SyntaxKind
 */
SyntaxKind syntaxKindFromType(const char* type, bool named);

/**
 * Grammar name of a node kind (snake_case)
 */
std::string syntaxKindToString(SyntaxKind kind);

/**
 * Grammar name of a field
 */
std::string syntaxFieldToString(SyntaxField field);

inline std::ostream& operator<<(std::ostream& os, SyntaxKind kind) {
    return os << syntaxKindToString(kind);
}

} // namespace sketch_ast
