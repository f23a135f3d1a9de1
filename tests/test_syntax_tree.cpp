#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
#include <vector>

#include "SyntaxParser.hpp"
#include "CallSiteFinder.hpp"
#include "ProbeErrors.hpp"

namespace sketch_ast
{
namespace
{
    SyntaxTree parseText(const std::string& text)
    {
        SyntaxParser parser;
        return parser.parse(SourceBuffer(text));
    }

    size_t countKind(const SyntaxTree& tree, SyntaxKind kind)
    {
        size_t count = 0;
        walkPreOrder(tree.getRoot(), [&](const SyntaxNode& node) {
            if (node.getKind() == kind) {
                ++count;
            }
        });
        return count;
    }

    TEST(SyntaxParserTest, GlobalDeclarationShape)
    {
        auto tree = parseText("int PIN = 5;");

        EXPECT_FALSE(tree.hasErrors());
        EXPECT_EQ(tree.toSExpression(),
                  "(translation_unit (declaration type: (primitive_type) "
                  "declarator: (init_declarator declarator: (identifier) value: (number_literal))))");
    }

    TEST(SyntaxParserTest, FunctionDefinitionWithCall)
    {
        auto tree = parseText("void setup() { pinMode(PIN, OUTPUT); }");

        EXPECT_FALSE(tree.hasErrors());
        EXPECT_EQ(tree.toSExpression(),
                  "(translation_unit (function_definition type: (primitive_type) "
                  "declarator: (function_declarator declarator: (identifier) parameters: (parameter_list)) "
                  "body: (compound_statement (expression_statement (call_expression function: (identifier) "
                  "arguments: (argument_list (identifier) (identifier)))))))");
    }

    TEST(SyntaxParserTest, RootStartsAtLeadingComment)
    {
        const std::string text = "// header\nint a = 1;\n\n";
        auto tree = parseText(text);

        EXPECT_EQ(tree.getRoot().getKind(), SyntaxKind::TRANSLATION_UNIT);
        EXPECT_EQ(tree.getRoot().getStartByte(), 0u);
        EXPECT_LE(tree.getRoot().getEndByte(), text.size());
        EXPECT_EQ(tree.getRoot().childAt(0).getKind(), SyntaxKind::COMMENT);
    }

    TEST(SyntaxParserTest, CallSpanCoversCalleeAndArguments)
    {
        const std::string text = "void loop() {\n  digitalWrite(LED, HIGH);\n}\n";
        auto tree = parseText(text);

        auto calls = sketch_probe::findCalls(tree, "digitalWrite");
        ASSERT_EQ(calls.size(), 1u);
        EXPECT_EQ(tree.text(calls[0].node), "digitalWrite(LED, HIGH)");
        EXPECT_EQ(calls[0].startByte, text.find("digitalWrite"));
    }

    TEST(SyntaxParserTest, PreprocessorDirectives)
    {
        auto tree = parseText("#include <Arduino.h>\n#define LED \\\n  13\nint x;\n");

        EXPECT_EQ(countKind(tree, SyntaxKind::PREPROC_INCLUDE), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::PREPROC_DEF), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::DECLARATION), 1u);
        EXPECT_FALSE(tree.hasErrors());
    }

    TEST(SyntaxParserTest, CommentsAndStringsHideCallText)
    {
        auto tree = parseText(
            "void loop() {\n"
            "  // digitalWrite(1, HIGH);\n"
            "  /* digitalWrite(2, HIGH); */\n"
            "  Serial.println(\"digitalWrite(3, HIGH)\");\n"
            "}\n");

        EXPECT_TRUE(sketch_probe::findCalls(tree, "digitalWrite").empty());
        EXPECT_EQ(sketch_probe::findCalls(tree, "Serial.println").size(), 1u);
    }

    TEST(SyntaxParserTest, ControlFlowStatements)
    {
        auto tree = parseText(
            "void loop() {\n"
            "  for (int i = 0; i < 3; i++) { digitalWrite(i, HIGH); }\n"
            "  while (digitalRead(2) == LOW) delay(1);\n"
            "  do { x++; } while (x < 10);\n"
            "  if (x > 5) { y = 1; } else if (x) { y = 2; } else y = 3;\n"
            "  switch (mode) { case 1: blink(); break; default: break; }\n"
            "  return;\n"
            "}\n");

        EXPECT_FALSE(tree.hasErrors());
        EXPECT_EQ(countKind(tree, SyntaxKind::FOR_STMT), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::WHILE_STMT), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::DO_WHILE_STMT), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::IF_STMT), 2u);
        EXPECT_EQ(countKind(tree, SyntaxKind::CASE_STMT), 2u);
        EXPECT_EQ(sketch_probe::findCalls(tree, "digitalWrite").size(), 1u);
    }

    TEST(SyntaxParserTest, ClassMembers)
    {
        auto tree = parseText(
            "class Blinker {\n"
            "public:\n"
            "  Blinker(int p) : pin(p) {}\n"
            "  void on() { digitalWrite(pin, HIGH); }\n"
            "private:\n"
            "  int pin = 4;\n"
            "};\n");

        EXPECT_FALSE(tree.hasErrors());
        EXPECT_EQ(countKind(tree, SyntaxKind::CLASS_SPECIFIER), 1u);
        EXPECT_EQ(countKind(tree, SyntaxKind::FUNCTION_DEFINITION), 2u);
        EXPECT_EQ(countKind(tree, SyntaxKind::FIELD_DECLARATION), 1u);
        EXPECT_EQ(sketch_probe::findCalls(tree, "digitalWrite").size(), 1u);
    }

    TEST(SyntaxParserTest, FieldLookups)
    {
        auto tree = parseText("int a = 1, b = 2;");

        SyntaxNode declaration = tree.getRoot().childAt(0);
        ASSERT_EQ(declaration.getKind(), SyntaxKind::DECLARATION);
        EXPECT_EQ(tree.text(declaration.childByField(SyntaxField::TYPE)), "int");

        auto declarators = declaration.childrenByField(SyntaxField::DECLARATOR);
        ASSERT_EQ(declarators.size(), 2u);
        EXPECT_EQ(tree.text(declarators[1]), "b = 2");
        EXPECT_EQ(tree.text(declarators[1].childByField(SyntaxField::VALUE)), "2");

        EXPECT_TRUE(declaration.childByField(SyntaxField::BODY).isNull());
        EXPECT_TRUE(declaration.childrenByField(SyntaxField::BODY).empty());
    }

    TEST(SyntaxParserTest, PreOrderVisitsParentsFirst)
    {
        auto tree = parseText("int a = 1;");

        std::vector<SyntaxKind> kinds;
        walkPreOrder(tree.getRoot(), [&](const SyntaxNode& node) {
            if (node.isNamed()) {
                kinds.push_back(node.getKind());
            }
        });

        ASSERT_EQ(kinds.size(), 6u);
        EXPECT_EQ(kinds[0], SyntaxKind::TRANSLATION_UNIT);
        EXPECT_EQ(kinds[1], SyntaxKind::DECLARATION);
        EXPECT_EQ(kinds[2], SyntaxKind::PRIMITIVE_TYPE);
        EXPECT_EQ(kinds[3], SyntaxKind::INIT_DECLARATOR);
        EXPECT_EQ(kinds[4], SyntaxKind::IDENTIFIER);
        EXPECT_EQ(kinds[5], SyntaxKind::NUMBER_LITERAL);
        EXPECT_GT(tree.nodeCount(), kinds.size());
    }

    TEST(SyntaxParserTest, UnknownSyntaxBecomesErrorNode)
    {
        auto tree = parseText("void loop() { @@@ ; digitalWrite(3, LOW); }");

        EXPECT_TRUE(tree.hasErrors());
        EXPECT_EQ(sketch_probe::findCalls(tree, "digitalWrite").size(), 1u);
    }

    TEST(SyntaxParserTest, MissingClosingBraceStillParses)
    {
        auto tree = parseText("void loop() {\n  digitalWrite(3, LOW);\n");

        EXPECT_TRUE(tree.hasErrors());
        EXPECT_EQ(sketch_probe::findCalls(tree, "digitalWrite").size(), 1u);
    }

    TEST(SyntaxParserTest, UnterminatedBlockCommentIsRecovered)
    {
        SyntaxParser parser;
        SyntaxTree tree = parser.parse(SourceBuffer("int a;\n/* never closed"));

        EXPECT_TRUE(tree.hasErrors());
        EXPECT_EQ(countKind(tree, SyntaxKind::DECLARATION), 1u);
    }

    TEST(SyntaxParserTest, DeepNestingIsParsed)
    {
        std::string text = "int x = " + std::string(1000, '(') + "1" + std::string(1000, ')') + ";";
        SyntaxParser parser;
        SyntaxTree tree = parser.parse(SourceBuffer(text));

        EXPECT_FALSE(tree.hasErrors());
        EXPECT_EQ(countKind(tree, SyntaxKind::PARENTHESIZED_EXPRESSION), 1000u);
        EXPECT_EQ(countKind(tree, SyntaxKind::NUMBER_LITERAL), 1u);
    }

    TEST(SyntaxParserTest, NulByteDoesNotAbort)
    {
        SyntaxParser parser;
        EXPECT_NO_THROW(parser.parse(SourceBuffer(std::string("int a;\0int b;", 13))));
    }

    TEST(SyntaxParserTest, EmptySourceYieldsEmptyRoot)
    {
        auto tree = parseText("");

        EXPECT_EQ(tree.getRoot().childCount(), 0u);
        EXPECT_FALSE(tree.hasErrors());
    }

    TEST(SyntaxParserTest, ParserIsReusable)
    {
        SyntaxParser parser;
        SyntaxTree first = parser.parse(SourceBuffer("int a;"));
        SyntaxTree second = parser.parse(SourceBuffer("void loop() {}"));

        EXPECT_EQ(first.getRoot().childAt(0).getKind(), SyntaxKind::DECLARATION);
        EXPECT_EQ(second.getRoot().childAt(0).getKind(), SyntaxKind::FUNCTION_DEFINITION);
    }

    TEST(SyntaxParserTest, MissingFileThrows)
    {
        SyntaxParser parser;
        EXPECT_THROW(parser.parseFile("/nonexistent/dir/sketch.ino"), sketch_probe::SourceReadException);
    }

    TEST(SourceBufferTest, FileRoundTripIsByteExactAndTruncates)
    {
        char pattern[] = "/tmp/sketch_probe_buffer_XXXXXX";
        int fd = mkstemp(pattern);
        ASSERT_GE(fd, 0);
        close(fd);
        const std::string path = pattern;

        SourceBuffer("a much longer first version\n").writeToFile(path);
        const SourceBuffer original(std::string("line\r\nnul\0end", 13));
        original.writeToFile(path);

        EXPECT_EQ(SourceBuffer::fromFile(path), original);
        std::remove(path.c_str());
    }

    TEST(SyntaxNodeTest, NullHandle)
    {
        SyntaxNode node;

        EXPECT_TRUE(node.isNull());
        EXPECT_FALSE(static_cast<bool>(node));
        EXPECT_EQ(node.getKind(), SyntaxKind::UNKNOWN);
        EXPECT_EQ(node.childCount(), 0u);
        EXPECT_TRUE(node.childAt(0).isNull());
        EXPECT_TRUE(node.childByField(SyntaxField::VALUE).isNull());
        EXPECT_EQ(node.toString(), "null");
        EXPECT_EQ(node, SyntaxNode());
    }

    TEST(SyntaxNodeTest, HandlesCompareByIdentity)
    {
        auto tree = parseText("int a; int b;");
        SyntaxNode root = tree.getRoot();

        EXPECT_EQ(root.childAt(0), root.childAt(0));
        EXPECT_NE(root.childAt(0), root.childAt(1));
        EXPECT_EQ(root.toString(), "translation_unit [0, 13) [2 children]");
    }

    TEST(SyntaxKindTest, TypeNamesMapOntoKinds)
    {
        EXPECT_EQ(syntaxKindFromType("call_expression", true), SyntaxKind::CALL_EXPRESSION);
        EXPECT_EQ(syntaxKindFromType("preproc_ifdef", true), SyntaxKind::PREPROC_CONDITIONAL);
        EXPECT_EQ(syntaxKindFromType("nullptr", true), SyntaxKind::NULL_LITERAL);
        EXPECT_EQ(syntaxKindFromType("ERROR", true), SyntaxKind::ERROR_NODE);
        EXPECT_EQ(syntaxKindFromType("lambda_expression", true), SyntaxKind::OTHER);
        EXPECT_EQ(syntaxKindFromType("(", false), SyntaxKind::LPAREN);
        EXPECT_EQ(syntaxKindFromType(",", false), SyntaxKind::COMMA);
        EXPECT_EQ(syntaxKindFromType(";", false), SyntaxKind::TOKEN);
        EXPECT_EQ(syntaxKindFromType(nullptr, true), SyntaxKind::UNKNOWN);

        EXPECT_TRUE(isAnonymousKind(SyntaxKind::RPAREN));
        EXPECT_FALSE(isAnonymousKind(SyntaxKind::IDENTIFIER));
        EXPECT_EQ(syntaxKindToString(SyntaxKind::DO_WHILE_STMT), "do_statement");
        EXPECT_EQ(syntaxFieldToString(SyntaxField::ARGUMENTS), "arguments");
    }
}
}
