#include <gtest/gtest.h>

#include <string>

#include "SyntaxParser.hpp"
#include "BindingResolver.hpp"

namespace sketch_probe
{
namespace
{
    BindingMap bindingsOf(const std::string& text)
    {
        sketch_ast::SyntaxParser parser;
        auto tree = parser.parse(sketch_ast::SourceBuffer(text));
        return resolveBindings(tree);
    }

    TEST(BindingResolverTest, NumberLiteralInitializer)
    {
        auto bindings = bindingsOf("int PIN = 5;");

        ASSERT_EQ(bindings.count("PIN"), 1u);
        EXPECT_EQ(bindings.at("PIN"), "5");
    }

    TEST(BindingResolverTest, QualifiersDoNotHideTheName)
    {
        auto bindings = bindingsOf("const int LED = 13;\nstatic volatile uint8_t relay = 7;\n");

        EXPECT_EQ(bindings.at("LED"), "13");
        EXPECT_EQ(bindings.at("relay"), "7");
    }

    TEST(BindingResolverTest, ResolutionStopsAfterOneHop)
    {
        auto bindings = bindingsOf("int A = 5;\nint B = A;\n");

        EXPECT_EQ(bindings.at("A"), "5");
        EXPECT_EQ(bindings.at("B"), "A");
    }

    TEST(BindingResolverTest, ChainedAssignmentBindsRightHandSide)
    {
        auto bindings = bindingsOf("int x = y = 7;");

        EXPECT_EQ(bindings.at("x"), "7");
    }

    TEST(BindingResolverTest, FieldAccessInitializerKeepsText)
    {
        auto bindings = bindingsOf("int p = board.ledPin;");

        EXPECT_EQ(bindings.at("p"), "board.ledPin");
    }

    TEST(BindingResolverTest, ComplexInitializersAreSkipped)
    {
        auto bindings = bindingsOf(
            "int r = analogRead(0);\n"
            "int s = 2 + 3;\n"
            "int pins[] = {2, 3};\n"
            "int plain;\n");

        EXPECT_TRUE(bindings.empty());
    }

    TEST(BindingResolverTest, EveryInitDeclaratorIsVisited)
    {
        auto bindings = bindingsOf("int a, b = 3, c = b;");

        EXPECT_EQ(bindings.count("a"), 0u);
        EXPECT_EQ(bindings.at("b"), "3");
        EXPECT_EQ(bindings.at("c"), "b");
    }

    TEST(BindingResolverTest, PointerDeclaratorName)
    {
        auto bindings = bindingsOf("int *p = 0;");

        EXPECT_EQ(bindings.at("p"), "0");
    }

    TEST(BindingResolverTest, LastDeclarationInDocumentOrderWins)
    {
        auto bindings = bindingsOf(
            "int P = 1;\n"
            "void loop() {\n"
            "  int P = 2;\n"
            "  digitalWrite(P, HIGH);\n"
            "}\n");

        EXPECT_EQ(bindings.at("P"), "2");
    }

    TEST(BindingResolverTest, LocalDeclarationsInsideLoopsAreSeen)
    {
        auto bindings = bindingsOf("void loop() { for (int i = 0; i < 3; i++) {} }");

        EXPECT_EQ(bindings.at("i"), "0");
    }

    TEST(BindingResolverTest, ClassFieldsAndMacrosAreNotBindings)
    {
        auto bindings = bindingsOf(
            "#define LED 13\n"
            "struct Config { int pin = 4; };\n");

        EXPECT_TRUE(bindings.empty());
    }

    TEST(BindingResolverTest, PlainAssignmentsAreNotDeclarations)
    {
        auto bindings = bindingsOf("int pin;\nvoid setup() { pin = 9; }\n");

        EXPECT_EQ(bindings.count("pin"), 0u);
    }

    TEST(BindingResolverTest, ResolvePinSubstitutesOnce)
    {
        BindingMap bindings{{"A", "5"}, {"B", "A"}};

        EXPECT_EQ(resolvePin(bindings, "B"), "A");
        EXPECT_EQ(resolvePin(bindings, "A"), "5");
        EXPECT_EQ(resolvePin(bindings, "LED_BUILTIN"), "LED_BUILTIN");
    }
}
}
