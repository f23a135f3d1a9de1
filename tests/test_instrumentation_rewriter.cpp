#include <gtest/gtest.h>

#include <string>

#include "SyntaxParser.hpp"
#include "InstrumentationRewriter.hpp"
#include "ProbeErrors.hpp"

namespace sketch_probe
{
namespace
{
    std::string instrumentText(const std::string& text)
    {
        sketch_ast::SyntaxParser parser;
        auto tree = parser.parse(sketch_ast::SourceBuffer(text));
        auto calls = findCalls(tree, "digitalWrite");
        return instrument(tree.getSource(), calls, resolveBindings(tree)).bytes();
    }

    TEST(InstrumentationRewriterTest, SketchWithoutDigitalWriteIsUnchanged)
    {
        const std::string text =
            "// reads only\n"
            "void setup() { Serial.begin(9600); }\n"
            "void loop() { Serial.println(analogRead(A0)); delay(10); }\n";

        EXPECT_EQ(instrumentText(text), text);
    }

    TEST(InstrumentationRewriterTest, BoundPinIsEmbedded)
    {
        EXPECT_EQ(instrumentText("int PIN = 5;\nvoid loop() { digitalWrite(PIN, HIGH); }\n"),
                  "int PIN = 5;\nvoid loop() { ESP_LOGI(TAG, \"PIN 5, HIGH\"); }\n");
    }

    TEST(InstrumentationRewriterTest, OnlyCallSpansChange)
    {
        const std::string text =
            "void loop() {\n"
            "  digitalWrite(13, HIGH);   // on\n"
            "  delay(250);\n"
            "  digitalWrite(LED_BUILTIN, LOW);\n"
            "  digitalWrite(2,HIGH);\n"
            "}\n";
        const std::string expected =
            "void loop() {\n"
            "  ESP_LOGI(TAG, \"PIN 13, HIGH\");   // on\n"
            "  delay(250);\n"
            "  ESP_LOGI(TAG, \"PIN LED_BUILTIN, LOW\");\n"
            "  ESP_LOGI(TAG, \"PIN 2, HIGH\");\n"
            "}\n";

        EXPECT_EQ(instrumentText(text), expected);
    }

    TEST(InstrumentationRewriterTest, EditCountMatchesCallCount)
    {
        sketch_ast::SyntaxParser parser;
        auto tree = parser.parse(sketch_ast::SourceBuffer(
            "void a() { digitalWrite(1, HIGH); }\n"
            "void b() { digitalWrite(2, LOW); digitalWrite(3, HIGH); }\n"));
        auto calls = findCalls(tree, "digitalWrite");
        auto edits = planEdits(tree.getSource(), calls, resolveBindings(tree));

        ASSERT_EQ(calls.size(), 3u);
        ASSERT_EQ(edits.size(), calls.size());
        for (size_t i = 0; i < edits.size(); ++i) {
            EXPECT_EQ(edits[i].startByte, calls[i].startByte);
            EXPECT_EQ(edits[i].endByte, calls[i].endByte);
        }
    }

    TEST(InstrumentationRewriterTest, OneHopBindingIsRenderedVerbatim)
    {
        EXPECT_EQ(instrumentText("int A = 5;\nint B = A;\nvoid loop() { digitalWrite(B, LOW); }\n"),
                  "int A = 5;\nint B = A;\nvoid loop() { ESP_LOGI(TAG, \"PIN A, LOW\"); }\n");
    }

    TEST(InstrumentationRewriterTest, ShortArgumentListRendersUnknown)
    {
        EXPECT_EQ(instrumentText("void loop() { digitalWrite(LED); digitalWrite(); }"),
                  "void loop() { ESP_LOGI(TAG, \"PIN unknown, unknown\"); ESP_LOGI(TAG, \"PIN unknown, unknown\"); }");
    }

    TEST(InstrumentationRewriterTest, NestedCallIsReplacedWithItsParent)
    {
        EXPECT_EQ(instrumentText("void loop() { digitalWrite(a, digitalWrite(b, HIGH)); }"),
                  "void loop() { ESP_LOGI(TAG, \"PIN a, digitalWrite(b, HIGH)\"); }");
    }

    TEST(InstrumentationRewriterTest, ArgumentTextIsEscaped)
    {
        EXPECT_EQ(instrumentText("void loop() { digitalWrite(3, \"50%\"); }"),
                  "void loop() { ESP_LOGI(TAG, \"PIN 3, \\\"50%%\\\"\"); }");
    }

    TEST(InstrumentationRewriterTest, CustomDiagnosticFormat)
    {
        DiagnosticFormat format;
        format.macro = "LOG_PIN";
        format.tag = "LOG_TAG";
        format.label = "GPIO";

        EXPECT_EQ(formatDiagnostic(format, "7", "LOW"), "LOG_PIN(LOG_TAG, \"GPIO 7, LOW\")");
        EXPECT_EQ(formatDiagnostic(DiagnosticFormat(), "7", "LOW"), "ESP_LOGI(TAG, \"PIN 7, LOW\")");
    }

    TEST(InstrumentationRewriterTest, EditsApplyFromHighestOffsetDown)
    {
        sketch_ast::SourceBuffer source("aaa bbb ccc");
        std::vector<Edit> edits = {
            {0, 3, "A"},
            {8, 11, "CCCCC"},
            {4, 7, ""},
        };

        EXPECT_EQ(applyEdits(source, edits).bytes(), "A  CCCCC");
        EXPECT_EQ(source.bytes(), "aaa bbb ccc");
    }

    TEST(InstrumentationRewriterTest, OverlappingEditsAreRejected)
    {
        sketch_ast::SourceBuffer source("0123456789");

        EXPECT_THROW(applyEdits(source, {{0, 5, "x"}, {3, 7, "y"}}), InvalidEditException);
        EXPECT_THROW(applyEdits(source, {{8, 12, "z"}}), InvalidEditException);
    }

    TEST(InstrumentationRewriterTest, InvalidEditIsAProbeException)
    {
        sketch_ast::SourceBuffer source("0123456789");

        try {
            applyEdits(source, {{4, 2, "x"}});
            FAIL() << "reversed edit accepted";
        } catch (const ProbeException& e) {
            EXPECT_STREQ(e.what(), "Edit [4, 2) overlaps or exceeds buffer");
        }
    }

    TEST(InstrumentationRewriterTest, InputBufferIsNotModified)
    {
        sketch_ast::SyntaxParser parser;
        auto tree = parser.parse(sketch_ast::SourceBuffer("void loop() { digitalWrite(1, HIGH); }"));
        std::string before = tree.getSource().bytes();

        auto output = instrument(tree.getSource(), findCalls(tree, "digitalWrite"), resolveBindings(tree));

        EXPECT_EQ(tree.getSource().bytes(), before);
        EXPECT_NE(output, tree.getSource());
    }
}
}
