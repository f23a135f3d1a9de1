#include <gtest/gtest.h>

#include <string>

#include "SketchWrapper.hpp"

namespace sketch_probe
{
namespace
{
    TEST(SketchWrapperTest, EspIdfPrelude)
    {
        EXPECT_EQ(wrapForEspIdf("void setup() {}\n"),
                  "//file: main.cpp\n"
                  "#include \"Arduino.h\"\n"
                  "#include \"esp_log.h\"\n"
                  "static const char *TAG = \"APP\";\n"
                  "\n"
                  "void setup() {}\n");
    }

    TEST(SketchWrapperTest, HostBuildReplacesArduinoHeader)
    {
        std::string wrapped = wrapForHost("  #include <Arduino.h>\nvoid setup() {}\nvoid loop() {}\n");

        EXPECT_EQ(wrapped.find("#include <Arduino.h>"), std::string::npos);
        EXPECT_NE(wrapped.find("// Arduino.h removed\nvoid setup() {}\nvoid loop() {}\n"), std::string::npos);
    }

    TEST(SketchWrapperTest, HostBuildHeaderAndFooter)
    {
        std::string wrapped = wrapForHost("void setup() {}\nvoid loop() {}");

        EXPECT_EQ(wrapped.rfind("// ===== Auto-generated from Arduino .ino =====\n#include <stdio.h>\n", 0), 0u);
        EXPECT_NE(wrapped.find("#define INPUT_PULLUP 2\n"), std::string::npos);
        EXPECT_NE(wrapped.find("#define HIGH 1\n#define LOW 0\n"), std::string::npos);
        EXPECT_NE(wrapped.find("void loop() {}\n// Evaluator wrappers\n"), std::string::npos);
        EXPECT_NE(wrapped.find("extern \"C\" {"), std::string::npos);
        EXPECT_NE(wrapped.find("void run_setup() { setup(); }\n"), std::string::npos);
        EXPECT_NE(wrapped.find("void run_loop()  { loop(); }\n"), std::string::npos);
    }

    TEST(SketchWrapperTest, OtherIncludesAreKept)
    {
        std::string wrapped = wrapForHost("#include <Wire.h>\n");

        EXPECT_NE(wrapped.find("#include <Wire.h>\n"), std::string::npos);
        EXPECT_EQ(wrapped.find("// Arduino.h removed"), std::string::npos);
    }

    TEST(SketchWrapperTest, DispatchOnWrapping)
    {
        EXPECT_EQ(wrapSketch(SketchWrapping::NONE, "x"), "x");
        EXPECT_EQ(wrapSketch(SketchWrapping::ESP_IDF, "x"), wrapForEspIdf("x"));
        EXPECT_EQ(wrapSketch(SketchWrapping::HOST, "x"), wrapForHost("x"));
        EXPECT_EQ(sketchWrappingToString(SketchWrapping::HOST), "HOST");
    }
}
}
