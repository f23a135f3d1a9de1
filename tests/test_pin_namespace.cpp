#include <gtest/gtest.h>

#include <string>

#include "PinNamespace.hpp"

namespace sketch_probe
{
namespace
{
    TEST(PinNamespaceTest, CoercesDecimalIntegers)
    {
        EXPECT_EQ(coercePin("13"), PinId(13));
        EXPECT_EQ(coercePin("  7 "), PinId(7));
        EXPECT_EQ(coercePin("-1"), PinId(-1));
        EXPECT_EQ(coercePin("+4"), PinId(4));
        EXPECT_EQ(coercePin("05"), PinId(5));
        EXPECT_EQ(coercePin("1_0"), PinId(10));
    }

    TEST(PinNamespaceTest, KeepsSymbolsVerbatim)
    {
        EXPECT_EQ(coercePin("A0"), PinId(std::string("A0")));
        EXPECT_EQ(coercePin("LED_BUILTIN"), PinId(std::string("LED_BUILTIN")));
        EXPECT_EQ(coercePin("0x0D"), PinId(std::string("0x0D")));
        EXPECT_EQ(coercePin(""), PinId(std::string("")));
        EXPECT_EQ(coercePin("-"), PinId(std::string("-")));
        EXPECT_EQ(coercePin("1_"), PinId(std::string("1_")));
        EXPECT_EQ(coercePin("99999999999"), PinId(std::string("99999999999")));
    }

    TEST(PinNamespaceTest, CanonicalText)
    {
        EXPECT_EQ(pinToString(coercePin("007")), "7");
        EXPECT_EQ(pinToString(coercePin("A3")), "A3");
    }

    TEST(PinNamespaceTest, AnalogMembership)
    {
        EXPECT_TRUE(isAnalogPin(PinId(0)));
        EXPECT_TRUE(isAnalogPin(PinId(5)));
        EXPECT_FALSE(isAnalogPin(PinId(6)));
        EXPECT_TRUE(isAnalogPin(PinId(std::string("A5"))));
        EXPECT_FALSE(isAnalogPin(PinId(std::string("A6"))));
        EXPECT_FALSE(isAnalogPin(PinId(std::string("D3"))));
    }

    TEST(PinNamespaceTest, DigitalMembership)
    {
        EXPECT_TRUE(isDigitalPin(PinId(13)));
        EXPECT_FALSE(isDigitalPin(PinId(14)));
        EXPECT_FALSE(isDigitalPin(PinId(-1)));
        EXPECT_TRUE(isDigitalPin(PinId(std::string("D13"))));
        EXPECT_FALSE(isDigitalPin(PinId(std::string("D14"))));
        EXPECT_FALSE(isDigitalPin(PinId(std::string("D01"))));
        EXPECT_FALSE(isDigitalPin(PinId(std::string("LED_BUILTIN"))));
    }

    TEST(PinNamespaceTest, ConventionsPerFunction)
    {
        EXPECT_TRUE(isConventionalPin("analogRead", PinId(std::string("A0"))));
        EXPECT_FALSE(isConventionalPin("analogRead", PinId(9)));
        EXPECT_TRUE(isConventionalPin("digitalWrite", PinId(9)));
        EXPECT_FALSE(isConventionalPin("digitalRead", PinId(std::string("A0"))));
        EXPECT_TRUE(isConventionalPin("tone", PinId(99)));
    }
}
}
