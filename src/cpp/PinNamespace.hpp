/**
 * PinNamespace.hpp - Pin identifiers and the analog/digital pin sets
 *
 * Pins are written either as plain numbers (13) or as board symbols
 * ("A0", "LED_BUILTIN"). Both forms are kept side by side in a PinId.
 * Namespace membership is informational; it never changes whether an
 * expected pin counts as found.
 *
 * Version: 1.0.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace sketch_probe {

using PinId = std::variant<int32_t, std::string>;

enum class PinNamespace : uint8_t {
    ANALOG = 0x01,   // "A0".."A5", 0..5
    DIGITAL = 0x02   // "D0".."D13", 0..13
};

/**
 * Integer when the trimmed text is a decimal integer (optional sign),
 * otherwise the trimmed text itself
 */
PinId coercePin(const std::string& text);

/**
 * Canonical text of a pin: decimal for integers, verbatim for symbols
 */
std::string pinToString(const PinId& pin);

bool isInNamespace(PinNamespace ns, const PinId& pin);

inline bool isAnalogPin(const PinId& pin) { return isInNamespace(PinNamespace::ANALOG, pin); }
inline bool isDigitalPin(const PinId& pin) { return isInNamespace(PinNamespace::DIGITAL, pin); }

/**
 * analogRead expects ANALOG pins; digitalRead/digitalWrite expect DIGITAL
 * pins; any other function accepts every pin.
 */
bool isConventionalPin(const std::string& function, const PinId& pin);

std::string pinNamespaceToString(PinNamespace ns);

} // namespace sketch_probe
