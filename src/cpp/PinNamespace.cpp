/**
 * PinNamespace.cpp - Implementation of pin coercion and namespace lookup
 */

#include "PinNamespace.hpp"
#include "TextUtils.hpp"
#include <cctype>
#include <limits>

namespace sketch_probe {

PinId coercePin(const std::string& text) {
    std::string trimmed = trim(text);

    size_t i = 0;
    bool negative = false;
    if (i < trimmed.size() && (trimmed[i] == '+' || trimmed[i] == '-')) {
        negative = trimmed[i] == '-';
        ++i;
    }
    if (i >= trimmed.size()) {
        return trimmed;
    }

    int64_t value = 0;
    bool lastWasDigit = false;
    for (; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            value = value * 10 + (c - '0');
            if (value > static_cast<int64_t>(std::numeric_limits<int32_t>::max()) + 1) {
                return trimmed;
            }
            lastWasDigit = true;
        } else if (c == '_' && lastWasDigit && i + 1 < trimmed.size() &&
                   std::isdigit(static_cast<unsigned char>(trimmed[i + 1]))) {
            // 1_000 style grouping
            lastWasDigit = false;
        } else {
            return trimmed;
        }
    }

    if (negative) {
        value = -value;
    }
    if (value > std::numeric_limits<int32_t>::max() || value < std::numeric_limits<int32_t>::min()) {
        return trimmed;
    }
    return static_cast<int32_t>(value);
}

std::string pinToString(const PinId& pin) {
    if (std::holds_alternative<int32_t>(pin)) {
        return std::to_string(std::get<int32_t>(pin));
    }
    return std::get<std::string>(pin);
}

bool isInNamespace(PinNamespace ns, const PinId& pin) {
    int32_t highest = ns == PinNamespace::ANALOG ? 5 : 13;
    char prefix = ns == PinNamespace::ANALOG ? 'A' : 'D';

    if (std::holds_alternative<int32_t>(pin)) {
        int32_t number = std::get<int32_t>(pin);
        return number >= 0 && number <= highest;
    }

    const std::string& symbol = std::get<std::string>(pin);
    if (symbol.size() < 2 || symbol.size() > 3 || symbol[0] != prefix) {
        return false;
    }
    // "A0".."A5" / "D0".."D13", no leading zeros
    if (symbol.size() == 3 && symbol[1] == '0') {
        return false;
    }
    int32_t number = 0;
    for (size_t i = 1; i < symbol.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(symbol[i]))) {
            return false;
        }
        number = number * 10 + (symbol[i] - '0');
    }
    return number <= highest;
}

bool isConventionalPin(const std::string& function, const PinId& pin) {
    if (function == "analogRead") {
        return isAnalogPin(pin);
    }
    if (function == "digitalRead" || function == "digitalWrite") {
        return isDigitalPin(pin);
    }
    return true;
}

std::string pinNamespaceToString(PinNamespace ns) {
    switch (ns) {
        case PinNamespace::ANALOG: return "ANALOG";
        case PinNamespace::DIGITAL: return "DIGITAL";
        default: return "UNKNOWN";
    }
}

} // namespace sketch_probe
