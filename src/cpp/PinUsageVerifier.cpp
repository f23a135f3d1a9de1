/**
 * PinUsageVerifier.cpp - Implementation of table-driven pin verification
 */

#include "PinUsageVerifier.hpp"
#include "CallSiteFinder.hpp"
#include "PlatformAbstraction.hpp"
#include "ProbeConfig.hpp"
#include "TextUtils.hpp"

namespace sketch_probe {

VerificationResult verifyEntry(const sketch_ast::SourceBuffer& source, const sketch_ast::SyntaxNode& root,
                               const BindingMap& bindings, const SpecEntry& entry) {
    VerificationResult result{entry, VerificationStatus::MISSING, {}, {}, 0};

    auto calls = findCalls(source, root, entry.function);
    result.callCount = calls.size();

    for (const auto& call : calls) {
        ArgumentList args = extractArgs(source, call.node);
        std::string argument = args.empty() ? Config::UNKNOWN_ARGUMENT : args[0];

        PinId pin = coercePin(resolvePin(bindings, argument));
        std::string pinText = pinToString(pin);
        result.observedPins.insert(pinText);
        if (!isConventionalPin(entry.function, pin)) {
            result.unconventionalPins.insert(pinText);
        }
    }

    if (result.observedPins.count(pinToString(entry.expectedPin))) {
        result.status = VerificationStatus::FOUND;
    } else if (!result.observedPins.empty()) {
        result.status = VerificationStatus::PRESENT_DIFFERENT;
    }

    DEBUG_STREAM << "verify " << entry.function << "(" << pinToString(entry.expectedPin) << "): "
                 << verificationStatusToString(result.status) << ", " << result.callCount << " call(s)" << std::endl;
    return result;
}

std::vector<VerificationResult> verify(const sketch_ast::SourceBuffer& source, const sketch_ast::SyntaxNode& root,
                                       const BindingMap& bindings, const SpecTable& table) {
    std::vector<VerificationResult> results;
    results.reserve(table.size());
    for (const auto& entry : table.getEntries()) {
        results.push_back(verifyEntry(source, root, bindings, entry));
    }
    return results;
}

std::string formatResult(const VerificationResult& result) {
    const std::string& function = result.entry.function;
    std::string expected = pinToString(result.entry.expectedPin);

    switch (result.status) {
        case VerificationStatus::FOUND:
            return "[FOUND] " + function + "(" + expected + ") is present in the code.";
        case VerificationStatus::PRESENT_DIFFERENT: {
            std::vector<std::string> pins(result.observedPins.begin(), result.observedPins.end());
            return "[PRESENT] " + function + " is used, but with different pin(s): " + joinStrings(pins, ", ");
        }
        case VerificationStatus::MISSING:
        default:
            return "[MISSING] " + function + "(" + expected + ") is NOT present in the code.";
    }
}

std::string verificationStatusToString(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::FOUND: return "FOUND";
        case VerificationStatus::PRESENT_DIFFERENT: return "PRESENT_DIFFERENT";
        case VerificationStatus::MISSING: return "MISSING";
        default: return "UNKNOWN";
    }
}

} // namespace sketch_probe
