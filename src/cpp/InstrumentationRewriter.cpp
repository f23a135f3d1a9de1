/**
 * InstrumentationRewriter.cpp - Implementation of the digital-write rewriter
 */

#include "InstrumentationRewriter.hpp"
#include "ProbeErrors.hpp"
#include "PlatformAbstraction.hpp"
#include "TextUtils.hpp"
#include <algorithm>

namespace sketch_probe {

std::string formatDiagnostic(const DiagnosticFormat& format, const std::string& pin, const std::string& value) {
    STRING_BUILD_START(out);
    STRING_BUILD_APPEND(out, format.macro << "(" << format.tag << ", \"");
    STRING_BUILD_APPEND(out, escapeFormatText(format.label) << " " << escapeFormatText(pin));
    STRING_BUILD_APPEND(out, ", " << escapeFormatText(value) << "\")");
    return STRING_BUILD_FINISH(out);
}

std::vector<Edit> planEdits(const SourceBuffer& source, const std::vector<CallSite>& calls,
                            const BindingMap& bindings, const DiagnosticFormat& format) {
    std::vector<Edit> edits;
    edits.reserve(calls.size());

    size_t coveredUntil = 0;
    for (const auto& call : calls) {
        // Calls arrive in document order; a nested call starts inside the previous span
        if (!edits.empty() && call.startByte < coveredUntil) {
            DEBUG_STREAM << "planEdits: nested call at byte " << call.startByte << " skipped" << std::endl;
            continue;
        }

        ArgumentList args = extractArgs(source, call.node);
        std::string pin = format.unknownToken;
        std::string value = format.unknownToken;
        if (args.size() >= 2) {
            pin = resolvePin(bindings, args[0]);
            value = args[1];
        }

        edits.push_back(Edit{call.startByte, call.endByte, formatDiagnostic(format, pin, value)});
        coveredUntil = call.endByte;
    }
    return edits;
}

SourceBuffer applyEdits(const SourceBuffer& source, std::vector<Edit> edits) {
    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) {
        return a.startByte > b.startByte;
    });

    std::string bytes = source.bytes();
    size_t limit = bytes.size();
    for (const auto& edit : edits) {
        if (edit.startByte > edit.endByte || edit.endByte > limit) {
            throw InvalidEditException("overlaps or exceeds buffer", edit.startByte, edit.endByte);
        }
        bytes.replace(edit.startByte, edit.endByte - edit.startByte, edit.replacement);
        // Next (lower) edit must end at or before this one's start
        limit = edit.startByte;
    }
    return SourceBuffer(std::move(bytes));
}

SourceBuffer instrument(const SourceBuffer& source, const std::vector<CallSite>& calls,
                        const BindingMap& bindings, const DiagnosticFormat& format) {
    return applyEdits(source, planEdits(source, calls, bindings, format));
}

} // namespace sketch_probe
