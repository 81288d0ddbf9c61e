#include "mathtext/assembler.h"
#include "mathtext/log.h"
#include <algorithm>

namespace mathtext {

namespace {

void addWarning(std::vector<SegmentWarning>& warnings, SegmentWarning w) {
    if (std::find(warnings.begin(), warnings.end(), w) == warnings.end()) {
        MT_LOGD("assemble: warning %s", warningName(w));
        warnings.push_back(w);
    }
}

} // anonymous namespace

bool AssemblyResult::hasWarning(SegmentWarning w) const {
    return std::find(warnings.begin(), warnings.end(), w) != warnings.end();
}

SegmentAssembler::SegmentAssembler(const AssemblerOptions& options)
    : options_(options) {}

std::vector<ContentSegment> SegmentAssembler::segmentsFor(
    const std::string& input, std::vector<SegmentWarning>& warnings) const {
    if (trim(input).empty()) {
        return {};
    }
    if (hasUnpairedDollar(input)) {
        MT_LOGW("assemble: unbalanced '$' in input of %zu bytes", input.size());
        addWarning(warnings, SegmentWarning::UnbalancedDelimiter);
    }

    auto spans = detectMathSpans(options_.repairLatex ? normalizeInput(input) : input);
    auto grouped = groupEquations(spans);
    if (options_.repairLatex) {
        grouped = normalizeMathSegments(grouped);
    }
    auto sanitized = sanitizeSegments(grouped);

    DisplayPolicy policy;
    policy.forceDisplay = options_.forceDisplay;
    auto resolved = resolveDisplayModes(sanitized, policy);

    for (const auto& seg : resolved) {
        if (seg.isMath() && countUnmatchedLeft(seg.content) > 0) {
            MT_LOGW("assemble: \\left without \\right in '%s'", seg.content.c_str());
            addWarning(warnings, SegmentWarning::UnmatchedLeft);
        }
    }

    if (options_.formatEmphasis) {
        return applyEmphasis(resolved);
    }
    return resolved;
}

AssemblyResult SegmentAssembler::assemble(const std::string& input) const {
    AssemblyResult result;
    auto segments = segmentsFor(input, result.warnings);
    if (segments.empty()) {
        addWarning(result.warnings, SegmentWarning::EmptyInput);
        return result;
    }

    result.segments = options_.insertSeparators ? normalizeSpacing(segments)
                                                : std::move(segments);

    MT_LOGI("assemble: input=%zu segments=%zu warnings=%zu",
            input.size(), result.segments.size(), result.warnings.size());
    return result;
}

AssemblyResult SegmentAssembler::assembleParts(const std::vector<std::string>& parts) const {
    AssemblyResult result;
    std::vector<ContentSegment> combined;
    for (const auto& part : parts) {
        auto segments = segmentsFor(part, result.warnings);
        combined.insert(combined.end(), segments.begin(), segments.end());
    }
    if (combined.empty()) {
        addWarning(result.warnings, SegmentWarning::EmptyInput);
        return result;
    }

    result.segments = options_.insertSeparators ? normalizeSpacing(combined)
                                                : std::move(combined);

    MT_LOGI("assembleParts: parts=%zu segments=%zu warnings=%zu",
            parts.size(), result.segments.size(), result.warnings.size());
    return result;
}

std::vector<ContentSegment> assembleSegments(const std::string& input,
                                             const AssemblerOptions& options) {
    return SegmentAssembler(options).assemble(input).segments;
}

const char* warningName(SegmentWarning warning) {
    switch (warning) {
        case SegmentWarning::None:                return "none";
        case SegmentWarning::EmptyInput:          return "empty-input";
        case SegmentWarning::UnbalancedDelimiter: return "unbalanced-delimiter";
        case SegmentWarning::UnmatchedLeft:       return "unmatched-left";
    }
    return "unknown";
}

} // namespace mathtext
