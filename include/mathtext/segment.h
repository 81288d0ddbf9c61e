#pragma once

#include <string>
#include <vector>
#include <optional>

namespace mathtext {

/// Segment kinds produced by the pipeline.
/// Consumers switch over this without a default label so that a new kind
/// is a compile error (-Werror=switch) rather than a silent fallthrough.
enum class SegmentKind {
    Text,
    Math,
    Formatted,
};

/// An atomic, typed chunk of content ready for rendering
struct ContentSegment {
    SegmentKind kind = SegmentKind::Text;
    std::string content;
    bool displayMode = false;           // Math only
    std::optional<std::string> html;    // Formatted only: pre-rendered markup
    bool alignedSystem = false;         // Math only: built from several equations

    static ContentSegment text(const std::string& t) {
        return {SegmentKind::Text, t, false, std::nullopt, false};
    }
    static ContentSegment math(const std::string& latex, bool display = false) {
        return {SegmentKind::Math, latex, display, std::nullopt, false};
    }
    static ContentSegment system(const std::string& latex) {
        return {SegmentKind::Math, latex, true, std::nullopt, true};
    }
    static ContentSegment formatted(const std::string& raw, const std::string& markup) {
        return {SegmentKind::Formatted, raw, false, markup, false};
    }
    static ContentSegment separator() {
        return {SegmentKind::Text, " ", false, std::nullopt, false};
    }

    bool isMath() const { return kind == SegmentKind::Math; }

    /// The one-space Text segment inserted between adjacent non-math segments
    bool isSeparator() const {
        return kind == SegmentKind::Text && content == " ";
    }

    bool operator==(const ContentSegment& other) const {
        return kind == other.kind && content == other.content &&
               displayMode == other.displayMode && html == other.html &&
               alignedSystem == other.alignedSystem;
    }
    bool operator!=(const ContentSegment& other) const { return !(*this == other); }
};

/// Name of a segment kind, for logs and test output
const char* segmentKindName(SegmentKind kind);

/// Concatenated content of all segments except separators
std::string joinedContent(const std::vector<ContentSegment>& segments);

/// Whitespace as recognized throughout the pipeline (ASCII only)
inline bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Trim ASCII whitespace from both ends
std::string trim(const std::string& s);

} // namespace mathtext
