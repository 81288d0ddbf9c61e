#pragma once

#include "mathtext/segment.h"
#include <string>
#include <vector>
#include <memory>

namespace mathtext {

/// Font style of a rendered node
enum class FontStyle {
    Normal,
    Italic,
};

/// Output of rendering one segment
struct RenderedNode {
    SegmentKind kind = SegmentKind::Text;
    std::string markup;          // Typeset math, formatted html, or plain text
    bool displayMode = false;    // Block layout (centered, own line)
    bool fallback = false;       // Math typesetting failed; markup is the raw latex
    FontStyle fontStyle = FontStyle::Normal;
};

/// How a failed math segment is shown
struct FallbackStyle {
    FontStyle fontStyle = FontStyle::Italic;
};

/// Abstract interface for the math typesetting engine.
/// Web: KaTeX/MathJax bridge
/// Native: MicroTeX or a platform math view
class MathTypesetter {
public:
    virtual ~MathTypesetter() = default;

    /// Typeset latex and return renderer-specific markup.
    /// May throw on malformed input.
    virtual std::string typeset(const std::string& latex, bool displayMode) = 0;
};

/// Renders segments through a MathTypesetter.
/// Never throws: a failed or empty typeset shows the raw content in the
/// fallback style instead of leaving a gap.
class SegmentRenderer {
public:
    explicit SegmentRenderer(std::shared_ptr<MathTypesetter> typesetter,
                             FallbackStyle fallback = {});

    RenderedNode render(const ContentSegment& segment) const;
    std::vector<RenderedNode> renderAll(const std::vector<ContentSegment>& segments) const;

private:
    std::shared_ptr<MathTypesetter> typesetter_;
    FallbackStyle fallbackStyle_;

    RenderedNode renderMath(const ContentSegment& segment) const;
    RenderedNode fallbackNode(const ContentSegment& segment) const;
};

} // namespace mathtext
