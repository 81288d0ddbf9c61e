#include "mathtext/render.h"
#include "mathtext/log.h"
#include <exception>

namespace mathtext {

SegmentRenderer::SegmentRenderer(std::shared_ptr<MathTypesetter> typesetter,
                                 FallbackStyle fallback)
    : typesetter_(std::move(typesetter))
    , fallbackStyle_(fallback) {}

RenderedNode SegmentRenderer::render(const ContentSegment& segment) const {
    RenderedNode node;
    node.kind = segment.kind;
    switch (segment.kind) {
        case SegmentKind::Text:
            node.markup = segment.content;
            return node;
        case SegmentKind::Formatted:
            node.markup = segment.html.value_or(segment.content);
            return node;
        case SegmentKind::Math:
            return renderMath(segment);
    }
    return node;
}

std::vector<RenderedNode> SegmentRenderer::renderAll(
    const std::vector<ContentSegment>& segments) const {
    std::vector<RenderedNode> nodes;
    nodes.reserve(segments.size());
    int fallbacks = 0;
    for (const auto& seg : segments) {
        nodes.push_back(render(seg));
        if (nodes.back().fallback) ++fallbacks;
    }
    MT_LOGD("renderAll: segments=%zu fallbacks=%d", segments.size(), fallbacks);
    return nodes;
}

RenderedNode SegmentRenderer::renderMath(const ContentSegment& segment) const {
    if (!typesetter_) {
        MT_LOGW("renderMath: no typesetter, showing raw latex");
        return fallbackNode(segment);
    }

    std::string markup;
    try {
        markup = typesetter_->typeset(segment.content, segment.displayMode);
    } catch (const std::exception& e) {
        MT_LOGW("renderMath: typeset failed for '%s': %s", segment.content.c_str(), e.what());
        return fallbackNode(segment);
    } catch (...) {
        MT_LOGW("renderMath: unknown exception typesetting '%s'", segment.content.c_str());
        return fallbackNode(segment);
    }

    if (markup.empty()) {
        MT_LOGW("renderMath: empty output for '%s'", segment.content.c_str());
        return fallbackNode(segment);
    }

    RenderedNode node;
    node.kind = SegmentKind::Math;
    node.markup = std::move(markup);
    node.displayMode = segment.displayMode;
    return node;
}

RenderedNode SegmentRenderer::fallbackNode(const ContentSegment& segment) const {
    RenderedNode node;
    node.kind = SegmentKind::Math;
    node.markup = segment.content;
    node.displayMode = segment.displayMode;
    node.fallback = true;
    node.fontStyle = fallbackStyle_.fontStyle;
    return node;
}

} // namespace mathtext
