#include "mathtext/display_mode.h"

namespace mathtext {

bool needsDisplayMode(const std::string& latex) {
    return latex.find("\\begin{") != std::string::npos ||
           latex.find("\\left") != std::string::npos;
}

std::vector<ContentSegment> resolveDisplayModes(const std::vector<ContentSegment>& segments,
                                                const DisplayPolicy& policy) {
    std::vector<ContentSegment> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        ContentSegment copy = seg;
        if (copy.isMath()) {
            copy.displayMode = copy.alignedSystem || copy.displayMode ||
                               policy.forceDisplay || needsDisplayMode(copy.content);
        } else {
            copy.displayMode = false;
        }
        result.push_back(std::move(copy));
    }
    return result;
}

} // namespace mathtext
