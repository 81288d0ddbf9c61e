#include "mathtext/spacing.h"
#include "mathtext/log.h"

namespace mathtext {

namespace {

bool needsSeparator(const ContentSegment& a, const ContentSegment& b) {
    if (a.isMath() || b.isMath()) return false;
    bool aEndsSpace = !a.content.empty() && isSpace(a.content.back());
    bool bStartsSpace = !b.content.empty() && isSpace(b.content.front());
    return !aEndsSpace && !bStartsSpace;
}

} // anonymous namespace

std::vector<ContentSegment> normalizeSpacing(const std::vector<ContentSegment>& segments) {
    std::vector<ContentSegment> result;
    result.reserve(segments.size() * 2);
    int inserted = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0 && needsSeparator(segments[i - 1], segments[i])) {
            result.push_back(ContentSegment::separator());
            ++inserted;
        }
        result.push_back(segments[i]);
    }
    if (inserted > 0) {
        MT_LOGD("normalizeSpacing: inserted %d separators", inserted);
    }
    return result;
}

} // namespace mathtext
