#include "mathtext/segment.h"

namespace mathtext {

const char* segmentKindName(SegmentKind kind) {
    switch (kind) {
        case SegmentKind::Text:      return "text";
        case SegmentKind::Math:      return "math";
        case SegmentKind::Formatted: return "formatted";
    }
    return "unknown";
}

std::string joinedContent(const std::vector<ContentSegment>& segments) {
    std::string result;
    for (const auto& seg : segments) {
        if (seg.isSeparator()) continue;
        result += seg.content;
    }
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) ++start;
    if (start == s.size()) return "";
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

} // namespace mathtext
