#include "mathtext/emphasis.h"
#include "mathtext/log.h"

namespace mathtext {

namespace {

/// **x** -> <strong>x</strong>, where x is non-empty and has no '*'
std::string replaceStrong(const std::string& s, bool& changed) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s.compare(i, 2, "**") == 0) {
            size_t j = i + 2;
            while (j < s.size() && s[j] != '*') ++j;
            if (j > i + 2 && s.compare(j, 2, "**") == 0) {
                out += "<strong>";
                out.append(s, i + 2, j - i - 2);
                out += "</strong>";
                changed = true;
                i = j + 2;
                continue;
            }
        }
        out += s[i];
        ++i;
    }
    return out;
}

/// *x* -> <em>x</em>, where neither marker touches another '*'
std::string replaceEm(const std::string& s, bool& changed) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '*' && (i == 0 || s[i - 1] != '*')) {
            size_t j = i + 1;
            while (j < s.size() && s[j] != '*') ++j;
            bool closed = j < s.size() && j > i + 1;
            if (closed && (j + 1 == s.size() || s[j + 1] != '*')) {
                out += "<em>";
                out.append(s, i + 1, j - i - 1);
                out += "</em>";
                changed = true;
                i = j + 1;
                continue;
            }
        }
        out += s[i];
        ++i;
    }
    return out;
}

} // anonymous namespace

std::string escapeHtml(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            default:  result += c; break;
        }
    }
    return result;
}

std::optional<std::string> formatEmphasis(const std::string& text) {
    if (text.find('*') == std::string::npos) return std::nullopt;

    bool changed = false;
    std::string html = replaceStrong(escapeHtml(text), changed);
    html = replaceEm(html, changed);
    if (!changed) return std::nullopt;
    return html;
}

std::vector<ContentSegment> applyEmphasis(const std::vector<ContentSegment>& segments) {
    std::vector<ContentSegment> result;
    result.reserve(segments.size());
    int formatted = 0;
    for (const auto& seg : segments) {
        if (seg.kind == SegmentKind::Text && !seg.isSeparator()) {
            if (auto html = formatEmphasis(seg.content)) {
                result.push_back(ContentSegment::formatted(seg.content, *html));
                ++formatted;
                continue;
            }
        }
        result.push_back(seg);
    }
    if (formatted > 0) {
        MT_LOGD("applyEmphasis: %d text segments formatted", formatted);
    }
    return result;
}

} // namespace mathtext
