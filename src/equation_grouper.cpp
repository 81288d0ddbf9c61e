#include "mathtext/equation_grouper.h"
#include "mathtext/log.h"

namespace mathtext {

namespace {

/// Trimmed concatenation of the text spans in [begin, end)
std::string collectText(const std::vector<MathSpan>& spans, size_t begin, size_t end) {
    std::string text;
    for (size_t i = begin; i < end; ++i) {
        if (!spans[i].isMath) text += spans[i].text;
    }
    return trim(text);
}

void pushTextIfAny(std::vector<ContentSegment>& segments, const std::string& text) {
    if (!text.empty()) {
        segments.push_back(ContentSegment::text(text));
    }
}

} // anonymous namespace

std::string alignEquation(const std::string& equation) {
    auto eq = equation.find('=');
    if (eq == std::string::npos) return equation;
    if (eq > 0 && equation[eq - 1] == '&') return equation;
    return equation.substr(0, eq) + "&" + equation.substr(eq);
}

std::string buildAlignedSystem(const std::vector<std::string>& rows) {
    std::string body;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) body += " \\\\ ";
        body += alignEquation(rows[i]);
    }
    return "\\left\\{\\begin{aligned} " + body + " \\end{aligned}\\right.";
}

std::vector<ContentSegment> groupEquations(const std::vector<MathSpan>& spans) {
    std::vector<ContentSegment> segments;

    size_t firstMath = spans.size();
    size_t lastMath = spans.size();
    int mathCount = 0;
    int explicitCount = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        if (!spans[i].isMath) continue;
        if (firstMath == spans.size()) firstMath = i;
        lastMath = i;
        ++mathCount;
        if (spans[i].explicitDelimiter) ++explicitCount;
    }

    if (mathCount == 0) {
        pushTextIfAny(segments, collectText(spans, 0, spans.size()));
        return segments;
    }

    pushTextIfAny(segments, collectText(spans, 0, firstMath));

    if (explicitCount >= 2) {
        // Text between the chunks only joins the equations and is dropped
        std::vector<std::string> rows;
        for (size_t i = firstMath; i <= lastMath; ++i) {
            if (spans[i].isMath) rows.push_back(trim(spans[i].text));
        }
        segments.push_back(ContentSegment::system(buildAlignedSystem(rows)));
        MT_LOGD("groupEquations: %zu rows grouped into aligned system", rows.size());
    } else {
        const auto& chunk = spans[firstMath];
        segments.push_back(ContentSegment::math(trim(chunk.text), chunk.display));
    }

    pushTextIfAny(segments, collectText(spans, lastMath + 1, spans.size()));
    return segments;
}

} // namespace mathtext
