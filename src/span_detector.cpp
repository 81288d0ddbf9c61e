#include "mathtext/span_detector.h"
#include "mathtext/segment.h"
#include "mathtext/log.h"
#include <algorithm>

namespace mathtext {

namespace {

/// Append a text span unless it is empty
void pushText(std::vector<MathSpan>& spans, const std::string& input,
              size_t start, size_t end) {
    if (end > start) {
        spans.push_back(MathSpan::plain(input.substr(start, end - start)));
    }
}

/// No '$' pair: split at the first trigger token
std::vector<MathSpan> detectUndelimited(const std::string& input) {
    std::vector<MathSpan> spans;
    auto trigger = findTrigger(input);
    if (!trigger) {
        pushText(spans, input, 0, input.size());
        return spans;
    }
    pushText(spans, input, 0, *trigger);
    // Everything after the trigger is math, trailing prose included
    spans.push_back(MathSpan::raw(input.substr(*trigger)));
    MT_LOGD("detectMathSpans: raw latex at %zu of %zu", *trigger, input.size());
    return spans;
}

} // anonymous namespace

const std::vector<std::string>& triggerTokens() {
    static const std::vector<std::string> tokens = {
        "\\left", "\\begin{", "\\frac", "\\sqrt", "\\(", "\\[",
        "\\pm", "\\times", "\\\\", "$",
    };
    return tokens;
}

std::optional<size_t> findTrigger(const std::string& text) {
    size_t best = std::string::npos;
    for (const auto& token : triggerTokens()) {
        size_t pos = text.find(token);
        if (pos < best) best = pos;
    }
    if (best == std::string::npos) return std::nullopt;
    return best;
}

bool hasUnpairedDollar(const std::string& text) {
    return std::count(text.begin(), text.end(), '$') % 2 != 0;
}

std::vector<MathSpan> detectMathSpans(const std::string& input) {
    std::vector<MathSpan> spans;
    size_t textStart = 0;
    size_t pos = 0;
    int pairs = 0;

    while (pos < input.size()) {
        size_t open = input.find('$', pos);
        if (open == std::string::npos) break;

        // $$...$$ display pair; an unclosed $$ falls through to single pairing
        if (input.compare(open, 2, "$$") == 0) {
            size_t close = input.find("$$", open + 2);
            if (close != std::string::npos) {
                std::string inner = trim(input.substr(open + 2, close - open - 2));
                if (!inner.empty()) {
                    pushText(spans, input, textStart, open);
                    spans.push_back(MathSpan::delimited(inner, true));
                    textStart = close + 2;
                }
                ++pairs;
                pos = close + 2;
                continue;
            }
        }

        size_t close = input.find('$', open + 1);
        if (close == std::string::npos) {
            MT_LOGD("detectMathSpans: unpaired '$' at %zu", open);
            break;
        }
        // A whitespace-only pair is not math; it stays inside the text run
        std::string inner = trim(input.substr(open + 1, close - open - 1));
        if (!inner.empty()) {
            pushText(spans, input, textStart, open);
            spans.push_back(MathSpan::delimited(inner));
            textStart = close + 1;
        }
        ++pairs;
        pos = close + 1;
    }

    if (pairs == 0) {
        return detectUndelimited(input);
    }

    // Unpaired remainder (including its '$') stays text
    pushText(spans, input, textStart, input.size());

    MT_LOGD("detectMathSpans: input=%zu pairs=%d spans=%zu",
            input.size(), pairs, spans.size());
    return spans;
}

} // namespace mathtext
