#include "mathtext/latex_sanitizer.h"
#include "mathtext/log.h"
#include <cctype>
#include <cstring>

namespace mathtext {

namespace {

bool isAsciiLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

/// Does the control word `name` (without its backslash) start at pos?
/// The backslash must not itself be escaped, and the word must end there
/// (so "\left" does not match "\leftarrow").
bool isControlWordAt(const std::string& s, size_t pos, const char* name) {
    if (pos >= s.size() || s[pos] != '\\') return false;
    size_t len = std::strlen(name);
    if (s.compare(pos + 1, len, name) != 0) return false;
    size_t after = pos + 1 + len;
    if (after < s.size() && isAsciiLetter(s[after])) return false;

    size_t backslashes = 0;
    while (backslashes < pos && s[pos - 1 - backslashes] == '\\') ++backslashes;
    return backslashes % 2 == 0;
}

bool isRightDelimiter(char c) {
    return c == '.' || c == ')' || c == ']' || c == '}';
}

constexpr size_t kLeftLen = 5;   // "\left"
constexpr size_t kRightLen = 6;  // "\right"

} // anonymous namespace

std::string sanitizeLatex(const std::string& latex) {
    // Rule 1: escape the brace in \left{
    std::string escaped;
    escaped.reserve(latex.size() + 8);
    for (size_t i = 0; i < latex.size(); ++i) {
        if (isControlWordAt(latex, i, "left") &&
            i + kLeftLen < latex.size() && latex[i + kLeftLen] == '{') {
            escaped += "\\left\\{";
            i += kLeftLen;
            continue;
        }
        escaped += latex[i];
    }

    // Rule 2: close every bare \right with an empty delimiter
    std::string result;
    result.reserve(escaped.size() + 8);
    int repaired = 0;
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (isControlWordAt(escaped, i, "right")) {
            result.append(escaped, i, kRightLen);
            size_t after = i + kRightLen;
            if (after >= escaped.size() || !isRightDelimiter(escaped[after])) {
                result += '.';
                ++repaired;
            }
            i = after - 1;
            continue;
        }
        result += escaped[i];
    }

    if (repaired > 0 || escaped.size() != latex.size()) {
        MT_LOGD("sanitizeLatex: escaped=%zu closed=%d",
                (escaped.size() - latex.size()), repaired);
    }
    return result;
}

std::vector<ContentSegment> sanitizeSegments(const std::vector<ContentSegment>& segments) {
    std::vector<ContentSegment> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        ContentSegment copy = seg;
        if (copy.isMath()) {
            copy.content = sanitizeLatex(copy.content);
        }
        result.push_back(std::move(copy));
    }
    return result;
}

bool isBalancedLatex(const std::string& latex) {
    for (size_t i = 0; i < latex.size(); ++i) {
        if (isControlWordAt(latex, i, "left") &&
            i + kLeftLen < latex.size() && latex[i + kLeftLen] == '{') {
            return false;
        }
        if (isControlWordAt(latex, i, "right")) {
            size_t after = i + kRightLen;
            if (after >= latex.size() || !isRightDelimiter(latex[after])) return false;
        }
    }
    return true;
}

int countUnmatchedLeft(const std::string& latex) {
    int lefts = 0;
    int rights = 0;
    for (size_t i = 0; i < latex.size(); ++i) {
        if (isControlWordAt(latex, i, "left")) ++lefts;
        else if (isControlWordAt(latex, i, "right")) ++rights;
    }
    return lefts > rights ? lefts - rights : 0;
}

} // namespace mathtext
