#include "mathtext/narration.h"
#include "mathtext/segment.h"
#include "mathtext/log.h"

namespace mathtext {

namespace {

// ASCII classification only: bytes of multi-byte UTF-8 sequences are >= 0x80
// and never count as letters, so they pass through untouched.
bool isLower(char c) { return c >= 'a' && c <= 'z'; }
bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool isLetter(char c) { return isLower(c) || isUpper(c); }

bool isClausePunct(char c) {
    return c == '.' || c == ',' || c == '!' || c == '?' || c == ':' || c == ';';
}

/// Insert a space between s[i-1] and s[i] wherever split(s[i-1], s[i]) holds
template <typename Pred>
std::string insertSpaces(const std::string& s, Pred split) {
    std::string out;
    out.reserve(s.size() + 8);
    for (size_t i = 0; i < s.size(); ++i) {
        if (i > 0 && split(s[i - 1], s[i])) out += ' ';
        out += s[i];
    }
    return out;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool inSpace = false;
    for (char c : s) {
        if (isSpace(c)) {
            if (!inSpace) out += ' ';
            inSpace = true;
        } else {
            out += c;
            inSpace = false;
        }
    }
    return out;
}

} // anonymous namespace

std::string normalizeNarrationText(const std::string& text) {
    if (text.empty()) return "";

    std::string result = insertSpaces(text, [](char a, char b) {
        return isLower(a) && isUpper(b);
    });
    result = insertSpaces(result, [](char a, char b) {
        return isClausePunct(a) && isLetter(b);
    });
    result = insertSpaces(result, [](char a, char b) {
        return isLetter(a) && b == '(';
    });
    result = insertSpaces(result, [](char a, char b) {
        return a == ')' && isLetter(b);
    });
    result = trim(collapseWhitespace(result));
    MT_LOGD("normalizeNarrationText: %zu -> %zu bytes", text.size(), result.size());
    return result;
}

} // namespace mathtext
