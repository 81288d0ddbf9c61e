#include "mathtext/latex_normalizer.h"
#include "mathtext/log.h"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace mathtext {

namespace {

bool isAsciiLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

struct CommandRepair {
    const char* broken;
    const char* fixed;
};

// Longer forms first: at any position the first matching entry wins
const CommandRepair kCorruptedCommands[] = {
    {"\\f\\frac", "\\frac"},
    {"\\f\\sqrt", "\\sqrt"},
    {"\x0c" "rac{", "\\frac{"},
    {"\t" "imes", "\\times"},
    {"frac{", "\\frac{"},
    {"sqrt{", "\\sqrt{"},
    {"sqrt[", "\\sqrt["},
    {"rac{", "\\frac{"},
    {"qrt{", "\\sqrt{"},
    {"qrt[", "\\sqrt["},
    {"sin{", "\\sin{"},
    {"cos{", "\\cos{"},
    {"tan{", "\\tan{"},
};

const CommandRepair kBareCommands[] = {
    {"imes", "\\times"},
    {"div", "\\div"},
    {"pm", "\\pm"},
    {"infty", "\\infty"},
    {"leq", "\\leq"},
    {"geq", "\\geq"},
    {"neq", "\\neq"},
    {"cdot", "\\cdot"},
    {"alpha", "\\alpha"},
    {"beta", "\\beta"},
    {"gamma", "\\gamma"},
    {"delta", "\\delta"},
    {"theta", "\\theta"},
};

/// Can `broken` be replaced at pos? Entries starting with a letter must not
/// continue a word or a command, entries ending in a letter must not run on
/// into another letter.
bool repairFitsAt(const std::string& s, size_t pos, const char* broken, size_t len) {
    if (s.compare(pos, len, broken) != 0) return false;
    if (isAsciiLetter(broken[0]) && pos > 0 &&
        (isAsciiLetter(s[pos - 1]) || s[pos - 1] == '\\')) {
        return false;
    }
    if (isAsciiLetter(broken[len - 1]) && pos + len < s.size() &&
        isAsciiLetter(s[pos + len])) {
        return false;
    }
    return true;
}

template <size_t N>
std::string applyRepairs(const std::string& s, const CommandRepair (&repairs)[N], int& count) {
    std::string out;
    out.reserve(s.size() + 8);
    for (size_t i = 0; i < s.size();) {
        bool replaced = false;
        for (const auto& repair : repairs) {
            size_t len = std::strlen(repair.broken);
            if (repairFitsAt(s, i, repair.broken, len)) {
                out += repair.fixed;
                i += len;
                ++count;
                replaced = true;
                break;
            }
        }
        if (!replaced) out += s[i++];
    }
    return out;
}

std::string toLowerAscii(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// Whitespace runs become one space; ends trimmed
std::string collapseSpaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (isSpace(c)) {
            if (!out.empty() && out.back() != ' ') out += ' ';
        } else {
            out += c;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

/// End of the first match of phrase in lower, where each ' ' in the phrase
/// matches a run of whitespace
size_t phraseEnd(const std::string& lower, const std::string& phrase) {
    for (size_t start = 0; start < lower.size(); ++start) {
        size_t i = start;
        size_t k = 0;
        while (k < phrase.size() && i < lower.size()) {
            if (phrase[k] == ' ') {
                if (!isSpace(lower[i])) break;
                while (i < lower.size() && isSpace(lower[i])) ++i;
            } else {
                if (lower[i] != phrase[k]) break;
                ++i;
            }
            ++k;
        }
        if (k == phrase.size()) return i;
    }
    return std::string::npos;
}

/// Full-width comma and Arabic semicolon count as commas
std::string unifySeparators(const std::string& s) {
    static const char* const kCommas[] = {"\xef\xbc\x8c", "\xd8\x9b"};
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool replaced = false;
        for (const char* comma : kCommas) {
            size_t len = std::strlen(comma);
            if (s.compare(i, len, comma) == 0) {
                out += ',';
                i += len;
                replaced = true;
                break;
            }
        }
        if (!replaced) out += s[i++];
    }
    return out;
}

std::vector<std::string> splitOn(const std::string& s, const char* separators) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find_first_of(separators, start);
        if (end == std::string::npos) end = s.size();
        std::string piece = collapseSpaces(s.substr(start, end - start));
        if (!piece.empty()) pieces.push_back(piece);
        start = end + 1;
    }
    return pieces;
}

/// Does a new equation start at pos: digits, a letter, word characters,
/// optional spaces, then '+' or '-'
bool startsEquation(const std::string& s, size_t pos) {
    size_t i = pos;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i >= s.size() || !isAsciiLetter(s[i])) return false;
    while (i < s.size() && isWordChar(s[i])) ++i;
    while (i < s.size() && s[i] == ' ') ++i;
    return i < s.size() && (s[i] == '+' || s[i] == '-');
}

/// Split "8x+3y=28 2x+y=8" between the equations. A space splits when the
/// last '=' is 1 to 20 characters back and a new equation starts after it.
std::vector<std::string> splitAtEquationStarts(const std::string& part) {
    std::vector<std::string> pieces;
    size_t start = 0;
    for (size_t i = 0; i < part.size(); ++i) {
        if (part[i] != ' ') continue;
        size_t eq = part.rfind('=', i);
        if (eq == std::string::npos || eq < start) continue;
        size_t gap = i - eq - 1;
        if (gap < 1 || gap > 20) continue;
        if (!startsEquation(part, i + 1)) continue;
        pieces.push_back(part.substr(start, i - start));
        start = i + 1;
    }
    pieces.push_back(part.substr(start));
    return pieces;
}

bool hasEquals(const std::string& s) {
    return s.find('=') != std::string::npos;
}

std::vector<std::string> collectEquations(const std::string& raw) {
    std::string text = unifySeparators(raw);
    std::vector<std::string> candidates;

    auto lines = splitOn(text, ";\n");
    if (lines.size() > 1 && std::any_of(lines.begin(), lines.end(), hasEquals)) {
        candidates = lines;
    } else {
        for (const auto& part : splitOn(collapseSpaces(text), ",")) {
            for (auto& piece : splitAtEquationStarts(part)) {
                candidates.push_back(std::move(piece));
            }
        }
    }

    std::vector<std::string> equations;
    for (auto& candidate : candidates) {
        if (hasEquals(candidate)) equations.push_back(std::move(candidate));
    }
    if (equations.size() < 2) equations.clear();
    return equations;
}

} // anonymous namespace

const std::vector<std::pair<std::string, std::string>>& unicodeLatexTable() {
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"±", "\\pm "}, {"×", "\\times "}, {"÷", "\\div "}, {"√", "\\sqrt "},
        {"∞", "\\infty "}, {"≤", "\\leq "}, {"≥", "\\geq "}, {"≠", "\\neq "},
        {"→", "\\rightarrow "}, {"←", "\\leftarrow "}, {"⇒", "\\Rightarrow "},
        {"∈", "\\in "}, {"∉", "\\notin "}, {"∪", "\\cup "}, {"∩", "\\cap "},
        {"⊂", "\\subset "}, {"⊆", "\\subseteq "},
        {"α", "\\alpha "}, {"β", "\\beta "}, {"γ", "\\gamma "}, {"δ", "\\delta "},
        {"θ", "\\theta "}, {"π", "\\pi "}, {"σ", "\\sigma "}, {"Σ", "\\Sigma "},
        {"φ", "\\phi "}, {"ω", "\\omega "},
        {"⁰", "^0"}, {"¹", "^1"}, {"²", "^2"}, {"³", "^3"}, {"⁴", "^4"},
        {"⁵", "^5"}, {"⁶", "^6"}, {"⁷", "^7"}, {"⁸", "^8"}, {"⁹", "^9"},
        {"₀", "_0"}, {"₁", "_1"}, {"₂", "_2"}, {"₃", "_3"}, {"₄", "_4"},
        {"₅", "_5"}, {"₆", "_6"}, {"₇", "_7"}, {"₈", "_8"}, {"₉", "_9"},
    };
    return table;
}

std::string convertUnicodeSymbols(const std::string& latex) {
    std::string out;
    out.reserve(latex.size() + 8);
    for (size_t i = 0; i < latex.size();) {
        // Every table key is multi-byte UTF-8
        if (static_cast<unsigned char>(latex[i]) < 0x80) {
            out += latex[i++];
            continue;
        }
        bool replaced = false;
        for (const auto& entry : unicodeLatexTable()) {
            if (latex.compare(i, entry.first.size(), entry.first) == 0) {
                out += entry.second;
                i += entry.first.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) out += latex[i++];
    }
    return out;
}

std::string repairCorruptedCommands(const std::string& text) {
    int count = 0;
    std::string result = applyRepairs(text, kCorruptedCommands, count);
    if (count > 0) {
        MT_LOGD("repairCorruptedCommands: restored %d commands", count);
    }
    return result;
}

std::string repairBareCommands(const std::string& latex) {
    int count = 0;
    std::string result = applyRepairs(latex, kBareCommands, count);
    if (count > 0) {
        MT_LOGD("repairBareCommands: restored %d commands", count);
    }
    return result;
}

std::string convertEquationSystem(const std::string& input) {
    if (input.find('$') != std::string::npos ||
        input.find("\\begin{cases}") != std::string::npos ||
        input.find("\\begin{aligned}") != std::string::npos ||
        input.find("\\left\\{") != std::string::npos) {
        return input;
    }

    static const char* const kSystemPhrases[] = {
        "solve the system of equations",
        "system of equations",
        "solve the following system",
        "solve",
    };

    std::string body = trim(input);
    std::string prefix;
    std::string lower = toLowerAscii(body);
    for (const char* phrase : kSystemPhrases) {
        size_t end = phraseEnd(lower, phrase);
        if (end == std::string::npos) continue;
        while (end < body.size() && isSpace(body[end])) ++end;
        if (end < body.size() && body[end] == ':') ++end;
        while (end < body.size() && isSpace(body[end])) ++end;
        prefix = body.substr(0, end);
        body = body.substr(end);
        break;
    }

    auto equations = collectEquations(body);
    if (equations.empty()) return input;

    std::string result = prefix;
    for (size_t i = 0; i < equations.size(); ++i) {
        if (i > 0) result += ", ";
        result += '$';
        result += equations[i];
        result += '$';
    }
    MT_LOGD("convertEquationSystem: stacked %zu equations", equations.size());
    return result;
}

std::string normalizeInput(const std::string& input) {
    return convertEquationSystem(repairCorruptedCommands(input));
}

std::string normalizeMathContent(const std::string& latex) {
    return repairBareCommands(convertUnicodeSymbols(latex));
}

std::vector<ContentSegment> normalizeMathSegments(const std::vector<ContentSegment>& segments) {
    std::vector<ContentSegment> result;
    result.reserve(segments.size());
    for (const auto& seg : segments) {
        ContentSegment copy = seg;
        if (copy.isMath()) {
            copy.content = normalizeMathContent(copy.content);
        }
        result.push_back(std::move(copy));
    }
    return result;
}

} // namespace mathtext
