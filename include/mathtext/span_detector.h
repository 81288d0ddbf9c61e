#pragma once

#include <string>
#include <vector>
#include <optional>

namespace mathtext {

/// A candidate span found by the detector, in reading order
struct MathSpan {
    bool isMath = false;
    std::string text;               // Delimiters stripped, otherwise verbatim
    bool explicitDelimiter = false; // Came from a $...$ or $$...$$ pair
    bool display = false;           // Came from a $$...$$ pair

    static MathSpan plain(const std::string& t) {
        return {false, t, false, false};
    }
    static MathSpan delimited(const std::string& t, bool display = false) {
        return {true, t, true, display};
    }
    static MathSpan raw(const std::string& t) {
        return {true, t, false, false};
    }
};

/// Fixed tokens whose presence signals raw, undelimited LaTeX
const std::vector<std::string>& triggerTokens();

/// Position of the earliest trigger token in text, if any
std::optional<size_t> findTrigger(const std::string& text);

/// True when the input holds an odd number of '$' characters
bool hasUnpairedDollar(const std::string& text);

/// Split a raw string into text and math candidates.
///
/// Paired $...$ (and $$...$$) delimiters are honoured first; an unpaired
/// trailing '$' leaves the remainder as text. When no pair exists, the
/// string is split at the first trigger token and everything from it to the
/// end becomes a single math candidate. Total over all inputs.
std::vector<MathSpan> detectMathSpans(const std::string& input);

} // namespace mathtext
