#pragma once

#include "mathtext/segment.h"
#include <string>
#include <utility>
#include <vector>

namespace mathtext {

/// Unicode math symbols (UTF-8) and the LaTeX that replaces them:
/// operators, relations, arrows, set symbols, Greek letters, and
/// superscript / subscript digits ("²" -> "^2", "₁" -> "_1").
const std::vector<std::pair<std::string, std::string>>& unicodeLatexTable();

/// Replace every symbol of unicodeLatexTable() in latex
std::string convertUnicodeSymbols(const std::string& latex);

/// Restore commands whose backslash was lost on the way in.
/// Only forms anchored by a following brace or bracket are touched, so the
/// repair is safe on prose:
///   rac{ / frac{  -> \frac{      qrt{ / sqrt{  -> \sqrt{   (also with [)
///   sin{ cos{ tan{ -> \sin{ ...   \f\frac / \f\sqrt -> \frac / \sqrt
///   <FF>rac{ -> \frac{            <TAB>imes -> \times
/// The last two undo "\f" and "\t" read as escape characters.
std::string repairCorruptedCommands(const std::string& text);

/// Restore the backslash on bare command words inside math:
/// imes, div, pm, infty, leq, geq, neq, cdot and the common Greek letters.
/// A word only matches when it is not part of a longer word and not
/// already a command.
std::string repairBareCommands(const std::string& latex);

/// Stack a linear system written without '$' delimiters.
///
/// Equations separated by ';', newlines or commas (or simply run together,
/// as in "8x+3y=28 2x+y=8") are rewritten as "$eq1$, $eq2$" so the grouper
/// builds the aligned system. A leading "Solve:" / "system of equations:"
/// phrase is kept as text. Input containing '$', \begin{cases},
/// \begin{aligned} or \left\{, or with fewer than two equations, is
/// returned unchanged.
std::string convertEquationSystem(const std::string& input);

/// Pre-detection pass over a raw string:
/// repairCorruptedCommands, then convertEquationSystem.
std::string normalizeInput(const std::string& input);

/// Per-math pass: convertUnicodeSymbols, then repairBareCommands. Idempotent.
std::string normalizeMathContent(const std::string& latex);

/// Apply normalizeMathContent to every Math segment; other segments are copied
std::vector<ContentSegment> normalizeMathSegments(const std::vector<ContentSegment>& segments);

} // namespace mathtext
