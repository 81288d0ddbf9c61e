#pragma once

#include "mathtext/segment.h"
#include <string>
#include <vector>

namespace mathtext {

/// Repair fragile delimiter usage so the typesetter is less likely to fail.
///   1. \left{  ->  \left\{
///   2. \right not followed by . ) ] }  ->  \right.
/// Only real control words are touched: "\\right" (a row break followed by
/// the word "right") and "\rightarrow" are left alone. Idempotent.
std::string sanitizeLatex(const std::string& latex);

/// Sanitize the content of every Math segment; other segments are copied
std::vector<ContentSegment> sanitizeSegments(const std::vector<ContentSegment>& segments);

/// True when latex has no unterminated \right and no unescaped \left{
bool isBalancedLatex(const std::string& latex);

/// Number of \left control words without a matching \right.
/// The sanitizer does not repair these; callers may report them.
int countUnmatchedLeft(const std::string& latex);

} // namespace mathtext
