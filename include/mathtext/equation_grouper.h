#pragma once

#include "mathtext/segment.h"
#include "mathtext/span_detector.h"
#include <string>
#include <vector>

namespace mathtext {

/// Put the alignment anchor on a single equation row:
/// the first '=' becomes "&=". Rows without '=' or already anchored
/// are returned unchanged.
std::string alignEquation(const std::string& equation);

/// Wrap rows as a left-braced aligned system:
/// \left\{\begin{aligned} r1 \\ r2 \end{aligned}\right.
std::string buildAlignedSystem(const std::vector<std::string>& rows);

/// Turn detector spans into segments.
///
/// Two or more delimited math chunks become one display-mode aligned system,
/// with the text before the first chunk and after the last one kept as
/// Text segments. A single math chunk becomes one Math segment between its
/// surrounding text. Without math, the trimmed text is a single Text segment.
std::vector<ContentSegment> groupEquations(const std::vector<MathSpan>& spans);

} // namespace mathtext
