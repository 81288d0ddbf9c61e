#pragma once

#include "mathtext/segment.h"
#include <vector>

namespace mathtext {

/// Insert a single-space Text separator between adjacent non-math segments
/// that would otherwise run together. Boundaries next to Math are left
/// alone so inline math can abut punctuation.
std::vector<ContentSegment> normalizeSpacing(const std::vector<ContentSegment>& segments);

} // namespace mathtext
