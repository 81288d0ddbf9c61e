#pragma once

#include "mathtext/segment.h"
#include <string>
#include <vector>

namespace mathtext {

/// Caller-side layout preference for math segments
struct DisplayPolicy {
    /// Render every math segment as a centered block.
    /// There is no way to force an aligned system inline.
    bool forceDisplay = false;
};

/// True if latex needs block layout (\begin{ environment or \left delimiter)
bool needsDisplayMode(const std::string& latex);

/// Assign displayMode to every Math segment.
/// A segment already marked display (aligned system, $$...$$) stays display.
std::vector<ContentSegment> resolveDisplayModes(const std::vector<ContentSegment>& segments,
                                                const DisplayPolicy& policy = {});

} // namespace mathtext
