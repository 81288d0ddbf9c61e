#pragma once

#include "mathtext/segment.h"
#include <string>
#include <vector>
#include <optional>

namespace mathtext {

/// Escape & < > " for safe inclusion in markup
std::string escapeHtml(const std::string& text);

/// Convert markdown emphasis to markup: **bold** -> <strong>, *italic* -> <em>.
/// Returns nullopt if text has no complete marker pair.
std::optional<std::string> formatEmphasis(const std::string& text);

/// Replace Text segments carrying emphasis markers with Formatted segments.
/// Separators and Math segments are copied unchanged.
std::vector<ContentSegment> applyEmphasis(const std::vector<ContentSegment>& segments);

} // namespace mathtext
