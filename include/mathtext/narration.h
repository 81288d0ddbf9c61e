#pragma once

#include <string>

namespace mathtext {

/// Repair missing spacing in text destined for speech synthesis.
/// Applied in order:
///   1. "aB"  -> "a B"   (lowercase followed by uppercase)
///   2. ".a"  -> ". a"   (any of . , ! ? : ; followed by a letter)
///   3. "a("  -> "a ("
///   4. ")a"  -> ") a"
///   5. whitespace runs collapse to one space
///   6. trim
/// Idempotent; empty input gives empty output.
std::string normalizeNarrationText(const std::string& text);

} // namespace mathtext
