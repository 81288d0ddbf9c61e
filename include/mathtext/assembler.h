#pragma once

#include "mathtext/segment.h"
#include "mathtext/span_detector.h"
#include "mathtext/equation_grouper.h"
#include "mathtext/latex_normalizer.h"
#include "mathtext/latex_sanitizer.h"
#include "mathtext/display_mode.h"
#include "mathtext/emphasis.h"
#include "mathtext/spacing.h"
#include <string>
#include <vector>

namespace mathtext {

/// Pipeline switches
struct AssemblerOptions {
    bool forceDisplay = false;      // Every math segment renders as a block
    bool formatEmphasis = true;     // **bold** / *italic* become Formatted segments
    bool insertSeparators = true;   // Run the spacing pass
    bool repairLatex = true;        // Unicode symbols, lost backslashes, undelimited systems
};

/// Diagnostics raised while assembling. Informational only:
/// the segment list is complete either way.
enum class SegmentWarning {
    None,
    EmptyInput,
    UnbalancedDelimiter,   // Odd number of '$'; remainder kept as text
    UnmatchedLeft,         // \left without \right, left unrepaired
};

/// Result of assembling one raw string
struct AssemblyResult {
    std::vector<ContentSegment> segments;
    std::vector<SegmentWarning> warnings;

    bool hasWarning(SegmentWarning w) const;
};

/// Runs input repair, detection, grouping, math normalization, sanitizing,
/// display resolution, emphasis and spacing over a raw string. Holds
/// nothing but its options, so one instance can serve concurrent callers.
class SegmentAssembler {
public:
    SegmentAssembler() = default;
    explicit SegmentAssembler(const AssemblerOptions& options);

    /// Segment a single raw string
    AssemblyResult assemble(const std::string& input) const;

    /// Segment several raw strings as one run of content (e.g. the lines of a
    /// worked solution), spacing the boundaries between them
    AssemblyResult assembleParts(const std::vector<std::string>& parts) const;

    const AssemblerOptions& options() const { return options_; }

private:
    AssemblerOptions options_;

    /// Everything up to, but excluding, the spacing pass
    std::vector<ContentSegment> segmentsFor(const std::string& input,
                                            std::vector<SegmentWarning>& warnings) const;
};

/// Convenience wrapper: segments only
std::vector<ContentSegment> assembleSegments(const std::string& input,
                                             const AssemblerOptions& options = {});

const char* warningName(SegmentWarning warning);

} // namespace mathtext
