#pragma once

#include <string>
#include <vector>

#include "nesting_config.h"
#include "nesting_types.h"

namespace pn {
namespace nesting {

enum class CutOrientation {
    Rip,     // Vertical line at x = position, spans the usable height
    Crosscut // Horizontal line at y = position, spans the usable width
};

const char* cutOrientationName(CutOrientation orientation);

struct CutLine {
    int sheetIndex = 0;
    CutOrientation orientation = CutOrientation::Rip;
    int order = 0; // 1-based production order
    f32 position = 0.0f;
    f32 start = 0.0f;
    f32 end = 0.0f;
    std::vector<std::string> partsCrossed; // Parts a full-length cut would pass through

    f32 length() const { return end - start; }
};

// Ordered cut list for one sheet instance
struct CutPlan {
    int sheetIndex = 0;
    std::vector<CutLine> lines;
    f32 totalLength = 0.0f;
    int ripCount = 0;
    int crosscutCount = 0;
};

// Derives the saw cuts implied by a finished layout: rips first, then
// crosscuts, each by increasing coordinate. Edges closer than the merge
// tolerance (a kerf apart, typically) collapse into one line. Report only;
// the result never feeds back into placement.
class CutOptimizer {
  public:
    explicit CutOptimizer(f32 mergeTolerance = kDefaultCutMergeTolerance, f32 margin = 0.0f);

    CutPlan optimize(const std::vector<PlacedPart>& placements, int sheetIndex, f32 sheetWidth,
                     f32 sheetHeight) const;

    // One plan per sheet instance that received parts
    std::vector<CutPlan> optimizeAll(const NestingResult& result,
                                     const std::vector<SheetDefinition>& sheets) const;

    f32 mergeTolerance() const { return m_mergeTolerance; }

  private:
    std::vector<f32> mergePositions(std::vector<f32> positions) const;
    void appendLines(CutPlan& plan, CutOrientation orientation,
                     const std::vector<f32>& positions, const std::vector<PlacedPart>& parts,
                     f32 sheetExtent, f32 sheetSpan) const;

    f32 m_mergeTolerance;
    f32 m_margin;
};

} // namespace nesting
} // namespace pn
