#pragma once

#include <vector>

#include "nesting_strategy.h"

namespace pn {
namespace nesting {

// Guillotine packing - every free rectangle is produced by straight through
// cuts, which is what a panel saw can actually execute.
// With preferRipContinuation set (the CutOptimized strategy) the best-fit
// comparator first favours placements that reuse an existing rip line.
class GuillotinePacker {
  public:
    GuillotinePacker(f32 sheetWidth, f32 sheetHeight, const NestingConfig& config,
                     bool preferRipContinuation);

    SheetPlacement pack(const std::vector<Part>& parts, const RunControl* control = nullptr);

    // Free list after the last pack() call
    const std::vector<FreeRectangle>& freeRectangles() const { return m_freeRects; }

  private:
    struct Candidate {
        usize rectIndex = 0;
        f32 width = 0.0f;
        f32 height = 0.0f;
        int rotationDeg = 0;
        int ripRank = 0;
        f32 primaryScore = 0.0f;
        f32 secondaryScore = 0.0f;
    };

    bool findBest(const Part& part, Candidate& best) const;
    void score(const FreeRectangle& rect, Candidate& candidate) const;
    int ripRank(f32 x, f32 width) const;
    static bool better(const Candidate& a, const Candidate& b);

    void splitFreeRect(usize rectIndex, f32 placedWidth, f32 placedHeight);
    void insertFreeRects(std::vector<FreeRectangle> pending);

    f32 m_sheetWidth, m_sheetHeight;
    f32 m_margin;
    f32 m_spacing;
    f32 m_ripTolerance;
    bool m_preferRipContinuation;
    PartOrder m_order;
    FitHeuristic m_heuristic;

    std::vector<FreeRectangle> m_freeRects;
    std::vector<Rect> m_placedBounds; // x-spans feed the rip continuation bias
};

}  // namespace nesting
}  // namespace pn
