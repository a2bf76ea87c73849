#include "cut_optimizer.h"

#include <algorithm>

#include "../utils/log.h"
#include "nesting_utils.h"

namespace pn {
namespace nesting {

namespace {

// Low/high edge of a part across the axis a cut line is positioned on
f32 lowEdge(const PlacedPart& p, CutOrientation orientation) {
    return orientation == CutOrientation::Rip ? p.x : p.y;
}

f32 highEdge(const PlacedPart& p, CutOrientation orientation) {
    return orientation == CutOrientation::Rip ? p.x + p.width : p.y + p.height;
}

} // namespace

const char* cutOrientationName(CutOrientation orientation) {
    return orientation == CutOrientation::Rip ? "rip" : "crosscut";
}

CutOptimizer::CutOptimizer(f32 mergeTolerance, f32 margin)
    : m_mergeTolerance(std::max(mergeTolerance, kPlacementEpsilon)),
      m_margin(std::max(margin, 0.0f)) {}

CutPlan CutOptimizer::optimize(const std::vector<PlacedPart>& placements, int sheetIndex,
                               f32 sheetWidth, f32 sheetHeight) const {
    CutPlan plan;
    plan.sheetIndex = sheetIndex;

    std::vector<PlacedPart> parts;
    for (const auto& p : placements) {
        if (p.sheetIndex == sheetIndex) {
            parts.push_back(p);
        }
    }
    if (parts.empty()) {
        return plan;
    }

    std::vector<f32> xs;
    std::vector<f32> ys;
    xs.reserve(parts.size() * 2);
    ys.reserve(parts.size() * 2);
    for (const auto& p : parts) {
        xs.push_back(p.x);
        xs.push_back(p.x + p.width);
        ys.push_back(p.y);
        ys.push_back(p.y + p.height);
    }

    // Rip first, then crosscut
    appendLines(plan, CutOrientation::Rip, mergePositions(std::move(xs)), parts, sheetWidth,
                usableLength(sheetHeight, m_margin));
    appendLines(plan, CutOrientation::Crosscut, mergePositions(std::move(ys)), parts,
                sheetHeight, usableLength(sheetWidth, m_margin));

    for (usize i = 0; i < plan.lines.size(); ++i) {
        plan.lines[i].order = static_cast<int>(i) + 1;
        plan.totalLength += plan.lines[i].length();
    }

    log::debugf("CutOptimizer", "Sheet %d: %d rips, %d crosscuts, %.1f total length",
                sheetIndex, plan.ripCount, plan.crosscutCount,
                static_cast<double>(plan.totalLength));
    return plan;
}

std::vector<CutPlan> CutOptimizer::optimizeAll(const NestingResult& result,
                                               const std::vector<SheetDefinition>& sheets) const {
    std::vector<CutPlan> plans;
    for (const SheetUsage& usage : result.sheets) {
        f32 width = usage.width;
        f32 height = usage.height;
        if (auto instance = findSheetInstance(sheets, usage.sheetIndex)) {
            width = instance->width;
            height = instance->height;
        }
        plans.push_back(optimize(result.placements, usage.sheetIndex, width, height));
    }
    return plans;
}

// Collapse sorted positions into clusters no wider than the tolerance; each
// cluster becomes one line through its middle.
std::vector<f32> CutOptimizer::mergePositions(std::vector<f32> positions) const {
    std::sort(positions.begin(), positions.end());

    std::vector<f32> merged;
    usize i = 0;
    while (i < positions.size()) {
        f32 low = positions[i];
        f32 high = low;
        usize j = i + 1;
        while (j < positions.size() && positions[j] - low <= m_mergeTolerance) {
            high = positions[j];
            ++j;
        }
        merged.push_back((low + high) * 0.5f);
        i = j;
    }
    return merged;
}

void CutOptimizer::appendLines(CutPlan& plan, CutOrientation orientation,
                               const std::vector<f32>& positions,
                               const std::vector<PlacedPart>& parts, f32 sheetExtent,
                               f32 sheetSpan) const {
    for (f32 position : positions) {
        // A line on the usable edge (the margin trim line) has nothing to separate
        f32 lowLimit = m_margin + m_mergeTolerance;
        f32 highLimit = sheetExtent - m_margin - m_mergeTolerance;
        if (position <= lowLimit || position >= highLimit) {
            continue;
        }

        CutLine line;
        line.sheetIndex = plan.sheetIndex;
        line.orientation = orientation;
        line.position = position;
        line.start = m_margin;
        line.end = m_margin + sheetSpan;

        bool touchesPart = false;
        for (const auto& p : parts) {
            f32 low = lowEdge(p, orientation);
            f32 high = highEdge(p, orientation);
            if (position >= low - m_mergeTolerance && position <= high + m_mergeTolerance) {
                touchesPart = true;
            }
            if (position > low + m_mergeTolerance && position < high - m_mergeTolerance) {
                line.partsCrossed.push_back(p.partId);
            }
        }
        if (!touchesPart) {
            continue;
        }

        if (orientation == CutOrientation::Rip) {
            ++plan.ripCount;
        } else {
            ++plan.crosscutCount;
        }
        plan.lines.push_back(std::move(line));
    }
}

} // namespace nesting
} // namespace pn
