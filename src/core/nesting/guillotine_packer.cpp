#include "guillotine_packer.h"

#include <algorithm>
#include <cmath>

#include "../utils/log.h"
#include "nesting_utils.h"

namespace pn {
namespace nesting {

namespace {

bool nearlyEqual(f32 a, f32 b, f32 tolerance) {
    return std::fabs(a - b) <= tolerance;
}

bool isUsable(const FreeRectangle& rect) {
    return rect.width > kPlacementEpsilon && rect.height > kPlacementEpsilon;
}

} // namespace

GuillotinePacker::GuillotinePacker(f32 sheetWidth, f32 sheetHeight, const NestingConfig& config,
                                   bool preferRipContinuation)
    : m_sheetWidth(sheetWidth), m_sheetHeight(sheetHeight), m_margin(config.margin),
      m_spacing(config.partSpacing()), m_ripTolerance(config.cutMergeTolerance),
      m_preferRipContinuation(preferRipContinuation),
      m_order(resolvePartOrder(config.strategy, config.partOrder)),
      m_heuristic(resolveFitHeuristic(config.fitHeuristic)) {}

SheetPlacement GuillotinePacker::pack(const std::vector<Part>& parts, const RunControl* control) {
    SheetPlacement result;
    m_freeRects.clear();
    m_placedBounds.clear();

    // Start with one free rectangle covering the usable sheet
    FreeRectangle usable(m_margin, m_margin, usableLength(m_sheetWidth, m_margin),
                         usableLength(m_sheetHeight, m_margin));
    if (isUsable(usable)) {
        m_freeRects.push_back(usable);
    }

    std::vector<bool> placed(parts.size(), false);

    for (usize idx : orderedIndices(parts, m_order)) {
        if (control && control->cancelled()) {
            result.cancelled = true;
            break;
        }

        const Part& part = parts[idx];
        Candidate best;
        if (!findBest(part, best)) {
            continue;
        }

        const FreeRectangle& rect = m_freeRects[best.rectIndex];
        PlacedPart placement;
        placement.partId = part.id;
        placement.instance = part.instance;
        placement.x = rect.x;
        placement.y = rect.y;
        placement.width = best.width;
        placement.height = best.height;
        placement.rotationDeg = best.rotationDeg;

        m_placedBounds.push_back(placement.bounds());
        result.placed.push_back(placement);
        placed[idx] = true;

        splitFreeRect(best.rectIndex, best.width, best.height);

        if (control && control->onPartPlaced) {
            control->onPartPlaced(placement);
        }
    }

    for (usize i = 0; i < parts.size(); ++i) {
        if (!placed[i]) {
            result.remaining.push_back(parts[i]);
        }
    }

    log::debugf(m_preferRipContinuation ? "CutOptimized" : "Guillotine",
                "Placed %zu of %zu parts, %zu free rectangles left", result.placed.size(),
                parts.size(), m_freeRects.size());
    return result;
}

bool GuillotinePacker::findBest(const Part& part, Candidate& best) const {
    bool found = false;

    for (usize i = 0; i < m_freeRects.size(); ++i) {
        const FreeRectangle& rect = m_freeRects[i];

        for (int rotation : {0, 90}) {
            if (rotation == 90 && (!part.rotationAllowed || part.width == part.height)) {
                continue;
            }

            Candidate candidate;
            candidate.rectIndex = i;
            candidate.rotationDeg = rotation;
            candidate.width = rotation == 90 ? part.height : part.width;
            candidate.height = rotation == 90 ? part.width : part.height;

            if (candidate.width > rect.width + kPlacementEpsilon ||
                candidate.height > rect.height + kPlacementEpsilon) {
                continue;
            }

            score(rect, candidate);
            if (!found || better(candidate, best)) {
                best = candidate;
                found = true;
            }
        }
    }

    return found;
}

void GuillotinePacker::score(const FreeRectangle& rect, Candidate& candidate) const {
    f32 leftoverW = std::max(0.0f, rect.width - candidate.width);
    f32 leftoverH = std::max(0.0f, rect.height - candidate.height);
    f32 shortSide = std::min(leftoverW, leftoverH);
    f32 longSide = std::max(leftoverW, leftoverH);

    switch (m_heuristic) {
    case FitHeuristic::StrategyDefault:
    case FitHeuristic::BestShortSideFit:
        candidate.primaryScore = shortSide;
        candidate.secondaryScore = longSide;
        break;
    case FitHeuristic::BestLongSideFit:
        candidate.primaryScore = longSide;
        candidate.secondaryScore = shortSide;
        break;
    case FitHeuristic::BestAreaFit:
        candidate.primaryScore = rect.area() - candidate.width * candidate.height;
        candidate.secondaryScore = shortSide;
        break;
    }

    candidate.ripRank = m_preferRipContinuation ? ripRank(rect.x, candidate.width) : 0;
}

// 0: same x-span as an accepted part (shares both rip lines)
// 1: one edge lands on an existing rip line
// 2: opens new rip lines
int GuillotinePacker::ripRank(f32 x, f32 width) const {
    int rank = 2;
    for (const Rect& bounds : m_placedBounds) {
        bool leftAligned = nearlyEqual(bounds.x, x, m_ripTolerance);
        bool rightAligned = nearlyEqual(bounds.right(), x + width, m_ripTolerance);
        if (leftAligned && rightAligned) {
            return 0;
        }
        if (leftAligned || rightAligned) {
            rank = 1;
        }
    }
    return rank;
}

bool GuillotinePacker::better(const Candidate& a, const Candidate& b) {
    if (a.ripRank != b.ripRank) {
        return a.ripRank < b.ripRank;
    }
    if (a.primaryScore != b.primaryScore) {
        return a.primaryScore < b.primaryScore;
    }
    return a.secondaryScore < b.secondaryScore;
}

void GuillotinePacker::splitFreeRect(usize rectIndex, f32 placedWidth, f32 placedHeight) {
    FreeRectangle rect = m_freeRects[rectIndex];

    // Space consumed by the part plus the cut beside/above it
    f32 usedWidth = std::min(placedWidth + m_spacing, rect.width);
    f32 usedHeight = std::min(placedHeight + m_spacing, rect.height);

    // Horizontal cut first: full-width strip above, short piece to the right
    FreeRectangle topWide(rect.x, rect.y + usedHeight, rect.width, rect.height - usedHeight);
    FreeRectangle rightShort(rect.x + usedWidth, rect.y, rect.width - usedWidth, placedHeight);

    // Vertical cut first: full-height strip to the right, short piece above
    FreeRectangle rightTall(rect.x + usedWidth, rect.y, rect.width - usedWidth, rect.height);
    FreeRectangle topNarrow(rect.x, rect.y + usedHeight, placedWidth, rect.height - usedHeight);

    auto largest = [](const FreeRectangle& a, const FreeRectangle& b) {
        f32 areaA = isUsable(a) ? a.area() : 0.0f;
        f32 areaB = isUsable(b) ? b.area() : 0.0f;
        return std::max(areaA, areaB);
    };

    // Keep the split that leaves the bigger single piece
    std::vector<FreeRectangle> pending;
    if (largest(topWide, rightShort) > largest(rightTall, topNarrow)) {
        pending = {topWide, rightShort};
    } else {
        pending = {rightTall, topNarrow};
    }

    m_freeRects.erase(m_freeRects.begin() + static_cast<long>(rectIndex));
    insertFreeRects(std::move(pending));
}

// Worklist insertion: each pending rectangle is dropped if another free
// rectangle already contains it, and evicts any rectangle it contains.
void GuillotinePacker::insertFreeRects(std::vector<FreeRectangle> pending) {
    while (!pending.empty()) {
        FreeRectangle candidate = pending.back();
        pending.pop_back();

        if (!isUsable(candidate)) {
            continue;
        }

        bool contained = std::any_of(m_freeRects.begin(), m_freeRects.end(),
                                     [&](const FreeRectangle& r) { return r.contains(candidate); });
        if (contained) {
            continue;
        }

        m_freeRects.erase(std::remove_if(m_freeRects.begin(), m_freeRects.end(),
                                         [&](const FreeRectangle& r) {
                                             return candidate.contains(r);
                                         }),
                          m_freeRects.end());
        m_freeRects.push_back(candidate);
    }
}

}  // namespace nesting
}  // namespace pn
