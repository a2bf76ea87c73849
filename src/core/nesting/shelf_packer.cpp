#include "shelf_packer.h"

#include <limits>

#include "../utils/log.h"
#include "nesting_utils.h"

namespace pn {
namespace nesting {

ShelfPacker::ShelfPacker(f32 sheetWidth, f32 sheetHeight, const NestingConfig& config)
    : m_left(config.margin), m_bottom(config.margin), m_right(sheetWidth - config.margin),
      m_top(sheetHeight - config.margin), m_spacing(config.partSpacing()),
      m_order(resolvePartOrder(Strategy::Shelf, config.partOrder)) {}

SheetPlacement ShelfPacker::pack(const std::vector<Part>& parts, const RunControl* control) {
    SheetPlacement result;
    m_shelves.clear();

    std::vector<bool> placed(parts.size(), false);

    if (m_right - m_left > 0.0f && m_top - m_bottom > 0.0f) {
        for (usize idx : orderedIndices(parts, m_order)) {
            if (control && control->cancelled()) {
                result.cancelled = true;
                break;
            }

            const Part& part = parts[idx];
            PlacedPart placement;
            if (placeOnOpenShelf(part, placement) || openShelf(part, placement)) {
                result.placed.push_back(placement);
                placed[idx] = true;
                if (control && control->onPartPlaced) {
                    control->onPartPlaced(placement);
                }
            }
        }
    }

    for (usize i = 0; i < parts.size(); ++i) {
        if (!placed[i]) {
            result.remaining.push_back(parts[i]);
        }
    }

    log::debugf("Shelf", "Placed %zu of %zu parts on %zu shelves", result.placed.size(),
                parts.size(), m_shelves.size());
    return result;
}

std::vector<ShelfPacker::Orientation> ShelfPacker::orientations(const Part& part) const {
    std::vector<Orientation> options;
    options.push_back({part.width, part.height, 0});
    if (part.rotationAllowed && part.width != part.height) {
        options.push_back({part.height, part.width, 90});
    }
    return options;
}

bool ShelfPacker::placeOnOpenShelf(const Part& part, PlacedPart& out) {
    Shelf* bestShelf = nullptr;
    Orientation bestOrientation{0.0f, 0.0f, 0};
    f32 bestWaste = std::numeric_limits<f32>::max();

    // Best fit across open shelves: least vertical space left above the part
    for (Shelf& shelf : m_shelves) {
        for (const Orientation& o : orientations(part)) {
            if (shelf.cursorX + o.width > m_right + kPlacementEpsilon ||
                o.height > shelf.height + kPlacementEpsilon) {
                continue;
            }
            f32 waste = shelf.height - o.height;
            if (waste < bestWaste) {
                bestWaste = waste;
                bestShelf = &shelf;
                bestOrientation = o;
            }
        }
    }

    if (!bestShelf) {
        return false;
    }

    out.partId = part.id;
    out.instance = part.instance;
    out.x = bestShelf->cursorX;
    out.y = bestShelf->y;
    out.width = bestOrientation.width;
    out.height = bestOrientation.height;
    out.rotationDeg = bestOrientation.rotationDeg;

    bestShelf->cursorX += bestOrientation.width + m_spacing;
    return true;
}

bool ShelfPacker::openShelf(const Part& part, PlacedPart& out) {
    f32 y = m_bottom;
    if (!m_shelves.empty()) {
        const Shelf& last = m_shelves.back();
        y = last.y + last.height + m_spacing;
    }

    // Upright first so the height-sorted order keeps shelves tall enough
    for (const Orientation& o : orientations(part)) {
        if (m_left + o.width > m_right + kPlacementEpsilon ||
            y + o.height > m_top + kPlacementEpsilon) {
            continue;
        }

        m_shelves.push_back({y, o.height, m_left + o.width + m_spacing});

        out.partId = part.id;
        out.instance = part.instance;
        out.x = m_left;
        out.y = y;
        out.width = o.width;
        out.height = o.height;
        out.rotationDeg = o.rotationDeg;
        return true;
    }

    return false;
}

}  // namespace nesting
}  // namespace pn
