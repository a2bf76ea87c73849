#pragma once

#include <vector>

#include "nesting_strategy.h"

namespace pn {
namespace nesting {

// Shelf (skyline) packing: parts fill horizontal rows bottom to top.
// A shelf's height is fixed by the first part placed on it.
class ShelfPacker {
  public:
    ShelfPacker(f32 sheetWidth, f32 sheetHeight, const NestingConfig& config);

    SheetPlacement pack(const std::vector<Part>& parts, const RunControl* control = nullptr);

  private:
    struct Shelf {
        f32 y, height;
        f32 cursorX; // Left edge for the next part, spacing included
    };

    struct Orientation {
        f32 width, height;
        int rotationDeg;
    };

    bool placeOnOpenShelf(const Part& part, PlacedPart& out);
    bool openShelf(const Part& part, PlacedPart& out);
    std::vector<Orientation> orientations(const Part& part) const;

    f32 m_left, m_bottom, m_right, m_top;
    f32 m_spacing;
    PartOrder m_order;
    std::vector<Shelf> m_shelves;
};

}  // namespace nesting
}  // namespace pn
