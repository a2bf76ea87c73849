#include "nesting_strategy.h"

#include <cmath>

#include "guillotine_packer.h"
#include "shelf_packer.h"

namespace pn {
namespace nesting {

SheetPlacement placeOnSheet(const std::vector<Part>& parts, f32 sheetWidth, f32 sheetHeight,
                            const NestingConfig& config, const RunControl* control) {
    if (!(std::isfinite(sheetWidth) && sheetWidth > 0.0f) ||
        !(std::isfinite(sheetHeight) && sheetHeight > 0.0f)) {
        throw InvalidInputError("Sheet dimensions must be positive");
    }
    if (!(config.kerf >= 0.0f) || !(config.margin >= 0.0f)) {
        throw InvalidInputError("Kerf and margin must be non-negative");
    }

    if (parts.empty()) {
        return {};
    }

    switch (config.strategy) {
    case Strategy::Shelf:
        return ShelfPacker(sheetWidth, sheetHeight, config).pack(parts, control);
    case Strategy::Guillotine:
        return GuillotinePacker(sheetWidth, sheetHeight, config, false).pack(parts, control);
    case Strategy::CutOptimized:
        return GuillotinePacker(sheetWidth, sheetHeight, config, true).pack(parts, control);
    }
    return GuillotinePacker(sheetWidth, sheetHeight, config, false).pack(parts, control);
}

} // namespace nesting
} // namespace pn
