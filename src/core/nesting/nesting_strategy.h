#pragma once

#include <vector>

#include "nesting_config.h"
#include "nesting_types.h"

namespace pn {
namespace nesting {

// Outcome of one strategy call on one sheet instance.
// placed + remaining always equals the input parts, with no duplicates.
struct SheetPlacement {
    std::vector<PlacedPart> placed;  // sheetIndex left at 0; the scheduler tags it
    std::vector<Part> remaining;     // Input order preserved
    bool cancelled = false;          // Stopped on cancel before every part was tried
};

// Place as many parts as possible on a single sheet using the strategy named
// by config.strategy. Pure function of its arguments; free-space bookkeeping
// never escapes the call. Parts that do not fit are deferred to `remaining`.
// Throws InvalidInputError for non-positive sheet dimensions or negative spacing.
SheetPlacement placeOnSheet(const std::vector<Part>& parts, f32 sheetWidth, f32 sheetHeight,
                            const NestingConfig& config, const RunControl* control = nullptr);

} // namespace nesting
} // namespace pn
