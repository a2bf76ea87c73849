#pragma once

#include <vector>

#include "nesting_config.h"
#include "nesting_types.h"

namespace pn {
namespace nesting {

// Drives one strategy across the ordered stack of sheet instances.
//
// Sheet definitions are expanded into `quantity` instances each and consumed
// in declaration order. Every instance receives the parts still remaining;
// the run stops as soon as nothing is left, so no sheet is wasted. Parts that
// exceed every sheet's usable area are reported as TooLargeForAnySheet and
// never attempted; parts left when the stack runs out are SheetsExhausted.
class MultiSheetScheduler {
  public:
    // Throws InvalidInputError before any strategy runs if the job is malformed.
    NestingResult run(const std::vector<Part>& parts, const std::vector<SheetDefinition>& sheets,
                      const NestingConfig& config, const RunControl* control = nullptr) const;
};

} // namespace nesting
} // namespace pn
