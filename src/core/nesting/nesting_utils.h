#pragma once

#include <vector>

#include "nesting_config.h"
#include "nesting_types.h"

namespace pn {
namespace nesting {

// Slack for float rounding when comparing a part against free space
inline constexpr f32 kPlacementEpsilon = 0.001f;

// Expand parts by quantity into individual instances, keeping input order.
// Instances are numbered per part id in order of appearance, so a list that
// was already expanded upstream (repeated ids, quantity 1) numbers the same way.
std::vector<Part> expandParts(const std::vector<Part>& parts);

// Expand sheet definitions into instances in declaration order
std::vector<SheetInstance> expandSheetInstances(const std::vector<SheetDefinition>& sheets);

// Sheet instance for a job-wide sheet index, if the index exists
Result<SheetInstance> findSheetInstance(const std::vector<SheetDefinition>& sheets,
                                        int sheetIndex);

// Usable size of a sheet after edge margins (never negative)
f32 usableLength(f32 length, f32 margin);

// Does the part fit the usable area, optionally rotated?
bool partFitsSheet(const Part& part, f32 sheetWidth, f32 sheetHeight, f32 margin);
bool partFitsAnySheet(const Part& part, const std::vector<SheetDefinition>& sheets, f32 margin);

// Ordering predicate for a resolved (non-default) part order
bool partPrecedes(const Part& a, const Part& b, PartOrder order);

// Stable sort of part instances, or of indices into them
void sortParts(std::vector<Part>& parts, PartOrder order);
std::vector<usize> orderedIndices(const std::vector<Part>& parts, PartOrder order);

// Throws InvalidInputError for malformed jobs
void validateJob(const std::vector<Part>& parts, const std::vector<SheetDefinition>& sheets,
                 const NestingConfig& config);

// Distinct vertical/horizontal part edges on one sheet (rounded to 1e-4)
struct CutCountEstimate {
    int vertical = 0;
    int horizontal = 0;
    int total() const { return vertical + horizontal; }
};
CutCountEstimate estimateCutCounts(const std::vector<PlacedPart>& placements);

} // namespace nesting
} // namespace pn
