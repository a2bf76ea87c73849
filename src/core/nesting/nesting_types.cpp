#include "nesting_types.h"

namespace pn {
namespace nesting {

const char* unplacedReasonName(UnplacedReason reason) {
    switch (reason) {
    case UnplacedReason::TooLargeForAnySheet:
        return "too large for any sheet";
    case UnplacedReason::SheetsExhausted:
        return "sheets exhausted";
    case UnplacedReason::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

f32 NestingResult::totalPlacedArea() const {
    f32 total = 0.0f;
    for (const auto& usage : sheets) {
        total += usage.placedArea;
    }
    return total;
}

f32 NestingResult::totalSheetArea() const {
    f32 total = 0.0f;
    for (const auto& usage : sheets) {
        total += usage.sheetArea();
    }
    return total;
}

f32 NestingResult::overallUtilization() const {
    f32 sheetArea = totalSheetArea();
    return sheetArea > 0.0f ? totalPlacedArea() / sheetArea : 0.0f;
}

std::vector<PlacedPart> NestingResult::placementsOnSheet(int sheetIndex) const {
    std::vector<PlacedPart> onSheet;
    for (const auto& placement : placements) {
        if (placement.sheetIndex == sheetIndex) {
            onSheet.push_back(placement);
        }
    }
    return onSheet;
}

int NestingResult::countUnplaced(UnplacedReason reason) const {
    int count = 0;
    for (const auto& part : unplaced) {
        if (part.reason == reason) {
            ++count;
        }
    }
    return count;
}

} // namespace nesting
} // namespace pn
