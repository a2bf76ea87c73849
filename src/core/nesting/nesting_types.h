#pragma once

#include <string>
#include <utility>
#include <vector>

#include "../types.h"

namespace pn {
namespace nesting {

// A rectangular part to be cut. Quantities are expanded before nesting, so
// strategies only ever see instances with quantity 1.
struct Part {
    std::string id;
    f32 width = 0.0f;  // X dimension
    f32 height = 0.0f; // Y dimension
    bool rotationAllowed = false;
    int quantity = 1;
    int instance = 0; // Which unit of the quantity (set by expandParts)

    Part() = default;
    Part(std::string id_, f32 w, f32 h, bool canRotate = false, int qty = 1)
        : id(std::move(id_)), width(w), height(h), rotationAllowed(canRotate), quantity(qty) {}

    f32 area() const { return width * height; }
};

// A stock sheet definition; contributes `quantity` sheet instances to a job
struct SheetDefinition {
    f32 width = 0.0f;
    f32 height = 0.0f;
    int quantity = 1;
    int index = 0;     // Ordinal used to label output
    std::string label; // e.g. "Birch ply 18mm"

    SheetDefinition() = default;
    SheetDefinition(f32 w, f32 h, int qty = 1) : width(w), height(h), quantity(qty) {}

    f32 area() const { return width * height; }
};

// One physical sheet of a job, in consumption order
struct SheetInstance {
    int sheetIndex = 0;      // 0-based across the whole job
    int definitionIndex = 0; // Position in the SheetDefinition list
    f32 width = 0.0f;
    f32 height = 0.0f;
};

// Candidate empty region on a sheet. Owned by a single strategy call.
using FreeRectangle = Rect;

// A part positioned on a sheet instance
struct PlacedPart {
    std::string partId;
    int instance = 0;
    int sheetIndex = 0;
    f32 x = 0.0f; // Lower-left corner, measured from the sheet's lower-left corner
    f32 y = 0.0f;
    f32 width = 0.0f;  // After rotation
    f32 height = 0.0f; // After rotation
    int rotationDeg = 0; // 0 or 90

    Rect bounds() const { return {x, y, width, height}; }
    f32 area() const { return width * height; }

    // Dimensions as the part was defined, before rotation
    f32 originalWidth() const { return rotationDeg == 90 ? height : width; }
    f32 originalHeight() const { return rotationDeg == 90 ? width : height; }
};

enum class UnplacedReason {
    TooLargeForAnySheet, // Exceeds every configured sheet's usable area
    SheetsExhausted,     // Every sheet instance was consumed
    Cancelled            // Job was cancelled before the part was attempted
};

const char* unplacedReasonName(UnplacedReason reason);

struct UnplacedPart {
    std::string partId;
    int instance = 0;
    f32 width = 0.0f;
    f32 height = 0.0f;
    UnplacedReason reason = UnplacedReason::SheetsExhausted;
};

// Utilization of one consumed sheet instance
struct SheetUsage {
    int sheetIndex = 0;
    int definitionIndex = 0;
    std::string label; // Copied from the sheet definition
    f32 width = 0.0f;
    f32 height = 0.0f;
    f32 placedArea = 0.0f;
    int partCount = 0;

    f32 sheetArea() const { return width * height; }
    f32 wasteArea() const { return sheetArea() - placedArea; }
    f32 utilization() const { return sheetArea() > 0.0f ? placedArea / sheetArea() : 0.0f; }
};

// Complete result of one scheduler run
struct NestingResult {
    std::vector<PlacedPart> placements;
    std::vector<UnplacedPart> unplaced;
    std::vector<SheetUsage> sheets; // Only instances that received parts
    int sheetsAvailable = 0;
    bool sheetsExhausted = false;
    bool cancelled = false;

    int sheetsUsed() const { return static_cast<int>(sheets.size()); }
    bool isComplete() const { return unplaced.empty(); }

    f32 totalPlacedArea() const;
    f32 totalSheetArea() const;
    f32 overallUtilization() const;

    // Placements on one sheet instance, in placement order
    std::vector<PlacedPart> placementsOnSheet(int sheetIndex) const;
    int countUnplaced(UnplacedReason reason) const;
};

} // namespace nesting
} // namespace pn
