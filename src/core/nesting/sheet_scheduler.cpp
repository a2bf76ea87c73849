#include "sheet_scheduler.h"

#include <algorithm>

#include "../utils/log.h"
#include "nesting_strategy.h"
#include "nesting_utils.h"

namespace pn {
namespace nesting {

namespace {

UnplacedPart makeUnplaced(const Part& part, UnplacedReason reason) {
    return {part.id, part.instance, part.width, part.height, reason};
}

} // namespace

NestingResult MultiSheetScheduler::run(const std::vector<Part>& parts,
                                       const std::vector<SheetDefinition>& sheets,
                                       const NestingConfig& config,
                                       const RunControl* control) const {
    validateJob(parts, sheets, config);

    NestingResult result;
    std::vector<Part> instances = expandParts(parts);
    std::vector<SheetInstance> sheetInstances = expandSheetInstances(sheets);
    result.sheetsAvailable = static_cast<int>(sheetInstances.size());

    // Parts no configured sheet can hold are never attempted
    std::vector<Part> remaining;
    remaining.reserve(instances.size());
    for (const Part& part : instances) {
        if (partFitsAnySheet(part, sheets, config.margin)) {
            remaining.push_back(part);
        } else {
            log::warningf("Scheduler", "Part %s (%.1f x %.1f) is too large for any sheet",
                          part.id.c_str(), static_cast<double>(part.width),
                          static_cast<double>(part.height));
            result.unplaced.push_back(makeUnplaced(part, UnplacedReason::TooLargeForAnySheet));
        }
    }

    NestingProgress progress;
    progress.sheetsAvailable = result.sheetsAvailable;
    progress.partsTotal = static_cast<int>(instances.size());

    // Set only when the loop stops with sheet instances still unprocessed or
    // a strategy call broke off part way through a sheet
    bool stoppedEarly = false;

    for (const SheetInstance& sheet : sheetInstances) {
        if (remaining.empty()) {
            break;
        }
        if (control && control->cancelled()) {
            stoppedEarly = true;
            break;
        }

        bool anyFits = std::any_of(remaining.begin(), remaining.end(), [&](const Part& part) {
            return partFitsSheet(part, sheet.width, sheet.height, config.margin);
        });

        if (anyFits) {
            SheetPlacement placement =
                placeOnSheet(remaining, sheet.width, sheet.height, config, control);

            if (!placement.placed.empty()) {
                SheetUsage usage;
                usage.sheetIndex = sheet.sheetIndex;
                usage.definitionIndex = sheet.definitionIndex;
                usage.label = sheets[static_cast<usize>(sheet.definitionIndex)].label;
                usage.width = sheet.width;
                usage.height = sheet.height;

                for (PlacedPart& placed : placement.placed) {
                    placed.sheetIndex = sheet.sheetIndex;
                    usage.placedArea += placed.area();
                    ++usage.partCount;
                    result.placements.push_back(std::move(placed));
                }
                result.sheets.push_back(usage);
                progress.partsPlaced += usage.partCount;

                log::debugf("Scheduler", "Sheet %d (%.0f x %.0f): %d parts, %.1f%% used",
                            sheet.sheetIndex, static_cast<double>(sheet.width),
                            static_cast<double>(sheet.height), usage.partCount,
                            static_cast<double>(usage.utilization() * 100.0f));
            }
            remaining = std::move(placement.remaining);
            if (placement.cancelled) {
                stoppedEarly = true;
            }
        }

        ++progress.sheetsProcessed;
        if (control && control->onProgress) {
            control->onProgress(progress);
        }
    }

    if (!remaining.empty()) {
        bool cancelled = stoppedEarly;
        UnplacedReason reason =
            cancelled ? UnplacedReason::Cancelled : UnplacedReason::SheetsExhausted;
        for (const Part& part : remaining) {
            result.unplaced.push_back(makeUnplaced(part, reason));
        }
        result.cancelled = cancelled;
        result.sheetsExhausted = !cancelled;
    }

    log::debugf("Scheduler", "%s: placed %zu of %zu parts on %d of %d sheets (%.1f%% used)%s",
                strategyName(config.strategy), result.placements.size(), instances.size(),
                result.sheetsUsed(), result.sheetsAvailable,
                static_cast<double>(result.overallUtilization() * 100.0f),
                result.cancelled ? ", cancelled" : "");
    return result;
}

} // namespace nesting
} // namespace pn
