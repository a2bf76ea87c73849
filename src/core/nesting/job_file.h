#pragma once

#include <string>

#include "../types.h"
#include "nesting_engine.h"

namespace pn {
namespace nesting {

// JSON job documents in, JSON reports out.
//
// Job layout:
//   { "name": "...", "strategy": "guillotine", "kerf": 3, "margin": 0,
//     "part_order": "default", "fit_heuristic": "default",
//     "cut_merge_tolerance": 4, "derive_cuts": true, "min_spacing": 3,
//     "search": { "seed": 7, "generations": 40, "population": 24 },
//     "sheets": [ { "width": 2440, "height": 1220, "quantity": 2, "label": "" } ],
//     "parts":  [ { "id": "side", "width": 600, "height": 400, "quantity": 2,
//                   "rotation_allowed": true } ] }
//
// Only "sheets" and "parts" are required. "search" may also be a plain
// boolean, or an object with "enabled": false. Dimension checks are left to the
// engine so a job with bad numbers still loads and is rejected with a reason.
class JobFile {
  public:
    static Result<NestingJob> parse(const std::string& text,
                                    const std::string& fallbackName = "job");
    static Result<NestingJob> load(const Path& filePath);

    // Raw numbers only; formatting for display is the caller's business
    static std::string serializeReport(const NestingReport& report);
    static bool saveReport(const Path& filePath, const NestingReport& report);
};

} // namespace nesting
} // namespace pn
