#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cut_optimizer.h"
#include "genetic_search.h"
#include "nesting_config.h"
#include "nesting_types.h"
#include "quality_checker.h"

namespace pn {
namespace nesting {

// Everything needed to nest one job
struct NestingJob {
    std::string name;
    std::vector<Part> parts;
    std::vector<SheetDefinition> sheets;
    NestingConfig config;
};

struct NestingReport {
    std::string jobName;
    Strategy strategy = Strategy::Guillotine;
    NestingResult result;
    std::vector<CutPlan> cutPlans; // Empty for Shelf or when deriveCuts is off
    QualityReport quality;
    std::optional<SearchSummary> search; // Set when config.search was enabled
};

// Either a report or the reason the job was rejected
struct BatchOutcome {
    std::string jobName;
    std::optional<NestingReport> report;
    std::string error;

    bool ok() const { return report.has_value(); }
};

// Runs the full pipeline for a job: validate, schedule (or search), derive
// cuts, check.
class NestingEngine {
  public:
    // Throws InvalidInputError for malformed jobs
    NestingReport run(const NestingJob& job, const RunControl* control = nullptr) const;

    // Runs independent jobs concurrently. Outcomes come back in job order.
    // threads == 0 picks a count from the hardware.
    std::vector<BatchOutcome> runBatch(const std::vector<NestingJob>& jobs,
                                       size_t threads = 0) const;
};

// Best report by fewest unplaced parts, then fewest sheets, then highest
// utilization. Returns nullptr if no outcome holds a report.
const NestingReport* pickBestReport(const std::vector<BatchOutcome>& outcomes);

} // namespace nesting
} // namespace pn
