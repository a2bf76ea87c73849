#pragma once

#include <vector>

#include "nesting_config.h"
#include "nesting_types.h"

namespace pn {
namespace nesting {

// How a scheduler result ranks during the search. Lower unplaced count wins,
// then fewer sheets, then higher fitness.
struct SearchScore {
    int unplaced = 0;
    int sheetsUsed = 0;
    f32 fitness = 0.0f; // 100 * utilization + 10 / (1 + distinct cut lines) + 0.1 * placed

    bool betterThan(const SearchScore& other) const;
};

struct SearchSummary {
    u32 seed = 0;
    int generations = 0; // Generations actually run
    int evaluations = 0; // Scheduler runs
    SearchScore baseline;   // The strategy's own part order
    SearchScore best;
    bool cancelled = false;
};

// Genetic search over the order parts are offered in and the orientation
// each rotatable part is offered in first. Every candidate is scored by a
// full MultiSheetScheduler run with PartOrder::InputOrder. The strategy's
// default ordering is always in the first generation and elites survive, so
// the result never ranks below a plain scheduler run.
class GeneticSearch {
  public:
    explicit GeneticSearch(const SearchConfig& config);

    // Throws InvalidInputError for malformed jobs. Placements come back with
    // the caller's instance numbering and true rotation.
    NestingResult run(const std::vector<Part>& parts, const std::vector<SheetDefinition>& sheets,
                      const NestingConfig& config, const RunControl* control = nullptr,
                      SearchSummary* summary = nullptr) const;

    static SearchScore score(const NestingResult& result);

  private:
    SearchConfig m_config;
};

} // namespace nesting
} // namespace pn
