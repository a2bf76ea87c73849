#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../types.h"

namespace pn {
namespace nesting {

// Placement heuristics. Selected by tag; see NestingStrategy.
enum class Strategy { Shelf, Guillotine, CutOptimized };

// Order in which remaining parts are offered to a strategy
enum class PartOrder {
    StrategyDefault,       // Shelf: HeightDescending, guillotine variants: AreaDescending
    AreaDescending,
    HeightDescending,      // Ties broken by width descending
    WidthDescending,       // Ties broken by height descending
    LongestSideDescending,
    InputOrder
};

// Free-rectangle scoring for the guillotine variants
enum class FitHeuristic {
    StrategyDefault, // BestShortSideFit
    BestShortSideFit,
    BestLongSideFit,
    BestAreaFit
};

inline constexpr f32 kDefaultCutMergeTolerance = 4.0f;

// Seeded genetic search over part order and preferred orientation, run on
// top of the selected strategy. Bounded by generation count; the same seed
// always yields the same layout.
struct SearchConfig {
    bool enabled = false;
    int populationSize = 24;
    int generations = 40;
    f32 mutationRate = 0.1f;
    f32 crossoverRate = 0.8f;
    int eliteCount = 2;
    int tournamentSize = 3;
    int stallGenerations = 20;      // Generations without improvement before stopping
    f32 targetUtilization = 0.95f;  // Stop once everything is placed at this utilization
    u32 seed = 1;
};

// Explicit per-job configuration. The core keeps no session defaults.
struct NestingConfig {
    Strategy strategy = Strategy::Guillotine;
    f32 kerf = 0.0f;   // Blade width consumed between parts
    f32 margin = 0.0f; // Reserved around parts and along sheet edges
    PartOrder partOrder = PartOrder::StrategyDefault;
    FitHeuristic fitHeuristic = FitHeuristic::StrategyDefault;
    f32 cutMergeTolerance = kDefaultCutMergeTolerance;
    bool deriveCuts = true;            // Guillotine variants only
    std::optional<f32> minSpacing;     // Quality warning threshold; defaults to kerf
    SearchConfig search;

    // Gap kept between two neighbouring parts
    f32 partSpacing() const { return kerf + margin; }
};

// Rejected job input (bad dimensions, empty sheet list, negative spacing...)
class InvalidInputError : public std::runtime_error {
  public:
    explicit InvalidInputError(const std::string& message) : std::runtime_error(message) {}
};

struct NestingProgress {
    int sheetsProcessed = 0;
    int sheetsAvailable = 0;
    int partsPlaced = 0;
    int partsTotal = 0;
};

struct PlacedPart;

using ProgressCallback = std::function<void(const NestingProgress&)>;
using PlacementCallback = std::function<void(const PlacedPart&)>;

// Optional caller hooks for long jobs. Every member may be empty.
struct RunControl {
    const std::atomic<bool>* cancel = nullptr;
    ProgressCallback onProgress;     // After each sheet instance
    PlacementCallback onPartPlaced;  // After each part a strategy accepts; may raise cancel

    bool cancelled() const { return cancel != nullptr && cancel->load(); }
};

// Name conversions (lower-case, underscore separated)
const char* strategyName(Strategy strategy);
const char* partOrderName(PartOrder order);
const char* fitHeuristicName(FitHeuristic heuristic);
std::optional<Strategy> parseStrategy(std::string_view name);
std::optional<PartOrder> parsePartOrder(std::string_view name);
std::optional<FitHeuristic> parseFitHeuristic(std::string_view name);

// Resolve StrategyDefault to the concrete choice for a strategy
PartOrder resolvePartOrder(Strategy strategy, PartOrder order);
FitHeuristic resolveFitHeuristic(FitHeuristic heuristic);

} // namespace nesting
} // namespace pn
