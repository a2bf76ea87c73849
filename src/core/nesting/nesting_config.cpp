#include "nesting_config.h"

#include "../utils/string_utils.h"

namespace pn {
namespace nesting {

const char* strategyName(Strategy strategy) {
    switch (strategy) {
    case Strategy::Shelf:
        return "shelf";
    case Strategy::Guillotine:
        return "guillotine";
    case Strategy::CutOptimized:
        return "cut_optimized";
    }
    return "guillotine";
}

const char* partOrderName(PartOrder order) {
    switch (order) {
    case PartOrder::StrategyDefault:
        return "default";
    case PartOrder::AreaDescending:
        return "area_desc";
    case PartOrder::HeightDescending:
        return "height_desc";
    case PartOrder::WidthDescending:
        return "width_desc";
    case PartOrder::LongestSideDescending:
        return "longest_side_desc";
    case PartOrder::InputOrder:
        return "input";
    }
    return "default";
}

const char* fitHeuristicName(FitHeuristic heuristic) {
    switch (heuristic) {
    case FitHeuristic::StrategyDefault:
        return "default";
    case FitHeuristic::BestShortSideFit:
        return "best_short_side";
    case FitHeuristic::BestLongSideFit:
        return "best_long_side";
    case FitHeuristic::BestAreaFit:
        return "best_area";
    }
    return "default";
}

std::optional<Strategy> parseStrategy(std::string_view name) {
    std::string key = str::normalizeKey(name);
    if (key == "shelf" || key == "skyline") {
        return Strategy::Shelf;
    }
    if (key == "guillotine") {
        return Strategy::Guillotine;
    }
    if (key == "cut_optimized" || key == "cutoptimized") {
        return Strategy::CutOptimized;
    }
    return std::nullopt;
}

std::optional<PartOrder> parsePartOrder(std::string_view name) {
    std::string key = str::normalizeKey(name);
    for (PartOrder order : {PartOrder::StrategyDefault, PartOrder::AreaDescending,
                            PartOrder::HeightDescending, PartOrder::WidthDescending,
                            PartOrder::LongestSideDescending, PartOrder::InputOrder}) {
        if (key == partOrderName(order)) {
            return order;
        }
    }
    return std::nullopt;
}

std::optional<FitHeuristic> parseFitHeuristic(std::string_view name) {
    std::string key = str::normalizeKey(name);
    for (FitHeuristic heuristic : {FitHeuristic::StrategyDefault, FitHeuristic::BestShortSideFit,
                                   FitHeuristic::BestLongSideFit, FitHeuristic::BestAreaFit}) {
        if (key == fitHeuristicName(heuristic)) {
            return heuristic;
        }
    }
    return std::nullopt;
}

PartOrder resolvePartOrder(Strategy strategy, PartOrder order) {
    if (order != PartOrder::StrategyDefault) {
        return order;
    }
    return strategy == Strategy::Shelf ? PartOrder::HeightDescending
                                       : PartOrder::AreaDescending;
}

FitHeuristic resolveFitHeuristic(FitHeuristic heuristic) {
    return heuristic == FitHeuristic::StrategyDefault ? FitHeuristic::BestShortSideFit
                                                      : heuristic;
}

} // namespace nesting
} // namespace pn
