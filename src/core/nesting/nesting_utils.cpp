#include "nesting_utils.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>
#include <string>

namespace pn {
namespace nesting {

namespace {

bool isPositive(f32 value) {
    return std::isfinite(value) && value > 0.0f;
}

bool isNonNegative(f32 value) {
    return std::isfinite(value) && value >= 0.0f;
}

f32 longestSide(const Part& part) {
    return std::max(part.width, part.height);
}

i64 roundedKey(f32 value) {
    return static_cast<i64>(std::llround(static_cast<f64>(value) * 10000.0));
}

} // namespace

std::vector<Part> expandParts(const std::vector<Part>& parts) {
    std::vector<Part> expanded;
    std::map<std::string, int> nextInstance;

    for (const Part& part : parts) {
        for (int j = 0; j < part.quantity; ++j) {
            Part unit = part;
            unit.quantity = 1;
            unit.instance = nextInstance[part.id]++;
            expanded.push_back(std::move(unit));
        }
    }

    return expanded;
}

std::vector<SheetInstance> expandSheetInstances(const std::vector<SheetDefinition>& sheets) {
    std::vector<SheetInstance> instances;
    int sheetIndex = 0;
    for (int def = 0; def < static_cast<int>(sheets.size()); ++def) {
        const SheetDefinition& sheet = sheets[def];
        for (int q = 0; q < sheet.quantity; ++q) {
            instances.push_back({sheetIndex++, def, sheet.width, sheet.height});
        }
    }
    return instances;
}

Result<SheetInstance> findSheetInstance(const std::vector<SheetDefinition>& sheets,
                                        int sheetIndex) {
    if (sheetIndex < 0) {
        return std::nullopt;
    }
    int first = 0;
    for (int def = 0; def < static_cast<int>(sheets.size()); ++def) {
        const SheetDefinition& sheet = sheets[def];
        if (sheetIndex < first + sheet.quantity) {
            return SheetInstance{sheetIndex, def, sheet.width, sheet.height};
        }
        first += sheet.quantity;
    }
    return std::nullopt;
}

f32 usableLength(f32 length, f32 margin) {
    return std::max(0.0f, length - 2.0f * std::max(margin, 0.0f));
}

bool partFitsSheet(const Part& part, f32 sheetWidth, f32 sheetHeight, f32 margin) {
    f32 usableW = usableLength(sheetWidth, margin);
    f32 usableH = usableLength(sheetHeight, margin);

    if (part.width <= usableW + kPlacementEpsilon && part.height <= usableH + kPlacementEpsilon) {
        return true;
    }
    return part.rotationAllowed && part.height <= usableW + kPlacementEpsilon &&
           part.width <= usableH + kPlacementEpsilon;
}

bool partFitsAnySheet(const Part& part, const std::vector<SheetDefinition>& sheets, f32 margin) {
    return std::any_of(sheets.begin(), sheets.end(), [&](const SheetDefinition& sheet) {
        return partFitsSheet(part, sheet.width, sheet.height, margin);
    });
}

bool partPrecedes(const Part& a, const Part& b, PartOrder order) {
    switch (order) {
    case PartOrder::StrategyDefault:
    case PartOrder::InputOrder:
        return false;
    case PartOrder::AreaDescending:
        return a.area() > b.area();
    case PartOrder::HeightDescending:
        if (a.height != b.height) {
            return a.height > b.height;
        }
        return a.width > b.width;
    case PartOrder::WidthDescending:
        if (a.width != b.width) {
            return a.width > b.width;
        }
        return a.height > b.height;
    case PartOrder::LongestSideDescending: {
        f32 sideA = longestSide(a);
        f32 sideB = longestSide(b);
        if (sideA != sideB) {
            return sideA > sideB;
        }
        return a.area() > b.area();
    }
    }
    return false;
}

void sortParts(std::vector<Part>& parts, PartOrder order) {
    std::stable_sort(parts.begin(), parts.end(),
                     [order](const Part& a, const Part& b) { return partPrecedes(a, b, order); });
}

std::vector<usize> orderedIndices(const std::vector<Part>& parts, PartOrder order) {
    std::vector<usize> indices(parts.size());
    std::iota(indices.begin(), indices.end(), usize{0});
    std::stable_sort(indices.begin(), indices.end(), [&](usize a, usize b) {
        return partPrecedes(parts[a], parts[b], order);
    });
    return indices;
}

void validateJob(const std::vector<Part>& parts, const std::vector<SheetDefinition>& sheets,
                 const NestingConfig& config) {
    if (!isNonNegative(config.kerf)) {
        throw InvalidInputError("Kerf must be a non-negative number");
    }
    if (!isNonNegative(config.margin)) {
        throw InvalidInputError("Margin must be a non-negative number");
    }
    if (!isNonNegative(config.cutMergeTolerance)) {
        throw InvalidInputError("Cut merge tolerance must be a non-negative number");
    }
    if (sheets.empty()) {
        throw InvalidInputError("Job has no sheet definitions");
    }

    const SearchConfig& search = config.search;
    if (search.enabled) {
        if (search.populationSize < 2 || search.generations < 1) {
            throw InvalidInputError("Search needs a population of at least 2 and one generation");
        }
        if (!(search.mutationRate >= 0.0f && search.mutationRate <= 1.0f) ||
            !(search.crossoverRate >= 0.0f && search.crossoverRate <= 1.0f)) {
            throw InvalidInputError("Search rates must lie between 0 and 1");
        }
        if (search.eliteCount < 0 || search.eliteCount > search.populationSize ||
            search.tournamentSize < 1) {
            throw InvalidInputError("Search elite or tournament size out of range");
        }
    }

    for (usize i = 0; i < sheets.size(); ++i) {
        const SheetDefinition& sheet = sheets[i];
        if (!isPositive(sheet.width) || !isPositive(sheet.height)) {
            throw InvalidInputError("Sheet " + std::to_string(i) +
                                    " has non-positive dimensions");
        }
        if (sheet.quantity < 1) {
            throw InvalidInputError("Sheet " + std::to_string(i) +
                                    " must have a quantity of at least 1");
        }
    }

    for (const Part& part : parts) {
        if (part.id.empty()) {
            throw InvalidInputError("Part is missing an identifier");
        }
        if (!isPositive(part.width) || !isPositive(part.height)) {
            throw InvalidInputError("Part " + part.id + " has non-positive dimensions");
        }
        if (part.quantity < 1) {
            throw InvalidInputError("Part " + part.id + " must have a quantity of at least 1");
        }
    }
}

CutCountEstimate estimateCutCounts(const std::vector<PlacedPart>& placements) {
    std::set<i64> vertical;
    std::set<i64> horizontal;
    for (const auto& p : placements) {
        vertical.insert(roundedKey(p.x));
        vertical.insert(roundedKey(p.x + p.width));
        horizontal.insert(roundedKey(p.y));
        horizontal.insert(roundedKey(p.y + p.height));
    }
    return {static_cast<int>(vertical.size()), static_cast<int>(horizontal.size())};
}

} // namespace nesting
} // namespace pn
