#include "genetic_search.h"

#include <algorithm>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <utility>

#include "../utils/log.h"
#include "nesting_utils.h"
#include "sheet_scheduler.h"

namespace pn {
namespace nesting {

namespace {

constexpr usize kUnset = std::numeric_limits<usize>::max();

struct Genome {
    std::vector<usize> order;  // Indices into the expanded instances
    std::vector<bool> rotated; // Per instance: offer the part turned 90 degrees
    NestingResult result;
    SearchScore score;
    bool evaluated = false;
};

bool canTurn(const Part& part) {
    return part.rotationAllowed && part.width != part.height;
}

bool offeredTurned(const Part& part, bool rotated) {
    return rotated && canTurn(part);
}

std::vector<Part> offeredParts(const std::vector<Part>& instances, const Genome& genome) {
    std::vector<Part> offered;
    offered.reserve(genome.order.size());
    for (usize idx : genome.order) {
        Part part = instances[idx];
        if (offeredTurned(part, genome.rotated[idx])) {
            std::swap(part.width, part.height);
        }
        offered.push_back(std::move(part));
    }
    return offered;
}

// The scheduler renumbers instances by order of appearance; map them back and
// undo the pre-turn so rotation is relative to the part as defined.
void restoreIdentity(NestingResult& result, const std::vector<Part>& instances,
                     const Genome& genome) {
    std::map<std::pair<std::string, int>, usize> source;
    std::map<std::string, int> seen;
    for (usize idx : genome.order) {
        const std::string& id = instances[idx].id;
        source[{id, seen[id]++}] = idx;
    }

    for (PlacedPart& placed : result.placements) {
        auto it = source.find({placed.partId, placed.instance});
        if (it == source.end()) {
            continue;
        }
        const Part& part = instances[it->second];
        placed.instance = part.instance;
        if (offeredTurned(part, genome.rotated[it->second])) {
            placed.rotationDeg = placed.rotationDeg == 90 ? 0 : 90;
        }
    }

    for (UnplacedPart& unplaced : result.unplaced) {
        auto it = source.find({unplaced.partId, unplaced.instance});
        if (it == source.end()) {
            continue;
        }
        const Part& part = instances[it->second];
        unplaced.instance = part.instance;
        unplaced.width = part.width;
        unplaced.height = part.height;
    }
}

bool ranksBefore(const Genome& a, const Genome& b) {
    return a.score.betterThan(b.score);
}

const Genome& tournament(const std::vector<Genome>& population, int size,
                         std::mt19937_64& rng) {
    std::uniform_int_distribution<usize> pick(0, population.size() - 1);
    const Genome* winner = &population[pick(rng)];
    for (int i = 1; i < size; ++i) {
        const Genome& challenger = population[pick(rng)];
        if (ranksBefore(challenger, *winner)) {
            winner = &challenger;
        }
    }
    return *winner;
}

// Order crossover: a slice of one parent's order is kept in place and the
// gaps are filled in the other parent's order. Rotations mix gene by gene.
std::pair<Genome, Genome> crossover(const Genome& first, const Genome& second,
                                    std::mt19937_64& rng) {
    const usize n = first.order.size();
    std::uniform_int_distribution<usize> pick(0, n - 1);
    usize lo = pick(rng);
    usize hi = pick(rng);
    if (lo > hi) {
        std::swap(lo, hi);
    }

    auto orderChild = [&](const Genome& keep, const Genome& fill) {
        std::vector<usize> order(n, kUnset);
        std::vector<bool> used(n, false);
        for (usize i = lo; i <= hi; ++i) {
            order[i] = keep.order[i];
            used[keep.order[i]] = true;
        }
        usize next = 0;
        for (usize i = 0; i < n; ++i) {
            if (order[i] != kUnset) {
                continue;
            }
            while (used[fill.order[next]]) {
                ++next;
            }
            order[i] = fill.order[next];
            used[order[i]] = true;
        }
        return order;
    };

    Genome a;
    Genome b;
    a.order = orderChild(first, second);
    b.order = orderChild(second, first);
    a.rotated.resize(n);
    b.rotated.resize(n);

    std::bernoulli_distribution coin(0.5);
    for (usize i = 0; i < n; ++i) {
        bool mix = coin(rng);
        a.rotated[i] = mix ? second.rotated[i] : first.rotated[i];
        b.rotated[i] = mix ? first.rotated[i] : second.rotated[i];
    }
    return {std::move(a), std::move(b)};
}

void mutate(Genome& genome, const std::vector<Part>& instances, std::mt19937_64& rng) {
    const usize n = genome.order.size();
    std::uniform_int_distribution<usize> pick(0, n - 1);

    usize i = pick(rng);
    usize j = pick(rng);
    if (i == j) {
        j = (i + 1) % n;
    }
    std::swap(genome.order[i], genome.order[j]);

    usize flip = pick(rng);
    if (canTurn(instances[flip])) {
        genome.rotated[flip] = !genome.rotated[flip];
    }
}

} // namespace

bool SearchScore::betterThan(const SearchScore& other) const {
    if (unplaced != other.unplaced) {
        return unplaced < other.unplaced;
    }
    if (sheetsUsed != other.sheetsUsed) {
        return sheetsUsed < other.sheetsUsed;
    }
    return fitness > other.fitness;
}

GeneticSearch::GeneticSearch(const SearchConfig& config) : m_config(config) {}

SearchScore GeneticSearch::score(const NestingResult& result) {
    int cuts = 0;
    for (const SheetUsage& usage : result.sheets) {
        cuts += estimateCutCounts(result.placementsOnSheet(usage.sheetIndex)).total();
    }

    SearchScore s;
    s.unplaced = static_cast<int>(result.unplaced.size());
    s.sheetsUsed = result.sheetsUsed();
    s.fitness = result.overallUtilization() * 100.0f + 10.0f / (1.0f + static_cast<f32>(cuts)) +
                0.1f * static_cast<f32>(result.placements.size());
    return s;
}

NestingResult GeneticSearch::run(const std::vector<Part>& parts,
                                 const std::vector<SheetDefinition>& sheets,
                                 const NestingConfig& config, const RunControl* control,
                                 SearchSummary* summary) const {
    NestingConfig checked = config;
    checked.search = m_config;
    checked.search.enabled = true;
    validateJob(parts, sheets, checked);

    const std::vector<Part> instances = expandParts(parts);
    const usize n = instances.size();

    NestingConfig evalConfig = config;
    evalConfig.partOrder = PartOrder::InputOrder;
    evalConfig.search.enabled = false;

    // Trial runs see the cancel flag only
    RunControl trial;
    trial.cancel = control ? control->cancel : nullptr;

    SearchSummary local;
    local.seed = m_config.seed;

    auto evaluate = [&](Genome& genome) {
        genome.result =
            MultiSheetScheduler().run(offeredParts(instances, genome), sheets, evalConfig, &trial);
        genome.score = score(genome.result);
        genome.evaluated = true;
        ++local.evaluations;
    };

    auto seeded = [&](PartOrder order) {
        Genome genome;
        genome.order = orderedIndices(instances, order);
        genome.rotated.assign(n, false);
        return genome;
    };

    Genome best = seeded(resolvePartOrder(config.strategy, config.partOrder));
    evaluate(best);
    local.baseline = best.score;
    local.cancelled = best.result.cancelled;

    auto reachedTarget = [&](const Genome& genome) {
        return genome.result.countUnplaced(UnplacedReason::SheetsExhausted) == 0 &&
               genome.result.overallUtilization() >= m_config.targetUtilization;
    };

    if (n >= 2 && !local.cancelled && !reachedTarget(best)) {
        std::mt19937_64 rng(m_config.seed);
        std::uniform_real_distribution<f32> chance(0.0f, 1.0f);
        std::bernoulli_distribution coin(0.5);
        const usize populationSize = static_cast<usize>(m_config.populationSize);

        std::vector<Genome> population;
        population.push_back(best);
        for (PartOrder order : {PartOrder::AreaDescending, PartOrder::LongestSideDescending,
                                PartOrder::HeightDescending, PartOrder::WidthDescending,
                                PartOrder::InputOrder}) {
            if (population.size() >= populationSize) {
                break;
            }
            Genome genome = seeded(order);
            if (genome.order != best.order) {
                population.push_back(std::move(genome));
            }
        }
        while (population.size() < populationSize) {
            Genome genome;
            genome.order.resize(n);
            for (usize i = 0; i < n; ++i) {
                genome.order[i] = i;
            }
            std::shuffle(genome.order.begin(), genome.order.end(), rng);
            genome.rotated.resize(n);
            for (usize i = 0; i < n; ++i) {
                genome.rotated[i] = canTurn(instances[i]) && coin(rng);
            }
            population.push_back(std::move(genome));
        }

        for (Genome& genome : population) {
            if (local.cancelled) {
                break;
            }
            if (!genome.evaluated) {
                evaluate(genome);
                local.cancelled = genome.result.cancelled;
            }
        }

        int stall = 0;
        for (int generation = 0; generation < m_config.generations && !local.cancelled;
             ++generation) {
            std::stable_sort(population.begin(), population.end(), ranksBefore);

            const Genome& leader = population.front();
            if (leader.evaluated && !leader.result.cancelled && ranksBefore(leader, best)) {
                best = leader;
                stall = 0;
                log::debugf("Search", "Generation %d: %d unplaced, %d sheets, fitness %.2f",
                            generation, best.score.unplaced, best.score.sheetsUsed,
                            static_cast<double>(best.score.fitness));
            } else if (generation > 0) {
                ++stall;
            }
            if (reachedTarget(best) || stall >= m_config.stallGenerations) {
                break;
            }

            std::vector<Genome> next;
            next.reserve(populationSize);
            usize elites = std::min(static_cast<usize>(m_config.eliteCount), population.size());
            for (usize i = 0; i < elites; ++i) {
                next.push_back(population[i]);
            }

            while (next.size() < populationSize && !local.cancelled) {
                const Genome& first = tournament(population, m_config.tournamentSize, rng);
                const Genome& second = tournament(population, m_config.tournamentSize, rng);

                std::pair<Genome, Genome> children;
                if (chance(rng) < m_config.crossoverRate) {
                    children = crossover(first, second, rng);
                } else {
                    children = {first, second};
                }

                for (Genome* child : {&children.first, &children.second}) {
                    if (next.size() >= populationSize) {
                        break;
                    }
                    if (chance(rng) < m_config.mutationRate) {
                        mutate(*child, instances, rng);
                        child->evaluated = false;
                    }
                    if (!child->evaluated) {
                        evaluate(*child);
                        if (child->result.cancelled) {
                            local.cancelled = true;
                            break;
                        }
                    }
                    next.push_back(std::move(*child));
                }
            }

            population = std::move(next);
            ++local.generations;
        }

        // Last generation's offspring have not been ranked yet
        for (const Genome& genome : population) {
            if (genome.evaluated && !genome.result.cancelled && ranksBefore(genome, best)) {
                best = genome;
            }
        }
    }

    NestingResult result = std::move(best.result);
    restoreIdentity(result, instances, best);
    local.best = best.score;

    log::infof("Search", "Seed %u: %d generations, %d runs, %d unplaced on %d sheets "
               "(fitness %.2f, baseline %.2f)%s",
               local.seed, local.generations, local.evaluations, local.best.unplaced,
               local.best.sheetsUsed, static_cast<double>(local.best.fitness),
               static_cast<double>(local.baseline.fitness), local.cancelled ? ", cancelled" : "");

    if (summary) {
        *summary = local;
    }
    return result;
}

} // namespace nesting
} // namespace pn
