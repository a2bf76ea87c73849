// panelnest - nest rectangular parts onto stock sheets from a JSON job file.
//
// Usage: panelnest JOB.json [REPORT.json] [options]
//   - REPORT.json receives the full placement/cut/quality report
//   - --compare runs every strategy in parallel and keeps the best layout
//   - --search enables the seeded part-order search (--seed, --generations)
//   - --kerf and --margin override the job file's values
//
// Exit codes: 0 all parts placed with no critical issues, 2 parts left
// unplaced (or critical quality issues), 1 invalid input or I/O failure.

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/nesting/job_file.h"
#include "core/nesting/nesting_engine.h"
#include "core/utils/log.h"
#include "core/utils/string_utils.h"

using namespace pn;
using namespace pn::nesting;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " JOB.json [REPORT.json] [options]\n"
              << "  --verbose, -v       debug logging\n"
              << "  --log FILE          mirror log output to FILE\n"
              << "  --compare           run every strategy and keep the best\n"
              << "  --search            search part order and orientation\n"
              << "  --seed N            search seed\n"
              << "  --generations N     search generation limit\n"
              << "  --kerf MM           override the job's kerf\n"
              << "  --margin MM         override the job's margin\n";
}

struct Overrides {
    bool search = false;
    std::optional<int> seed;
    std::optional<int> generations;
    std::optional<float> kerf;
    std::optional<float> margin;
};

void applyOverrides(const Overrides& overrides, NestingConfig& config) {
    if (overrides.search || overrides.seed || overrides.generations) {
        config.search.enabled = true;
    }
    if (overrides.seed) {
        config.search.seed = static_cast<u32>(*overrides.seed);
    }
    if (overrides.generations) {
        config.search.generations = *overrides.generations;
    }
    if (overrides.kerf) {
        config.kerf = *overrides.kerf;
    }
    if (overrides.margin) {
        config.margin = *overrides.margin;
    }
}

void printSummary(const NestingReport& report) {
    const NestingResult& result = report.result;
    char line[160];

    std::cout << "Job: " << report.jobName << " (" << strategyName(report.strategy) << ")\n";
    std::snprintf(line, sizeof(line), "Placed %zu parts on %d of %d sheets, %.1f%% utilization\n",
                  result.placements.size(), result.sheetsUsed(), result.sheetsAvailable,
                  static_cast<double>(result.overallUtilization() * 100.0f));
    std::cout << line;

    for (const auto& usage : result.sheets) {
        std::snprintf(line, sizeof(line), "  Sheet %d: %.0f x %.0f, %d parts, %.1f%% used",
                      usage.sheetIndex, static_cast<double>(usage.width),
                      static_cast<double>(usage.height), usage.partCount,
                      static_cast<double>(usage.utilization() * 100.0f));
        std::cout << line;
        if (!usage.label.empty()) {
            std::cout << " [" << usage.label << "]";
        }
        std::cout << "\n";
    }

    for (const auto& u : result.unplaced) {
        std::cout << "  Unplaced: " << u.partId << "#" << u.instance << " ("
                  << unplacedReasonName(u.reason) << ")\n";
    }

    for (const auto& plan : report.cutPlans) {
        std::snprintf(line, sizeof(line), "  Cuts on sheet %d: %d rips, %d crosscuts, %.0f total\n",
                      plan.sheetIndex, plan.ripCount, plan.crosscutCount,
                      static_cast<double>(plan.totalLength));
        std::cout << line;
    }

    if (report.search) {
        const SearchSummary& search = *report.search;
        std::snprintf(line, sizeof(line),
                      "Search (seed %u): %d generations, %d runs, fitness %.2f (baseline %.2f)\n",
                      search.seed, search.generations, search.evaluations,
                      static_cast<double>(search.best.fitness),
                      static_cast<double>(search.baseline.fitness));
        std::cout << line;
    }

    std::cout << "\n" << formatQualityReport(report.quality);
}

} // namespace

int main(int argc, char* argv[]) {
    log::setLevel(log::Level::Info);

    std::vector<std::string> positional;
    bool compare = false;
    Overrides overrides;

    // Value of an option that takes one argument, or nullptr if it is missing
    auto optionValue = [&](int& i) -> const char* {
        return i + 1 < argc ? argv[++i] : nullptr;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed" || arg == "--generations") {
            const char* text = optionValue(i);
            int value = 0;
            if (!text || !str::parseInt(text, value) || value < 0) {
                std::cerr << "Error: " << arg << " needs a non-negative integer\n";
                return 1;
            }
            (arg == "--seed" ? overrides.seed : overrides.generations) = value;
        } else if (arg == "--kerf" || arg == "--margin") {
            const char* text = optionValue(i);
            float value = 0.0f;
            if (!text || !str::parseFloat(text, value)) {
                std::cerr << "Error: " << arg << " needs a number\n";
                return 1;
            }
            (arg == "--kerf" ? overrides.kerf : overrides.margin) = value;
        } else if (arg == "--search") {
            overrides.search = true;
        } else if (arg == "--verbose" || arg == "-v") {
            log::setLevel(log::Level::Debug);
        } else if (arg == "--log") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            log::setLogFile(argv[++i]);
        } else if (arg == "--compare") {
            compare = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (str::startsWith(arg, "-")) {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        printUsage(argv[0]);
        return 1;
    }

    auto job = JobFile::load(positional[0]);
    if (!job) {
        std::cerr << "Error: could not load job " << positional[0] << "\n";
        return 1;
    }
    applyOverrides(overrides, job->config);

    NestingReport report;
    if (compare) {
        std::vector<NestingJob> variants;
        for (Strategy strategy : {Strategy::Shelf, Strategy::Guillotine, Strategy::CutOptimized}) {
            NestingJob variant = *job;
            variant.config.strategy = strategy;
            variants.push_back(std::move(variant));
        }

        auto outcomes = NestingEngine().runBatch(variants);
        const NestingReport* best = pickBestReport(outcomes);
        if (!best) {
            std::cerr << "Error: " << outcomes.front().error << "\n";
            return 1;
        }
        for (const auto& outcome : outcomes) {
            if (!outcome.report) {
                continue;
            }
            const NestingResult& result = outcome.report->result;
            char line[128];
            std::snprintf(line, sizeof(line), "%-14s %zu unplaced, %d sheets, %.1f%%\n",
                          strategyName(outcome.report->strategy), result.unplaced.size(),
                          result.sheetsUsed(),
                          static_cast<double>(result.overallUtilization() * 100.0f));
            std::cout << line;
        }
        std::cout << "\n";
        report = *best;
    } else {
        try {
            report = NestingEngine().run(*job);
        } catch (const InvalidInputError& e) {
            std::cerr << "Error: invalid job: " << e.what() << "\n";
            return 1;
        }
    }

    printSummary(report);

    if (positional.size() > 1 && !JobFile::saveReport(positional[1], report)) {
        std::cerr << "Error: could not write report " << positional[1] << "\n";
        return 1;
    }

    log::closeLogFile();

    if (!report.result.isComplete() || report.quality.hasCritical()) {
        return 2;
    }
    return 0;
}
