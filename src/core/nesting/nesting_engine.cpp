#include "nesting_engine.h"

#include "../threading/thread_pool.h"
#include "../utils/log.h"
#include "sheet_scheduler.h"

namespace pn {
namespace nesting {

NestingReport NestingEngine::run(const NestingJob& job, const RunControl* control) const {
    const NestingConfig& config = job.config;

    NestingReport report;
    report.jobName = job.name;
    report.strategy = config.strategy;
    if (config.search.enabled) {
        SearchSummary summary;
        report.result =
            GeneticSearch(config.search).run(job.parts, job.sheets, config, control, &summary);
        report.search = summary;
    } else {
        report.result = MultiSheetScheduler().run(job.parts, job.sheets, config, control);
    }

    const NestingResult& result = report.result;
    log::infof("Engine", "Job '%s' (%s%s): placed %zu, unplaced %zu, %d of %d sheets, %.1f%% used",
               job.name.c_str(), strategyName(config.strategy),
               config.search.enabled ? " + search" : "", result.placements.size(),
               result.unplaced.size(), result.sheetsUsed(), result.sheetsAvailable,
               static_cast<double>(result.overallUtilization() * 100.0f));

    if (config.deriveCuts && config.strategy != Strategy::Shelf) {
        CutOptimizer cuts(config.cutMergeTolerance, config.margin);
        report.cutPlans = cuts.optimizeAll(report.result, job.sheets);
    }

    QualityOptions options;
    options.minSpacing = config.minSpacing.value_or(config.kerf);
    report.quality = QualityChecker(options).check(report.result, job.sheets, config.margin,
                                                   job.parts);
    return report;
}

std::vector<BatchOutcome> NestingEngine::runBatch(const std::vector<NestingJob>& jobs,
                                                  size_t threads) const {
    std::vector<BatchOutcome> outcomes(jobs.size());
    if (jobs.empty()) {
        return outcomes;
    }

    size_t workers = workerCountFor(jobs.size(), threads);
    log::infof("Engine", "Running %zu jobs on %zu threads", jobs.size(), workers);

    {
        ThreadPool pool(workers);
        for (size_t i = 0; i < jobs.size(); ++i) {
            // Each task writes only its own slot
            pool.enqueue([this, &jobs, &outcomes, i] {
                BatchOutcome& outcome = outcomes[i];
                outcome.jobName = jobs[i].name;
                try {
                    outcome.report = run(jobs[i]);
                } catch (const InvalidInputError& e) {
                    outcome.error = e.what();
                    log::errorf("Engine", "Job '%s' rejected: %s", jobs[i].name.c_str(), e.what());
                }
            });
        }
        pool.waitIdle();
        pool.shutdown();
    }

    return outcomes;
}

const NestingReport* pickBestReport(const std::vector<BatchOutcome>& outcomes) {
    const NestingReport* best = nullptr;
    for (const auto& outcome : outcomes) {
        if (!outcome.report) {
            continue;
        }
        const NestingReport& candidate = *outcome.report;
        if (!best) {
            best = &candidate;
            continue;
        }

        const NestingResult& a = candidate.result;
        const NestingResult& b = best->result;
        if (a.unplaced.size() != b.unplaced.size()) {
            if (a.unplaced.size() < b.unplaced.size()) {
                best = &candidate;
            }
        } else if (a.sheetsUsed() != b.sheetsUsed()) {
            if (a.sheetsUsed() < b.sheetsUsed()) {
                best = &candidate;
            }
        } else if (a.overallUtilization() > b.overallUtilization()) {
            best = &candidate;
        }
    }
    return best;
}

} // namespace nesting
} // namespace pn
