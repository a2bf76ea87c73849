// PanelNest - Nesting Engine Tests

#include <gtest/gtest.h>

#include <atomic>

#include "core/nesting/nesting_engine.h"

using namespace pn::nesting;

namespace {

NestingJob makeJob(const std::string& name, Strategy strategy) {
    NestingJob job;
    job.name = name;
    job.parts = {Part("side", 600.0f, 400.0f, true, 2), Part("shelf", 560.0f, 300.0f, false, 3),
                 Part("back", 800.0f, 600.0f, false, 1)};
    job.sheets = {SheetDefinition(1220.0f, 2440.0f, 2)};
    job.config.strategy = strategy;
    job.config.kerf = 3.0f;
    job.config.margin = 5.0f;
    return job;
}

} // namespace

TEST(NestingEngine, RunsFullPipeline) {
    NestingReport report = NestingEngine().run(makeJob("cabinet", Strategy::Guillotine));

    EXPECT_EQ(report.jobName, "cabinet");
    EXPECT_EQ(report.strategy, Strategy::Guillotine);
    EXPECT_TRUE(report.result.isComplete());
    EXPECT_EQ(report.result.placements.size(), 6u);
    EXPECT_EQ(report.cutPlans.size(), static_cast<size_t>(report.result.sheetsUsed()));
    EXPECT_FALSE(report.quality.hasCritical());
    EXPECT_FLOAT_EQ(report.quality.score, 100.0f);
}

TEST(NestingEngine, ShelfSkipsCutDerivation) {
    NestingReport report = NestingEngine().run(makeJob("cabinet", Strategy::Shelf));

    EXPECT_TRUE(report.result.isComplete());
    EXPECT_TRUE(report.cutPlans.empty());
    EXPECT_FALSE(report.quality.hasCritical());
}

TEST(NestingEngine, DeriveCutsCanBeDisabled) {
    NestingJob job = makeJob("cabinet", Strategy::CutOptimized);
    job.config.deriveCuts = false;

    NestingReport report = NestingEngine().run(job);

    EXPECT_TRUE(report.cutPlans.empty());
    EXPECT_TRUE(report.result.isComplete());
}

TEST(NestingEngine, SpacingWarningThresholdDefaultsToKerf) {
    NestingJob job = makeJob("cabinet", Strategy::Guillotine);
    job.config.minSpacing = 50.0f;

    NestingReport strict = NestingEngine().run(job);
    EXPECT_GT(strict.quality.count(IssueSeverity::Warning), 0);

    job.config.minSpacing.reset();
    NestingReport relaxed = NestingEngine().run(job);
    EXPECT_EQ(relaxed.quality.count(IssueSeverity::Warning), 0);
}

TEST(NestingEngine, RejectsInvalidJob) {
    NestingJob job = makeJob("bad", Strategy::Guillotine);
    job.sheets.clear();

    EXPECT_THROW(NestingEngine().run(job), InvalidInputError);
}

TEST(NestingEngine, CancelledRunStillChecksCleanly) {
    std::atomic<bool> cancel{true};
    RunControl control;
    control.cancel = &cancel;

    NestingReport report = NestingEngine().run(makeJob("cabinet", Strategy::Guillotine), &control);

    EXPECT_TRUE(report.result.cancelled);
    EXPECT_EQ(report.result.countUnplaced(UnplacedReason::Cancelled), 6);
    // Every instance is still accounted for
    EXPECT_FALSE(report.quality.hasCritical());
}

TEST(NestingEngine, BatchKeepsJobOrder) {
    std::vector<NestingJob> jobs = {makeJob("shelf", Strategy::Shelf),
                                    makeJob("guillotine", Strategy::Guillotine),
                                    makeJob("cut", Strategy::CutOptimized)};

    auto outcomes = NestingEngine().runBatch(jobs, 2);

    ASSERT_EQ(outcomes.size(), 3u);
    for (size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_EQ(outcomes[i].jobName, jobs[i].name);
        ASSERT_TRUE(outcomes[i].ok());
        EXPECT_EQ(outcomes[i].report->strategy, jobs[i].config.strategy);
        EXPECT_TRUE(outcomes[i].report->result.isComplete());
    }
}

TEST(NestingEngine, BatchReportsRejectedJobs) {
    NestingJob bad = makeJob("bad", Strategy::Guillotine);
    bad.config.kerf = -1.0f;
    std::vector<NestingJob> jobs = {makeJob("good", Strategy::Guillotine), bad};

    auto outcomes = NestingEngine().runBatch(jobs);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_FALSE(outcomes[1].ok());
    EXPECT_FALSE(outcomes[1].error.empty());
}

TEST(NestingEngine, BatchMatchesSequentialRuns) {
    std::vector<NestingJob> jobs;
    for (Strategy s : {Strategy::Shelf, Strategy::Guillotine, Strategy::CutOptimized}) {
        jobs.push_back(makeJob(strategyName(s), s));
    }

    auto outcomes = NestingEngine().runBatch(jobs, 3);

    for (size_t i = 0; i < jobs.size(); ++i) {
        NestingReport sequential = NestingEngine().run(jobs[i]);
        ASSERT_TRUE(outcomes[i].ok());
        const auto& batched = outcomes[i].report->result.placements;
        ASSERT_EQ(batched.size(), sequential.result.placements.size());
        for (size_t j = 0; j < batched.size(); ++j) {
            EXPECT_EQ(batched[j].x, sequential.result.placements[j].x);
            EXPECT_EQ(batched[j].y, sequential.result.placements[j].y);
            EXPECT_EQ(batched[j].sheetIndex, sequential.result.placements[j].sheetIndex);
        }
    }
}

TEST(NestingEngine, EmptyBatch) {
    EXPECT_TRUE(NestingEngine().runBatch({}).empty());
}

TEST(PickBestReport, FewestUnplacedWins) {
    std::vector<BatchOutcome> outcomes(3);
    outcomes[0].report = NestingReport{};
    outcomes[0].report->result.unplaced.resize(2);
    outcomes[1].report = NestingReport{};
    outcomes[1].report->result.unplaced.resize(1);
    outcomes[1].report->result.sheets.resize(3);
    outcomes[2].error = "rejected";

    const NestingReport* best = pickBestReport(outcomes);

    ASSERT_NE(best, nullptr);
    EXPECT_EQ(best, &*outcomes[1].report);
}

TEST(PickBestReport, FewerSheetsThenUtilization) {
    SheetUsage full;
    full.width = 100.0f;
    full.height = 100.0f;
    full.placedArea = 9000.0f;
    SheetUsage sparse = full;
    sparse.placedArea = 5000.0f;

    std::vector<BatchOutcome> outcomes(3);
    outcomes[0].report = NestingReport{};
    outcomes[0].report->result.sheets = {full, full};
    outcomes[1].report = NestingReport{};
    outcomes[1].report->result.sheets = {sparse};
    outcomes[2].report = NestingReport{};
    outcomes[2].report->result.sheets = {full};

    EXPECT_EQ(pickBestReport(outcomes), &*outcomes[2].report);
}

TEST(PickBestReport, NothingToPick) {
    std::vector<BatchOutcome> outcomes(1);
    outcomes[0].error = "rejected";
    EXPECT_EQ(pickBestReport(outcomes), nullptr);
}
