// PanelNest - Multi-Sheet Scheduler Tests

#include <gtest/gtest.h>

#include <atomic>

#include "core/nesting/sheet_scheduler.h"

using namespace pn::nesting;

namespace {

NestingConfig makeConfig(Strategy strategy, float kerf = 0.0f, float margin = 0.0f) {
    NestingConfig config;
    config.strategy = strategy;
    config.kerf = kerf;
    config.margin = margin;
    return config;
}

bool overlaps(const PlacedPart& a, const PlacedPart& b) {
    return a.sheetIndex == b.sheetIndex && a.x < b.x + b.width && b.x < a.x + a.width &&
           a.y < b.y + b.height && b.y < a.y + a.height;
}

} // namespace

TEST(MultiSheetScheduler, TwoPartsOnOneSheet) {
    std::vector<Part> parts = {Part("P1", 400.0f, 300.0f), Part("P2", 300.0f, 300.0f)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(1220.0f, 2440.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine, 3.0f, 2.0f));

    ASSERT_EQ(result.placements.size(), 2u);
    EXPECT_TRUE(result.unplaced.empty());
    EXPECT_EQ(result.placements[0].sheetIndex, 0);
    EXPECT_EQ(result.placements[1].sheetIndex, 0);
    EXPECT_FALSE(overlaps(result.placements[0], result.placements[1]));
    EXPECT_EQ(result.sheetsUsed(), 1);
}

TEST(MultiSheetScheduler, OversizedPartConsumesNoSheet) {
    std::vector<Part> parts = {Part("huge", 3000.0f, 3000.0f, true)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(2440.0f, 1220.0f, 2)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine));

    EXPECT_TRUE(result.placements.empty());
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].reason, UnplacedReason::TooLargeForAnySheet);
    EXPECT_STREQ(unplacedReasonName(result.unplaced[0].reason), "too large for any sheet");
    EXPECT_EQ(result.sheetsUsed(), 0);
    EXPECT_FALSE(result.sheetsExhausted);
}

TEST(MultiSheetScheduler, SheetsExhausted) {
    std::vector<Part> parts = {Part("sq", 500.0f, 500.0f, false, 5)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(600.0f, 600.0f, 1)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine));

    ASSERT_EQ(result.placements.size(), 1u);
    EXPECT_EQ(result.placements[0].sheetIndex, 0);
    ASSERT_EQ(result.unplaced.size(), 4u);
    for (const auto& u : result.unplaced) {
        EXPECT_EQ(u.reason, UnplacedReason::SheetsExhausted);
        EXPECT_EQ(u.partId, "sq");
    }
    EXPECT_STREQ(unplacedReasonName(UnplacedReason::SheetsExhausted), "sheets exhausted");
    EXPECT_TRUE(result.sheetsExhausted);
    EXPECT_FALSE(result.isComplete());
}

TEST(MultiSheetScheduler, ConsumesSheetsInOrder) {
    std::vector<Part> parts = {Part("sq", 500.0f, 500.0f, false, 4)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(600.0f, 600.0f, 3)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Shelf));

    ASSERT_EQ(result.placements.size(), 3u);
    EXPECT_EQ(result.placements[0].sheetIndex, 0);
    EXPECT_EQ(result.placements[1].sheetIndex, 1);
    EXPECT_EQ(result.placements[2].sheetIndex, 2);
    EXPECT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.sheetsUsed(), 3);
    EXPECT_EQ(result.sheetsAvailable, 3);
}

TEST(MultiSheetScheduler, StopsWhenEverythingPlaced) {
    std::vector<Part> parts = {Part("A", 100.0f, 100.0f)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(1000.0f, 1000.0f, 5)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine));

    EXPECT_TRUE(result.isComplete());
    EXPECT_EQ(result.sheetsUsed(), 1);
    EXPECT_EQ(result.sheetsAvailable, 5);
}

TEST(MultiSheetScheduler, SkipsSheetTooSmallForRemainingParts) {
    std::vector<Part> parts = {Part("A", 500.0f, 500.0f)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(100.0f, 100.0f),
                                           SheetDefinition(1000.0f, 1000.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine));

    ASSERT_EQ(result.placements.size(), 1u);
    EXPECT_EQ(result.placements[0].sheetIndex, 1);
    ASSERT_EQ(result.sheets.size(), 1u);
    EXPECT_EQ(result.sheets[0].sheetIndex, 1);
    EXPECT_EQ(result.sheets[0].definitionIndex, 1);
}

TEST(MultiSheetScheduler, EmptyPartList) {
    std::vector<SheetDefinition> sheets = {SheetDefinition(1000.0f, 1000.0f)};

    NestingResult result = MultiSheetScheduler().run({}, sheets, makeConfig(Strategy::Shelf));

    EXPECT_TRUE(result.isComplete());
    EXPECT_TRUE(result.placements.empty());
    EXPECT_EQ(result.sheetsUsed(), 0);
}

TEST(MultiSheetScheduler, RejectsMalformedJob) {
    std::vector<Part> parts = {Part("A", 100.0f, 100.0f)};

    EXPECT_THROW(MultiSheetScheduler().run(parts, {}, makeConfig(Strategy::Shelf)),
                 InvalidInputError);
    EXPECT_THROW(MultiSheetScheduler().run(parts, {SheetDefinition(100.0f, 100.0f)},
                                           makeConfig(Strategy::Shelf, -3.0f)),
                 InvalidInputError);
}

TEST(MultiSheetScheduler, UtilizationStatistics) {
    std::vector<Part> parts = {Part("A", 50.0f, 100.0f, false, 2)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(100.0f, 100.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine));

    ASSERT_EQ(result.sheets.size(), 1u);
    EXPECT_EQ(result.sheets[0].partCount, 2);
    EXPECT_FLOAT_EQ(result.sheets[0].placedArea, 10000.0f);
    EXPECT_FLOAT_EQ(result.sheets[0].wasteArea(), 0.0f);
    EXPECT_FLOAT_EQ(result.overallUtilization(), 1.0f);
}

TEST(MultiSheetScheduler, Deterministic) {
    std::vector<Part> parts = {Part("A", 300.0f, 200.0f, true, 3), Part("B", 150.0f, 150.0f, false, 4),
                               Part("C", 90.0f, 400.0f, true, 2)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(800.0f, 600.0f, 3)};

    for (Strategy strategy : {Strategy::Shelf, Strategy::Guillotine, Strategy::CutOptimized}) {
        NestingConfig config = makeConfig(strategy, 3.0f, 5.0f);
        NestingResult first = MultiSheetScheduler().run(parts, sheets, config);
        NestingResult second = MultiSheetScheduler().run(parts, sheets, config);

        ASSERT_EQ(first.placements.size(), second.placements.size());
        for (size_t i = 0; i < first.placements.size(); ++i) {
            const auto& a = first.placements[i];
            const auto& b = second.placements[i];
            EXPECT_EQ(a.partId, b.partId);
            EXPECT_EQ(a.instance, b.instance);
            EXPECT_EQ(a.sheetIndex, b.sheetIndex);
            EXPECT_EQ(a.x, b.x);
            EXPECT_EQ(a.y, b.y);
            EXPECT_EQ(a.rotationDeg, b.rotationDeg);
        }
        EXPECT_EQ(first.unplaced.size(), second.unplaced.size());
    }
}

TEST(MultiSheetScheduler, ReportsProgressPerSheet) {
    std::vector<Part> parts = {Part("sq", 500.0f, 500.0f, false, 3)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(600.0f, 600.0f, 3)};

    std::vector<NestingProgress> updates;
    RunControl control;
    control.onProgress = [&updates](const NestingProgress& p) { updates.push_back(p); };

    MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine), &control);

    ASSERT_EQ(updates.size(), 3u);
    EXPECT_EQ(updates[0].sheetsProcessed, 1);
    EXPECT_EQ(updates[0].partsPlaced, 1);
    EXPECT_EQ(updates[2].sheetsProcessed, 3);
    EXPECT_EQ(updates[2].partsPlaced, 3);
    EXPECT_EQ(updates[2].partsTotal, 3);
    EXPECT_EQ(updates[2].sheetsAvailable, 3);
}

TEST(MultiSheetScheduler, CancelledBeforeStart) {
    std::atomic<bool> cancel{true};
    RunControl control;
    control.cancel = &cancel;

    std::vector<Part> parts = {Part("A", 100.0f, 100.0f, false, 2)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(1000.0f, 1000.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine), &control);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.sheetsExhausted);
    EXPECT_TRUE(result.placements.empty());
    EXPECT_EQ(result.countUnplaced(UnplacedReason::Cancelled), 2);
}

TEST(MultiSheetScheduler, CancelledBetweenSheetsKeepsPartialResult) {
    std::atomic<bool> cancel{false};
    RunControl control;
    control.cancel = &cancel;
    control.onProgress = [&cancel](const NestingProgress&) { cancel = true; };

    std::vector<Part> parts = {Part("sq", 500.0f, 500.0f, false, 3)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(600.0f, 600.0f, 3)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine), &control);

    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.placements.size(), 1u);
    EXPECT_EQ(result.placements[0].sheetIndex, 0);
    EXPECT_EQ(result.countUnplaced(UnplacedReason::Cancelled), 2);
    EXPECT_EQ(result.sheetsUsed(), 1);
}

TEST(MultiSheetScheduler, CancelAfterLastSheetReportsExhaustion) {
    std::atomic<bool> cancel{false};
    RunControl control;
    control.cancel = &cancel;
    control.onProgress = [&cancel](const NestingProgress& progress) {
        if (progress.sheetsProcessed == progress.sheetsAvailable) {
            cancel = true;
        }
    };

    std::vector<Part> parts = {Part("sq", 500.0f, 500.0f, false, 5)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(600.0f, 600.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Guillotine), &control);

    // Every sheet was consumed before the flag went up
    EXPECT_EQ(result.placements.size(), 1u);
    EXPECT_TRUE(result.sheetsExhausted);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.countUnplaced(UnplacedReason::SheetsExhausted), 4);
    EXPECT_EQ(result.countUnplaced(UnplacedReason::Cancelled), 0);
}

TEST(MultiSheetScheduler, CancelInsideSheetMarksRestCancelled) {
    std::atomic<bool> cancel{false};
    RunControl control;
    control.cancel = &cancel;
    control.onPartPlaced = [&cancel](const PlacedPart&) { cancel = true; };

    std::vector<Part> parts = {Part("sq", 100.0f, 100.0f, false, 4)};
    std::vector<SheetDefinition> sheets = {SheetDefinition(1000.0f, 1000.0f)};

    NestingResult result =
        MultiSheetScheduler().run(parts, sheets, makeConfig(Strategy::Shelf), &control);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.sheetsExhausted);
    EXPECT_EQ(result.placements.size(), 1u);
    EXPECT_EQ(result.countUnplaced(UnplacedReason::Cancelled), 3);
}
