// PanelNest - Job File Tests

#include <gtest/gtest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "core/nesting/job_file.h"
#include "core/utils/file_utils.h"

using namespace pn::nesting;
using json = nlohmann::json;

namespace {

const char* kJob = R"({
    "name": "kitchen",
    "strategy": "cut_optimized",
    "kerf": 3.2,
    "margin": 5,
    "part_order": "height_desc",
    "fit_heuristic": "best_area",
    "cut_merge_tolerance": 2,
    "derive_cuts": false,
    "min_spacing": 4,
    "sheets": [
        { "width": 2440, "height": 1220, "quantity": 2, "label": "Birch 18" },
        { "width": 1220, "height": 610 }
    ],
    "parts": [
        { "id": "door", "width": 700, "height": 400, "quantity": 2, "rotation_allowed": true },
        { "id": "shelf", "width": 560, "height": 300 }
    ]
})";

class TempDir {
public:
    TempDir() {
        m_path = std::filesystem::temp_directory_path() / "pn_test_job_file";
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() { std::filesystem::remove_all(m_path); }

    pn::Path operator/(const std::string& name) const { return m_path / name; }

private:
    pn::Path m_path;
};

} // namespace

TEST(JobFile, ParsesFullJob) {
    auto job = JobFile::parse(kJob);
    ASSERT_TRUE(job.has_value());

    EXPECT_EQ(job->name, "kitchen");
    EXPECT_EQ(job->config.strategy, Strategy::CutOptimized);
    EXPECT_FLOAT_EQ(job->config.kerf, 3.2f);
    EXPECT_FLOAT_EQ(job->config.margin, 5.0f);
    EXPECT_EQ(job->config.partOrder, PartOrder::HeightDescending);
    EXPECT_EQ(job->config.fitHeuristic, FitHeuristic::BestAreaFit);
    EXPECT_FLOAT_EQ(job->config.cutMergeTolerance, 2.0f);
    EXPECT_FALSE(job->config.deriveCuts);
    ASSERT_TRUE(job->config.minSpacing.has_value());
    EXPECT_FLOAT_EQ(*job->config.minSpacing, 4.0f);

    ASSERT_EQ(job->sheets.size(), 2u);
    EXPECT_EQ(job->sheets[0].quantity, 2);
    EXPECT_EQ(job->sheets[0].label, "Birch 18");
    EXPECT_EQ(job->sheets[1].index, 1);
    EXPECT_EQ(job->sheets[1].quantity, 1);

    ASSERT_EQ(job->parts.size(), 2u);
    EXPECT_EQ(job->parts[0].id, "door");
    EXPECT_EQ(job->parts[0].quantity, 2);
    EXPECT_TRUE(job->parts[0].rotationAllowed);
    EXPECT_FALSE(job->parts[1].rotationAllowed);
}

TEST(JobFile, DefaultsForOptionalFields) {
    auto job = JobFile::parse(R"({"sheets": [{"width": 100, "height": 100}],
                                  "parts": [{"id": "a", "width": 10, "height": 10}]})",
                              "fallback");
    ASSERT_TRUE(job.has_value());

    EXPECT_EQ(job->name, "fallback");
    EXPECT_EQ(job->config.strategy, Strategy::Guillotine);
    EXPECT_FLOAT_EQ(job->config.kerf, 0.0f);
    EXPECT_FLOAT_EQ(job->config.cutMergeTolerance, kDefaultCutMergeTolerance);
    EXPECT_TRUE(job->config.deriveCuts);
    EXPECT_FALSE(job->config.minSpacing.has_value());
}

TEST(JobFile, RejectsMalformedDocuments) {
    EXPECT_FALSE(JobFile::parse("{not json").has_value());
    EXPECT_FALSE(JobFile::parse("[1, 2, 3]").has_value());
    EXPECT_FALSE(JobFile::parse(R"({"parts": []})").has_value());
    EXPECT_FALSE(JobFile::parse(R"({"sheets": []})").has_value());
    EXPECT_FALSE(
        JobFile::parse(R"({"sheets": [], "parts": [], "strategy": "maxrects"})").has_value());
    EXPECT_FALSE(
        JobFile::parse(R"({"sheets": [{"width": "wide"}], "parts": []})").has_value());
}

TEST(JobFile, BadNumbersLoadAndFailInEngine) {
    auto job = JobFile::parse(R"({"sheets": [{"width": 100, "height": 100}],
                                  "parts": [{"id": "a", "width": -10, "height": 10}]})");
    ASSERT_TRUE(job.has_value());
    EXPECT_THROW(NestingEngine().run(*job), InvalidInputError);
}

TEST(JobFile, LoadUsesFileStemAsName) {
    TempDir tmp;
    auto path = tmp / "garage.json";
    ASSERT_TRUE(pn::file::writeText(path, R"({"sheets": [{"width": 100, "height": 100}],
                                              "parts": []})"));

    auto job = JobFile::load(path);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->name, "garage");
}

TEST(JobFile, LoadMissingFile) {
    TempDir tmp;
    EXPECT_FALSE(JobFile::load(tmp / "missing.json").has_value());
}

TEST(JobFile, LoadRejectsDirectory) {
    TempDir tmp;
    auto dir = tmp / "jobs.json";
    std::filesystem::create_directories(dir);
    EXPECT_FALSE(JobFile::load(dir).has_value());
}

TEST(JobFile, ParsesSearchBlock) {
    auto job = JobFile::parse(R"({
        "sheets": [{"width": 100, "height": 100}], "parts": [],
        "search": {"seed": 7, "generations": 12, "population": 10, "elite_count": 1}
    })");
    ASSERT_TRUE(job.has_value());

    const SearchConfig& search = job->config.search;
    EXPECT_TRUE(search.enabled);
    EXPECT_EQ(search.seed, 7u);
    EXPECT_EQ(search.generations, 12);
    EXPECT_EQ(search.populationSize, 10);
    EXPECT_EQ(search.eliteCount, 1);
    EXPECT_EQ(search.tournamentSize, SearchConfig{}.tournamentSize);
}

TEST(JobFile, SearchAsBooleanOrDisabledObject) {
    auto on = JobFile::parse(R"({"sheets": [], "parts": [], "search": true})");
    ASSERT_TRUE(on.has_value());
    EXPECT_TRUE(on->config.search.enabled);

    auto off = JobFile::parse(R"({"sheets": [], "parts": [], "search": {"enabled": false}})");
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(off->config.search.enabled);

    auto absent = JobFile::parse(R"({"sheets": [], "parts": []})");
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent->config.search.enabled);

    EXPECT_FALSE(JobFile::parse(R"({"sheets": [], "parts": [], "search": 3})").has_value());
}

TEST(JobFile, SerializesSearchSummary) {
    auto job = JobFile::parse(R"({
        "strategy": "shelf",
        "sheets": [{"width": 300, "height": 300, "quantity": 2}],
        "parts": [{"id": "a", "width": 120, "height": 80, "quantity": 4, "rotation_allowed": true},
                  {"id": "b", "width": 60, "height": 150, "quantity": 2}],
        "search": {"seed": 3, "generations": 5, "population": 6}
    })");
    ASSERT_TRUE(job.has_value());
    NestingReport report = NestingEngine().run(*job);
    ASSERT_TRUE(report.search.has_value());

    json doc = json::parse(JobFile::serializeReport(report));
    ASSERT_TRUE(doc.contains("search"));
    EXPECT_EQ(doc["search"]["seed"], 3);
    EXPECT_GE(doc["search"]["evaluations"].get<int>(), 1);
    EXPECT_LE(doc["search"]["best"]["unplaced"].get<int>(),
              doc["search"]["baseline"]["unplaced"].get<int>());
}

TEST(JobFile, SerializesReport) {
    auto job = JobFile::parse(R"({
        "name": "demo", "strategy": "guillotine", "kerf": 3,
        "sheets": [{"width": 300, "height": 300}],
        "parts": [{"id": "p", "width": 100, "height": 100, "quantity": 4},
                  {"id": "huge", "width": 900, "height": 900}]
    })");
    ASSERT_TRUE(job.has_value());
    NestingReport report = NestingEngine().run(*job);

    json doc = json::parse(JobFile::serializeReport(report));

    EXPECT_EQ(doc["name"], "demo");
    EXPECT_EQ(doc["strategy"], "guillotine");
    EXPECT_EQ(doc["summary"]["parts_placed"], 4);
    EXPECT_EQ(doc["summary"]["parts_unplaced"], 1);
    EXPECT_EQ(doc["summary"]["sheets_used"], 1);
    ASSERT_EQ(doc["placements"].size(), 4u);
    EXPECT_EQ(doc["placements"][0]["part_id"], "p");
    EXPECT_EQ(doc["placements"][0]["rotation"], 0);
    ASSERT_EQ(doc["unplaced"].size(), 1u);
    EXPECT_EQ(doc["unplaced"][0]["reason"], "too large for any sheet");
    ASSERT_EQ(doc["cuts"].size(), 1u);
    EXPECT_EQ(doc["cuts"][0]["lines"][0]["orientation"], "rip");
    EXPECT_EQ(doc["cuts"][0]["lines"][0]["order"], 1);
    EXPECT_TRUE(doc["quality"]["score"].is_number());
    EXPECT_TRUE(doc["quality"]["issues"].is_array());
    EXPECT_FALSE(doc.contains("search"));
}

TEST(JobFile, ReportCarriesSheetLabels) {
    auto job = JobFile::parse(R"({
        "sheets": [{"width": 300, "height": 300, "label": "Birch 18"},
                   {"width": 300, "height": 300}],
        "parts": [{"id": "p", "width": 250, "height": 250, "quantity": 2}]
    })");
    ASSERT_TRUE(job.has_value());
    NestingReport report = NestingEngine().run(*job);

    ASSERT_EQ(report.result.sheets.size(), 2u);
    EXPECT_EQ(report.result.sheets[0].label, "Birch 18");
    EXPECT_EQ(report.result.sheets[1].label, "");

    json doc = json::parse(JobFile::serializeReport(report));
    ASSERT_EQ(doc["sheets"].size(), 2u);
    EXPECT_EQ(doc["sheets"][0]["label"], "Birch 18");
    EXPECT_EQ(doc["sheets"][1]["label"], "");
}

TEST(JobFile, SaveReportCreatesDirectories) {
    TempDir tmp;
    auto path = tmp / "out" / "report.json";

    auto job = JobFile::parse(R"({"sheets": [{"width": 100, "height": 100}],
                                  "parts": [{"id": "a", "width": 10, "height": 10}]})");
    ASSERT_TRUE(job.has_value());
    NestingReport report = NestingEngine().run(*job);

    ASSERT_TRUE(JobFile::saveReport(path, report));
    auto text = pn::file::readText(path);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(json::parse(*text)["summary"]["parts_placed"], 1);
}
