#include "job_file.h"

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/log.h"

namespace pn {
namespace nesting {

using json = nlohmann::json;

namespace {

json cutPlanToJson(const CutPlan& plan) {
    json lines = json::array();
    for (const auto& line : plan.lines) {
        lines.push_back({{"order", line.order},
                         {"orientation", cutOrientationName(line.orientation)},
                         {"position", line.position},
                         {"start", line.start},
                         {"end", line.end},
                         {"length", line.length()},
                         {"parts_crossed", line.partsCrossed}});
    }
    return {{"sheet_index", plan.sheetIndex},
            {"total_length", plan.totalLength},
            {"rip_count", plan.ripCount},
            {"crosscut_count", plan.crosscutCount},
            {"lines", lines}};
}

void parseSearch(const json& node, SearchConfig& search) {
    if (node.is_boolean()) {
        search.enabled = node.get<bool>();
        return;
    }
    search.enabled = node.value("enabled", true);
    search.seed = node.value("seed", search.seed);
    search.generations = node.value("generations", search.generations);
    search.populationSize = node.value("population", search.populationSize);
    search.mutationRate = node.value("mutation_rate", search.mutationRate);
    search.crossoverRate = node.value("crossover_rate", search.crossoverRate);
    search.eliteCount = node.value("elite_count", search.eliteCount);
    search.tournamentSize = node.value("tournament_size", search.tournamentSize);
    search.stallGenerations = node.value("stall_generations", search.stallGenerations);
    search.targetUtilization = node.value("target_utilization", search.targetUtilization);
}

json scoreToJson(const SearchScore& score) {
    return {{"unplaced", score.unplaced},
            {"sheets_used", score.sheetsUsed},
            {"fitness", score.fitness}};
}

json qualityToJson(const QualityReport& quality) {
    json issues = json::array();
    for (const auto& issue : quality.issues) {
        json entry = {{"type", issueTypeName(issue.type)},
                      {"severity", issueSeverityName(issue.severity)},
                      {"part_ids", issue.partIds},
                      {"sheet_index", issue.sheetIndex},
                      {"description", issue.description},
                      {"suggested_fix", issue.suggestedFix}};
        if (issue.affectedArea) {
            const Rect& r = *issue.affectedArea;
            entry["affected_area"] = {
                {"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
        }
        issues.push_back(entry);
    }
    return {{"score", quality.score},
            {"total_parts", quality.totalParts},
            {"total_sheets", quality.totalSheets},
            {"material_utilization", quality.materialUtilization},
            {"passed_checks", quality.passedChecks},
            {"failed_checks", quality.failedChecks},
            {"issues", issues}};
}

} // namespace

Result<NestingJob> JobFile::parse(const std::string& text, const std::string& fallbackName) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        log::errorf("JobFile", "JSON parse error: %s", e.what());
        return std::nullopt;
    }

    if (!doc.is_object()) {
        log::error("JobFile", "Job document must be a JSON object");
        return std::nullopt;
    }
    if (!doc.contains("sheets") || !doc["sheets"].is_array()) {
        log::error("JobFile", "Job has no \"sheets\" array");
        return std::nullopt;
    }
    if (!doc.contains("parts") || !doc["parts"].is_array()) {
        log::error("JobFile", "Job has no \"parts\" array");
        return std::nullopt;
    }

    NestingJob job;
    try {
        job.name = doc.value("name", fallbackName);

        NestingConfig& config = job.config;
        std::string strategy = doc.value("strategy", std::string(strategyName(config.strategy)));
        auto parsedStrategy = parseStrategy(strategy);
        if (!parsedStrategy) {
            log::errorf("JobFile", "Unknown strategy '%s'", strategy.c_str());
            return std::nullopt;
        }
        config.strategy = *parsedStrategy;

        std::string order = doc.value("part_order", std::string("default"));
        auto parsedOrder = parsePartOrder(order);
        if (!parsedOrder) {
            log::errorf("JobFile", "Unknown part order '%s'", order.c_str());
            return std::nullopt;
        }
        config.partOrder = *parsedOrder;

        std::string heuristic = doc.value("fit_heuristic", std::string("default"));
        auto parsedHeuristic = parseFitHeuristic(heuristic);
        if (!parsedHeuristic) {
            log::errorf("JobFile", "Unknown fit heuristic '%s'", heuristic.c_str());
            return std::nullopt;
        }
        config.fitHeuristic = *parsedHeuristic;

        config.kerf = doc.value("kerf", 0.0f);
        config.margin = doc.value("margin", 0.0f);
        config.cutMergeTolerance = doc.value("cut_merge_tolerance", kDefaultCutMergeTolerance);
        config.deriveCuts = doc.value("derive_cuts", true);
        if (doc.contains("min_spacing") && !doc["min_spacing"].is_null()) {
            config.minSpacing = doc["min_spacing"].get<f32>();
        }
        if (doc.contains("search") && !doc["search"].is_null()) {
            if (!doc["search"].is_boolean() && !doc["search"].is_object()) {
                log::error("JobFile", "\"search\" must be a boolean or an object");
                return std::nullopt;
            }
            parseSearch(doc["search"], config.search);
        }

        int sheetIndex = 0;
        for (const auto& s : doc["sheets"]) {
            SheetDefinition sheet;
            sheet.width = s.value("width", 0.0f);
            sheet.height = s.value("height", 0.0f);
            sheet.quantity = s.value("quantity", 1);
            sheet.label = s.value("label", std::string{});
            sheet.index = sheetIndex++;
            job.sheets.push_back(sheet);
        }

        for (const auto& p : doc["parts"]) {
            Part part;
            part.id = p.value("id", std::string{});
            part.width = p.value("width", 0.0f);
            part.height = p.value("height", 0.0f);
            part.quantity = p.value("quantity", 1);
            part.rotationAllowed = p.value("rotation_allowed", false);
            job.parts.push_back(part);
        }
    } catch (const json::exception& e) {
        // Wrong value types ("width": "wide") land here
        log::errorf("JobFile", "Malformed job: %s", e.what());
        return std::nullopt;
    }

    log::debugf("JobFile", "Parsed job '%s': %zu part entries, %zu sheet entries",
                job.name.c_str(), job.parts.size(), job.sheets.size());
    return job;
}

Result<NestingJob> JobFile::load(const Path& filePath) {
    if (!file::exists(filePath)) {
        log::errorf("JobFile", "No such job file: %s", filePath.string().c_str());
        return std::nullopt;
    }
    if (!file::isFile(filePath)) {
        log::errorf("JobFile", "Not a file: %s", filePath.string().c_str());
        return std::nullopt;
    }
    auto text = file::readText(filePath);
    if (!text) {
        log::errorf("JobFile", "Failed to read %s", filePath.string().c_str());
        return std::nullopt;
    }
    return parse(*text, file::getStem(filePath));
}

std::string JobFile::serializeReport(const NestingReport& report) {
    const NestingResult& result = report.result;

    json doc;
    doc["format_version"] = 1;
    doc["name"] = report.jobName;
    doc["strategy"] = strategyName(report.strategy);

    doc["summary"] = {{"parts_placed", result.placements.size()},
                      {"parts_unplaced", result.unplaced.size()},
                      {"sheets_used", result.sheetsUsed()},
                      {"sheets_available", result.sheetsAvailable},
                      {"total_placed_area", result.totalPlacedArea()},
                      {"total_sheet_area", result.totalSheetArea()},
                      {"utilization", result.overallUtilization()},
                      {"sheets_exhausted", result.sheetsExhausted},
                      {"cancelled", result.cancelled}};

    auto& sheetsArr = doc["sheets"];
    sheetsArr = json::array();
    for (const auto& usage : result.sheets) {
        sheetsArr.push_back({{"sheet_index", usage.sheetIndex},
                             {"definition_index", usage.definitionIndex},
                             {"label", usage.label},
                             {"width", usage.width},
                             {"height", usage.height},
                             {"part_count", usage.partCount},
                             {"placed_area", usage.placedArea},
                             {"waste_area", usage.wasteArea()},
                             {"utilization", usage.utilization()}});
    }

    auto& placementsArr = doc["placements"];
    placementsArr = json::array();
    for (const auto& p : result.placements) {
        placementsArr.push_back({{"part_id", p.partId},
                                 {"instance", p.instance},
                                 {"sheet_index", p.sheetIndex},
                                 {"x", p.x},
                                 {"y", p.y},
                                 {"width", p.width},
                                 {"height", p.height},
                                 {"rotation", p.rotationDeg}});
    }

    auto& unplacedArr = doc["unplaced"];
    unplacedArr = json::array();
    for (const auto& u : result.unplaced) {
        unplacedArr.push_back({{"part_id", u.partId},
                               {"instance", u.instance},
                               {"width", u.width},
                               {"height", u.height},
                               {"reason", unplacedReasonName(u.reason)}});
    }

    auto& cutsArr = doc["cuts"];
    cutsArr = json::array();
    for (const auto& plan : report.cutPlans) {
        cutsArr.push_back(cutPlanToJson(plan));
    }

    doc["quality"] = qualityToJson(report.quality);

    if (report.search) {
        const SearchSummary& search = *report.search;
        doc["search"] = {{"seed", search.seed},
                         {"generations", search.generations},
                         {"evaluations", search.evaluations},
                         {"cancelled", search.cancelled},
                         {"baseline", scoreToJson(search.baseline)},
                         {"best", scoreToJson(search.best)}};
    }
    return doc.dump(2);
}

bool JobFile::saveReport(const Path& filePath, const NestingReport& report) {
    Path parent = filePath.parent_path();
    if (!parent.empty() && !file::createDirectories(parent)) {
        log::errorf("JobFile", "Failed to create %s", parent.string().c_str());
        return false;
    }

    if (!file::writeText(filePath, serializeReport(report))) {
        log::errorf("JobFile", "Failed to write %s", filePath.string().c_str());
        return false;
    }

    log::infof("JobFile", "Saved report: %s", filePath.string().c_str());
    return true;
}

} // namespace nesting
} // namespace pn
