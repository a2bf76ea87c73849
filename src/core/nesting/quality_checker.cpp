#include "quality_checker.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <set>
#include <sstream>
#include <utility>

#include "../utils/log.h"
#include "nesting_utils.h"

namespace pn {
namespace nesting {

namespace {

using SheetGroups = std::map<int, std::vector<const PlacedPart*>>;

SheetGroups groupBySheet(const NestingResult& result) {
    SheetGroups groups;
    for (const auto& placement : result.placements) {
        groups[placement.sheetIndex].push_back(&placement);
    }
    return groups;
}

// Positive-area intersection of two rectangles, if any
std::optional<Rect> intersection(const Rect& a, const Rect& b, f32 tolerance) {
    f32 left = std::max(a.x, b.x);
    f32 right = std::min(a.right(), b.right());
    f32 bottom = std::max(a.y, b.y);
    f32 top = std::min(a.top(), b.top());
    if (right - left > tolerance && top - bottom > tolerance) {
        return Rect(left, bottom, right - left, top - bottom);
    }
    return std::nullopt;
}

f32 edgeDistance(const Rect& a, const Rect& b) {
    f32 dx = std::max(0.0f, std::max(a.x - b.right(), b.x - a.right()));
    f32 dy = std::max(0.0f, std::max(a.y - b.top(), b.y - a.top()));
    return std::sqrt(dx * dx + dy * dy);
}

std::string label(const PlacedPart& p) {
    return p.partId + "#" + std::to_string(p.instance);
}

std::string formatLength(f32 value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(value));
    return buffer;
}

// First definition wins when an id repeats (pre-expanded input)
std::map<std::string, const Part*> indexById(const std::vector<Part>& parts) {
    std::map<std::string, const Part*> byId;
    for (const auto& part : parts) {
        byId.emplace(part.id, &part);
    }
    return byId;
}

} // namespace

const char* issueSeverityName(IssueSeverity severity) {
    return severity == IssueSeverity::Critical ? "critical" : "warning";
}

const char* issueTypeName(IssueType type) {
    switch (type) {
    case IssueType::Overlap:
        return "overlap";
    case IssueType::OutOfBounds:
        return "out_of_bounds";
    case IssueType::InsufficientSpacing:
        return "insufficient_spacing";
    case IssueType::RotationError:
        return "rotation_error";
    case IssueType::DimensionMismatch:
        return "dimension_mismatch";
    case IssueType::UnknownPart:
        return "unknown_part";
    case IssueType::UnknownSheet:
        return "unknown_sheet";
    case IssueType::PartAccounting:
        return "part_accounting";
    }
    return "unknown";
}

int QualityReport::count(IssueSeverity severity) const {
    return static_cast<int>(std::count_if(issues.begin(), issues.end(), [severity](const QualityIssue& i) {
        return i.severity == severity;
    }));
}

QualityChecker::QualityChecker(QualityOptions options) : m_options(options) {}

QualityReport QualityChecker::check(const NestingResult& result,
                                    const std::vector<SheetDefinition>& sheets, f32 margin,
                                    const std::vector<Part>& originalParts) const {
    QualityReport report;

    auto runCheck = [&report](const char* name, std::vector<QualityIssue> issues) {
        if (issues.empty()) {
            report.passedChecks.emplace_back(name);
            return;
        }
        report.failedChecks.emplace_back(name);
        for (auto& issue : issues) {
            report.issues.push_back(std::move(issue));
        }
    };

    runCheck("overlap_detection", checkOverlaps(result, margin));
    runCheck("bounds_compliance", checkBounds(result, sheets, margin));
    runCheck("spacing_requirements", checkSpacing(result, margin));
    runCheck("rotation_legality", checkRotation(result, originalParts));
    runCheck("dimension_consistency", checkDimensions(result, originalParts));
    runCheck("part_accounting", checkAccounting(result, originalParts));

    report.totalParts = static_cast<int>(result.placements.size());
    report.totalSheets = static_cast<int>(groupBySheet(result).size());
    report.materialUtilization = result.overallUtilization() * 100.0f;
    report.score = computeScore(report.issues);

    for (const auto& issue : report.issues) {
        if (issue.severity == IssueSeverity::Critical) {
            log::warningf("Quality", "%s: %s", issueTypeName(issue.type),
                          issue.description.c_str());
        }
    }
    log::infof("Quality", "Quality check complete: %.1f/100 score, %zu issues found",
               static_cast<double>(report.score), report.issues.size());
    return report;
}

std::vector<QualityIssue> QualityChecker::checkOverlaps(const NestingResult& result,
                                                        f32 margin) const {
    std::vector<QualityIssue> issues;
    const f32 inflate = std::max(margin, 0.0f) * 0.5f;

    for (const auto& [sheetIndex, parts] : groupBySheet(result)) {
        for (usize i = 0; i < parts.size(); ++i) {
            for (usize j = i + 1; j < parts.size(); ++j) {
                const PlacedPart& a = *parts[i];
                const PlacedPart& b = *parts[j];
                auto overlap = intersection(a.bounds().inflated(inflate),
                                            b.bounds().inflated(inflate), m_options.tolerance);
                if (!overlap) {
                    continue;
                }

                QualityIssue issue;
                issue.type = IssueType::Overlap;
                issue.severity = IssueSeverity::Critical;
                issue.partIds = {a.partId, b.partId};
                issue.sheetIndex = sheetIndex;
                issue.description = "Parts " + label(a) + " and " + label(b) + " overlap by " +
                                    formatLength(overlap->area()) + " sq units";
                issue.suggestedFix = "Adjust part positions to eliminate overlap";
                issue.affectedArea = overlap;
                issues.push_back(std::move(issue));
            }
        }
    }
    return issues;
}

std::vector<QualityIssue> QualityChecker::checkBounds(const NestingResult& result,
                                                      const std::vector<SheetDefinition>& sheets,
                                                      f32 margin) const {
    std::vector<QualityIssue> issues;
    const f32 tol = m_options.tolerance;

    for (const auto& p : result.placements) {
        auto sheet = findSheetInstance(sheets, p.sheetIndex);
        if (!sheet) {
            QualityIssue issue;
            issue.type = IssueType::UnknownSheet;
            issue.severity = IssueSeverity::Critical;
            issue.partIds = {p.partId};
            issue.sheetIndex = p.sheetIndex;
            issue.description = "Part " + label(p) + " refers to sheet " +
                                std::to_string(p.sheetIndex) + " which the job does not have";
            issue.suggestedFix = "Re-run nesting against the configured sheets";
            issues.push_back(std::move(issue));
            continue;
        }

        bool outside = p.x < margin - tol || p.y < margin - tol ||
                       p.x + p.width > sheet->width - margin + tol ||
                       p.y + p.height > sheet->height - margin + tol;
        if (!outside) {
            continue;
        }

        QualityIssue issue;
        issue.type = IssueType::OutOfBounds;
        issue.severity = IssueSeverity::Critical;
        issue.partIds = {p.partId};
        issue.sheetIndex = p.sheetIndex;
        issue.description = "Part " + label(p) + " extends beyond the usable sheet area";
        issue.suggestedFix = "Resize part or use a larger sheet";
        issue.affectedArea = p.bounds();
        issues.push_back(std::move(issue));
    }
    return issues;
}

std::vector<QualityIssue> QualityChecker::checkSpacing(const NestingResult& result,
                                                       f32 margin) const {
    std::vector<QualityIssue> issues;
    if (m_options.minSpacing <= m_options.tolerance) {
        return issues;
    }
    const f32 inflate = std::max(margin, 0.0f) * 0.5f;

    for (const auto& [sheetIndex, parts] : groupBySheet(result)) {
        for (usize i = 0; i < parts.size(); ++i) {
            for (usize j = i + 1; j < parts.size(); ++j) {
                const PlacedPart& a = *parts[i];
                const PlacedPart& b = *parts[j];

                // Overlaps are already critical
                if (intersection(a.bounds().inflated(inflate), b.bounds().inflated(inflate),
                                 m_options.tolerance)) {
                    continue;
                }

                f32 distance = edgeDistance(a.bounds(), b.bounds());
                if (distance >= m_options.minSpacing - m_options.tolerance) {
                    continue;
                }

                QualityIssue issue;
                issue.type = IssueType::InsufficientSpacing;
                issue.severity = IssueSeverity::Warning;
                issue.partIds = {a.partId, b.partId};
                issue.sheetIndex = sheetIndex;
                issue.description = "Parts " + label(a) + " and " + label(b) +
                                    " have insufficient spacing (" + formatLength(distance) +
                                    " < " + formatLength(m_options.minSpacing) + ")";
                issue.suggestedFix =
                    "Increase spacing to at least " + formatLength(m_options.minSpacing);
                issues.push_back(std::move(issue));
            }
        }
    }
    return issues;
}

std::vector<QualityIssue> QualityChecker::checkRotation(const NestingResult& result,
                                                        const std::vector<Part>& originalParts) const {
    std::vector<QualityIssue> issues;
    auto byId = indexById(originalParts);

    for (const auto& p : result.placements) {
        std::string problem;
        if (p.rotationDeg != 0 && p.rotationDeg != 90) {
            problem = "has invalid rotation " + std::to_string(p.rotationDeg) + " degrees";
        } else if (p.rotationDeg == 90) {
            auto it = byId.find(p.partId);
            if (it != byId.end() && !it->second->rotationAllowed) {
                problem = "is rotated but rotation is not allowed";
            }
        }
        if (problem.empty()) {
            continue;
        }

        QualityIssue issue;
        issue.type = IssueType::RotationError;
        issue.severity = IssueSeverity::Critical;
        issue.partIds = {p.partId};
        issue.sheetIndex = p.sheetIndex;
        issue.description = "Part " + label(p) + " " + problem;
        issue.suggestedFix = "Place the part unrotated";
        issue.affectedArea = p.bounds();
        issues.push_back(std::move(issue));
    }
    return issues;
}

std::vector<QualityIssue> QualityChecker::checkDimensions(const NestingResult& result,
                                                          const std::vector<Part>& originalParts) const {
    std::vector<QualityIssue> issues;
    auto byId = indexById(originalParts);
    const f32 tol = m_options.tolerance;

    for (const auto& p : result.placements) {
        auto it = byId.find(p.partId);
        if (it == byId.end()) {
            QualityIssue issue;
            issue.type = IssueType::UnknownPart;
            issue.severity = IssueSeverity::Critical;
            issue.partIds = {p.partId};
            issue.sheetIndex = p.sheetIndex;
            issue.description = "Placed part " + label(p) + " is not in the part list";
            issue.suggestedFix = "Re-run nesting with the current part list";
            issues.push_back(std::move(issue));
            continue;
        }

        const Part& original = *it->second;
        if (std::fabs(p.originalWidth() - original.width) <= tol &&
            std::fabs(p.originalHeight() - original.height) <= tol) {
            continue;
        }

        QualityIssue issue;
        issue.type = IssueType::DimensionMismatch;
        issue.severity = IssueSeverity::Critical;
        issue.partIds = {p.partId};
        issue.sheetIndex = p.sheetIndex;
        issue.description = "Part " + label(p) + " dimensions don't match original: expected " +
                            formatLength(original.width) + " x " + formatLength(original.height) +
                            ", got " + formatLength(p.originalWidth()) + " x " +
                            formatLength(p.originalHeight());
        issue.suggestedFix = "Verify part dimensions and rotation";
        issue.affectedArea = p.bounds();
        issues.push_back(std::move(issue));
    }
    return issues;
}

std::vector<QualityIssue> QualityChecker::checkAccounting(const NestingResult& result,
                                                          const std::vector<Part>& originalParts) const {
    std::vector<QualityIssue> issues;

    std::map<std::string, int> expected;
    for (const auto& part : originalParts) {
        expected[part.id] += part.quantity;
    }

    std::map<std::string, int> reported;
    std::set<std::pair<std::string, int>> seen;
    std::set<std::string> duplicated;
    auto record = [&](const std::string& id, int instance) {
        ++reported[id];
        if (!seen.emplace(id, instance).second) {
            duplicated.insert(id);
        }
    };
    for (const auto& p : result.placements) {
        record(p.partId, p.instance);
    }
    for (const auto& u : result.unplaced) {
        record(u.partId, u.instance);
    }

    std::set<std::string> ids;
    for (const auto& [id, count] : expected) {
        ids.insert(id);
    }
    for (const auto& [id, count] : reported) {
        ids.insert(id);
    }

    for (const auto& id : ids) {
        int want = expected.count(id) ? expected[id] : 0;
        int got = reported.count(id) ? reported[id] : 0;
        bool dup = duplicated.count(id) > 0;
        if (want == got && !dup) {
            continue;
        }

        QualityIssue issue;
        issue.type = IssueType::PartAccounting;
        issue.severity = IssueSeverity::Critical;
        issue.partIds = {id};
        issue.description = "Part " + id + ": expected " + std::to_string(want) +
                            " instances, result accounts for " + std::to_string(got) +
                            (dup ? " (duplicated instance)" : "");
        issue.suggestedFix = "Every part instance must be either placed or unplaced exactly once";
        issues.push_back(std::move(issue));
    }
    return issues;
}

f32 QualityChecker::computeScore(const std::vector<QualityIssue>& issues) const {
    f32 score = 100.0f;
    for (const auto& issue : issues) {
        score -= issue.severity == IssueSeverity::Critical ? m_options.criticalPenalty
                                                           : m_options.warningPenalty;
    }
    return std::clamp(score, 0.0f, 100.0f);
}

std::string formatQualityReport(const QualityReport& report) {
    std::ostringstream out;
    char line[128];

    out << "Quality Report\n";
    out << "========================================\n";
    std::snprintf(line, sizeof(line), "Overall Score: %.1f/100\n", static_cast<double>(report.score));
    out << line << "\n";

    out << "Layout Summary:\n";
    out << "  Total Parts: " << report.totalParts << "\n";
    out << "  Total Sheets: " << report.totalSheets << "\n";
    std::snprintf(line, sizeof(line), "  Material Utilization: %.1f%%\n",
                  static_cast<double>(report.materialUtilization));
    out << line << "\n";

    out << "Quality Checks:\n";
    out << "  Passed: " << report.passedChecks.size() << "\n";
    out << "  Failed: " << report.failedChecks.size() << "\n";

    if (report.issues.empty()) {
        out << "\nNo issues found.\n";
        return out.str();
    }

    out << "\nIssues Found (" << report.issues.size() << " total):\n";
    for (IssueSeverity severity : {IssueSeverity::Critical, IssueSeverity::Warning}) {
        int count = report.count(severity);
        if (count == 0) {
            continue;
        }
        out << "  " << (severity == IssueSeverity::Critical ? "CRITICAL" : "WARNINGS") << " ("
            << count << "):\n";
        for (const auto& issue : report.issues) {
            if (issue.severity != severity) {
                continue;
            }
            out << "    - " << issue.description << "\n";
            if (!issue.suggestedFix.empty()) {
                out << "      Fix: " << issue.suggestedFix << "\n";
            }
        }
    }
    return out.str();
}

} // namespace nesting
} // namespace pn
