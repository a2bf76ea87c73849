#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nesting_types.h"

namespace pn {
namespace nesting {

enum class IssueSeverity {
    Critical, // Layout must not be used as-is
    Warning   // Should be reviewed
};

enum class IssueType {
    Overlap,
    OutOfBounds,
    InsufficientSpacing,
    RotationError,
    DimensionMismatch,
    UnknownPart,
    UnknownSheet,
    PartAccounting
};

const char* issueSeverityName(IssueSeverity severity);
const char* issueTypeName(IssueType type);

struct QualityIssue {
    IssueType type = IssueType::Overlap;
    IssueSeverity severity = IssueSeverity::Critical;
    std::vector<std::string> partIds;
    int sheetIndex = -1; // -1 when the issue is not tied to a sheet
    std::string description;
    std::string suggestedFix;
    std::optional<Rect> affectedArea;
};

struct QualityOptions {
    f32 minSpacing = 0.0f;   // Closer (but not overlapping) pairs raise a warning
    f32 tolerance = 0.01f;   // Float slack for every geometric comparison
    f32 criticalPenalty = 25.0f;
    f32 warningPenalty = 5.0f;
};

struct QualityReport {
    f32 score = 100.0f; // 0-100
    std::vector<QualityIssue> issues;
    std::vector<std::string> passedChecks;
    std::vector<std::string> failedChecks;
    int totalParts = 0;
    int totalSheets = 0;
    f32 materialUtilization = 0.0f; // Percent

    int count(IssueSeverity severity) const;
    bool hasCritical() const { return count(IssueSeverity::Critical) > 0; }
};

// Validates a finished NestingResult. Never mutates its input; invariant
// violations come back as CRITICAL issues rather than exceptions.
class QualityChecker {
  public:
    explicit QualityChecker(QualityOptions options = {});

    QualityReport check(const NestingResult& result, const std::vector<SheetDefinition>& sheets,
                        f32 margin, const std::vector<Part>& originalParts) const;

    const QualityOptions& options() const { return m_options; }

  private:
    std::vector<QualityIssue> checkOverlaps(const NestingResult& result, f32 margin) const;
    std::vector<QualityIssue> checkBounds(const NestingResult& result,
                                          const std::vector<SheetDefinition>& sheets,
                                          f32 margin) const;
    std::vector<QualityIssue> checkSpacing(const NestingResult& result, f32 margin) const;
    std::vector<QualityIssue> checkRotation(const NestingResult& result,
                                            const std::vector<Part>& originalParts) const;
    std::vector<QualityIssue> checkDimensions(const NestingResult& result,
                                              const std::vector<Part>& originalParts) const;
    std::vector<QualityIssue> checkAccounting(const NestingResult& result,
                                              const std::vector<Part>& originalParts) const;

    f32 computeScore(const std::vector<QualityIssue>& issues) const;

    QualityOptions m_options;
};

// Plain-text summary for logs and the CLI
std::string formatQualityReport(const QualityReport& report);

} // namespace nesting
} // namespace pn
