#ifndef CORE_FINDINGS_HPP
#define CORE_FINDINGS_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/Severity.hpp"

namespace CodeRisk
{
namespace core
{

/// Size/shape statistics of one snippet.
struct MetricsRecord
{
    std::size_t totalLines   = 0;
    std::size_t codeLines    = 0;
    std::size_t blankLines   = 0;
    std::size_t commentLines = 0;
    std::size_t functionCount = 0;
    std::size_t classCount    = 0;
    std::size_t importCount   = 0;
    double      complexityScore   = 0.0;
    double      avgFunctionLength = 0.0;
};

/// One anti-pattern rule hit on one source line.
struct FlaggedSection
{
    int         line = 1;      ///< 1-indexed.
    std::string code;          ///< Trimmed text of the line.
    std::string issue;
    Severity    severity = Severity::Info;
    std::string ruleId;

    bool operator==(const FlaggedSection& other) const
    {
        return line == other.line && code == other.code && issue == other.issue
               && severity == other.severity && ruleId == other.ruleId;
    }
};

enum class RiskLevel : std::uint8_t
{
    Low = 0,
    Medium,
    High
};

constexpr const char* riskLevelName(RiskLevel level) noexcept
{
    switch (level)
    {
    case RiskLevel::Low:    return "low";
    case RiskLevel::Medium: return "medium";
    case RiskLevel::High:   return "high";
    }
    return "low";
}

/**
 * @brief Fused defect-risk verdict for one snippet.
 *
 * riskScore and confidence are in [0, 1]; riskLevel is derived from
 * riskScore by the fusion thresholds.
 */
struct DefectPrediction
{
    double                      riskScore  = 0.0;
    RiskLevel                   riskLevel  = RiskLevel::Low;
    std::vector<FlaggedSection> flaggedSections;
    double                      confidence = 0.5;
    std::vector<std::string>    issuesDetected;   ///< Pattern hits, then code smells.
};

/// Count of flagged sections per severity; every severity present.
using SeveritySummary = std::map<Severity, std::size_t>;

} // namespace core
} // namespace CodeRisk

#endif // CORE_FINDINGS_HPP
