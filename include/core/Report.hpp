// Result of one analysis run over one source snippet. Produced by the CLI
// from CodeAnalyzer output and consumed by the reporters (console, JSON).

#ifndef CORE_REPORT_HPP
#define CORE_REPORT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "core/CodeEntities.hpp"
#include "core/Findings.hpp"

namespace CodeRisk
{
namespace core
{

/**
 * @brief Snapshot of an analysis run.
 *
 * Responsibilities:
 *  - Carry whichever views were requested: structure, metrics, defects.
 *  - Stay independent of any output format.
 *
 * Design notes:
 *  - Value type; absent views are std::nullopt.
 *  - The severity summary is only meaningful when a prediction is present.
 */
class Report
{
public:
    using Clock     = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Report() = default;

    Report(std::string sourceName, std::string language)
        : m_sourceName(std::move(sourceName)),
          m_language(std::move(language))
    {
    }

    const std::string& sourceName() const noexcept { return m_sourceName; }
    const std::string& language() const noexcept { return m_language; }

    void setTiming(TimePoint start, TimePoint end) noexcept
    {
        m_analysisStart = start;
        m_analysisEnd   = end;
    }

    TimePoint analysisStart() const noexcept { return m_analysisStart; }
    TimePoint analysisEnd() const noexcept { return m_analysisEnd; }

    /// Wall time between start and end in milliseconds.
    double durationMillis() const noexcept
    {
        return std::chrono::duration<double, std::milli>(m_analysisEnd - m_analysisStart).count();
    }

    void setParseResult(ParseResult result) { m_parse = std::move(result); }
    void setMetrics(MetricsRecord metrics) { m_metrics = std::move(metrics); }

    void setPrediction(DefectPrediction prediction, SeveritySummary summary)
    {
        m_prediction      = std::move(prediction);
        m_severitySummary = std::move(summary);
    }

    const std::optional<ParseResult>& parseResult() const noexcept { return m_parse; }
    const std::optional<MetricsRecord>& metrics() const noexcept { return m_metrics; }
    const std::optional<DefectPrediction>& prediction() const noexcept { return m_prediction; }
    const SeveritySummary& severitySummary() const noexcept { return m_severitySummary; }

private:
    std::string                     m_sourceName;
    std::string                     m_language;
    TimePoint                       m_analysisStart{};
    TimePoint                       m_analysisEnd{};
    std::optional<ParseResult>      m_parse;
    std::optional<MetricsRecord>    m_metrics;
    std::optional<DefectPrediction> m_prediction;
    SeveritySummary                 m_severitySummary;
};

} // namespace core
} // namespace CodeRisk

#endif // CORE_REPORT_HPP
