#include "analysis/ScoreFusion.hpp"

#include <algorithm>
#include <cmath>

namespace CodeRisk
{
    namespace Analysis
    {
        namespace
        {
            double roundTo3(double value) noexcept
            {
                return std::round(value * 1000.0) / 1000.0;
            }
        }

        ScoreFusion::ScoreFusion(FusionWeights weights)
            : m_weights(weights)
        {
            if (m_weights.patternNormalizer <= 0.0)
                m_weights.patternNormalizer = 1.0;
        }

        double ScoreFusion::patternScore(const std::vector<core::FlaggedSection> &flagged) const noexcept
        {
            double sum = 0.0;
            for (const auto &section : flagged)
                sum += core::severityWeight(section.severity);
            return std::min(1.0, sum / m_weights.patternNormalizer);
        }

        core::RiskLevel ScoreFusion::levelFor(double riskScore) const noexcept
        {
            if (riskScore >= m_weights.highThreshold)
                return core::RiskLevel::High;
            if (riskScore >= m_weights.mediumThreshold)
                return core::RiskLevel::Medium;
            return core::RiskLevel::Low;
        }

        core::DefectPrediction ScoreFusion::fuse(std::vector<core::FlaggedSection> flagged, double mlProbability) const
        {
            const double ml = std::isnan(mlProbability) ? 0.5 : std::clamp(mlProbability, 0.0, 1.0);
            const double raw = m_weights.mlWeight * ml + m_weights.patternWeight * patternScore(flagged);

            core::DefectPrediction prediction;
            prediction.riskScore       = roundTo3(std::clamp(raw, 0.0, 1.0));
            prediction.riskLevel       = levelFor(prediction.riskScore);
            prediction.flaggedSections = std::move(flagged);
            return prediction;
        }

    } // namespace Analysis
} // namespace CodeRisk
