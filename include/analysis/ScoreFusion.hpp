#pragma once

#include <vector>

#include "core/Findings.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        struct FusionWeights
        {
            double mlWeight          = 0.4;
            double patternWeight     = 0.6;
            double patternNormalizer = 5.0;   // severity-weight sum that saturates the pattern score
            double highThreshold     = 0.7;
            double mediumThreshold   = 0.4;
        };

        /**
         * ScoreFusion
         *
         * Combines rule hits and the classifier probability into one risk
         * score:
         *
         *   pattern = min(1, sum(severityWeight) / patternNormalizer)
         *   risk    = clamp(mlWeight * ml + patternWeight * pattern, 0, 1)
         *
         * rounded to 3 decimals. The level is taken from the rounded score.
         * Pure: no state beyond the weights.
         */
        class ScoreFusion
        {
        public:
            explicit ScoreFusion(FusionWeights weights = FusionWeights{});

            double patternScore(const std::vector<core::FlaggedSection> &flagged) const noexcept;

            core::RiskLevel levelFor(double riskScore) const noexcept;

            /// riskScore, riskLevel and flaggedSections are filled; confidence and issues are left default.
            core::DefectPrediction fuse(std::vector<core::FlaggedSection> flagged, double mlProbability) const;

            const FusionWeights &weights() const noexcept { return m_weights; }

        private:
            FusionWeights m_weights;
        };

    } // namespace Analysis
} // namespace CodeRisk
