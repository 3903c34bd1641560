#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "analysis/AnalyzerSettings.hpp"
#include "analysis/MetricsCalculator.hpp"
#include "analysis/ScoreFusion.hpp"
#include "classifier/DefectClassifier.hpp"
#include "core/CodeEntities.hpp"
#include "core/Findings.hpp"
#include "parser/CodeParser.hpp"
#include "rules/CodeSmellDetector.hpp"
#include "rules/PatternRuleEngine.hpp"
#include "rules/RuleCatalog.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        /**
         * CodeAnalyzer
         *
         * Responsibilities:
         *  - Entry point for the three analyses of a snippet:
         *    parse (structure), metrics (size/shape) and analyze (defect risk).
         *  - analyze: rule scan + code smells + classifier probability,
         *    fused into one DefectPrediction.
         *  - summarize: count flagged sections per severity.
         *
         * Design notes:
         *  - The rule catalog and the classifier are built once and injected
         *    as shared read-only objects; every method is const and may be
         *    called from several threads.
         *  - No method throws for malformed code or an unknown language.
         */
        class CodeAnalyzer
        {
        public:
            CodeAnalyzer(std::shared_ptr<const Rules::RuleCatalog> catalog,
                         std::shared_ptr<const Classifier::DefectClassifier> classifier,
                         Rules::SmellThresholds smells = Rules::SmellThresholds{},
                         FusionWeights fusion = FusionWeights{});

            CodeAnalyzer(const CodeAnalyzer &)            = delete;
            CodeAnalyzer &operator=(const CodeAnalyzer &) = delete;

            /**
             * Build the catalog (built-in rules plus settings.rulesFile) and
             * train the classifier. Throws Rules::RuleCatalogError when the
             * rules file is unreadable or malformed.
             */
            static std::unique_ptr<CodeAnalyzer> fromSettings(const AnalyzerSettings &settings);

            core::ParseResult parse(std::string_view code, std::string_view language) const;

            core::MetricsRecord metrics(std::string_view code, std::string_view language) const;

            core::DefectPrediction analyze(std::string_view code, std::string_view language) const;

            /// Every severity is present, zero when absent from flagged.
            static core::SeveritySummary summarize(const std::vector<core::FlaggedSection> &flagged);

            const Classifier::DefectClassifier &classifier() const noexcept { return *m_classifier; }
            const Rules::RuleCatalog &catalog() const noexcept { return m_rules.catalog(); }

        private:
            std::shared_ptr<const Classifier::DefectClassifier> m_classifier;
            Parser::CodeParser                                  m_parser;
            MetricsCalculator                                   m_metrics;
            Rules::PatternRuleEngine                            m_rules;
            Rules::CodeSmellDetector                            m_smells;
            ScoreFusion                                         m_fusion;
        };

    } // namespace Analysis
} // namespace CodeRisk
