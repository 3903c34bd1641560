#include "analysis/CodeAnalyzer.hpp"

#include <stdexcept>
#include <string>

#include "utils/Logger.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        CodeAnalyzer::CodeAnalyzer(std::shared_ptr<const Rules::RuleCatalog> catalog,
                                   std::shared_ptr<const Classifier::DefectClassifier> classifier,
                                   Rules::SmellThresholds smells,
                                   FusionWeights fusion)
            : m_classifier(std::move(classifier)),
              m_metrics(m_parser),
              m_rules(std::move(catalog)),
              m_smells(smells),
              m_fusion(fusion)
        {
            if (!m_classifier)
                throw std::invalid_argument("CodeAnalyzer requires a classifier");

            if (!m_classifier->isTrained())
                Utils::getLogger().warn("CodeAnalyzer: classifier is untrained; ML probability fixed at 0.5");

            Utils::getLogger().info("CodeAnalyzer ready (" + std::to_string(m_rules.catalog().size()) + " rules)");
        }

        std::unique_ptr<CodeAnalyzer> CodeAnalyzer::fromSettings(const AnalyzerSettings &settings)
        {
            auto catalog = std::make_shared<Rules::RuleCatalog>(Rules::RuleCatalog::builtIn());
            if (settings.rulesFile && !settings.rulesFile->empty())
                catalog->loadExtraRulesFromFile(*settings.rulesFile);

            auto classifier = std::make_shared<const Classifier::DefectClassifier>(settings.classifier);

            return std::make_unique<CodeAnalyzer>(std::move(catalog), std::move(classifier),
                                                  settings.smells, settings.fusion);
        }

        core::ParseResult CodeAnalyzer::parse(std::string_view code, std::string_view language) const
        {
            return m_parser.parse(code, language);
        }

        core::MetricsRecord CodeAnalyzer::metrics(std::string_view code, std::string_view language) const
        {
            return m_metrics.metrics(code, language);
        }

        core::DefectPrediction CodeAnalyzer::analyze(std::string_view code, std::string_view language) const
        {
            auto flagged = m_rules.scan(code, language);
            auto issues  = Rules::PatternRuleEngine::issueSummaries(flagged);

            for (auto &smell : m_smells.detect(code))
                issues.push_back(std::move(smell));

            const double ml = m_classifier->classify(code);

            core::DefectPrediction prediction = m_fusion.fuse(std::move(flagged), ml);
            prediction.confidence     = m_classifier->confidence();
            prediction.issuesDetected = std::move(issues);

            Utils::getLogger().debug("Analysis: ml=" + std::to_string(ml)
                                     + " risk=" + std::to_string(prediction.riskScore)
                                     + " level=" + core::riskLevelName(prediction.riskLevel));
            return prediction;
        }

        core::SeveritySummary CodeAnalyzer::summarize(const std::vector<core::FlaggedSection> &flagged)
        {
            core::SeveritySummary summary;
            for (core::Severity s : core::kAllSeverities)
                summary[s] = 0;
            for (const auto &section : flagged)
                ++summary[section.severity];
            return summary;
        }

    } // namespace Analysis
} // namespace CodeRisk
