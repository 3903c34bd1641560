#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "analysis/ScoreFusion.hpp"
#include "classifier/DefectClassifier.hpp"
#include "rules/CodeSmellDetector.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        /// Invalid configuration value (unknown log level, inverted thresholds, ...).
        class ConfigError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        /**
         * Every tunable of the analyzer, with built-in defaults.
         *
         * Keys read by fromConfig():
         *   smell.long_line, smell.max_nesting, smell.indent_width,
         *   smell.max_conditions,
         *   classifier.seed, classifier.synthetic_samples,
         *   classifier.max_features, classifier.n_estimators,
         *   classifier.trained_confidence,
         *   fusion.ml_weight, fusion.pattern_weight, fusion.pattern_normalizer,
         *   fusion.high_threshold, fusion.medium_threshold,
         *   rules.file, log_level, log_file
         */
        struct AnalyzerSettings
        {
            Rules::SmellThresholds         smells;
            Classifier::ClassifierSettings classifier;
            FusionWeights                  fusion;
            std::optional<std::string>     rulesFile;
            Utils::LogLevel                logLevel = Utils::LogLevel::INFO;
            std::optional<std::string>     logFile;

            /// Missing keys keep their defaults. Throws ConfigError on invalid values.
            static AnalyzerSettings fromConfig(const Utils::ConfigLoader &config);

            /// Apply log_level and log_file to the process-wide logger.
            void applyLogging() const;
        };

    } // namespace Analysis
} // namespace CodeRisk
