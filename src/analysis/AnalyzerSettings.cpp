#include "analysis/AnalyzerSettings.hpp"

#include <cstdint>

namespace CodeRisk
{
    namespace Analysis
    {
        namespace
        {
            double unitInterval(const Utils::ConfigLoader &config, std::string_view key, double fallback)
            {
                const double v = config.getDoubleOr(key, fallback);
                if (v < 0.0 || v > 1.0)
                    throw ConfigError(std::string(key) + " must be within [0, 1]");
                return v;
            }
        } // namespace

        AnalyzerSettings AnalyzerSettings::fromConfig(const Utils::ConfigLoader &config)
        {
            AnalyzerSettings s;

            s.smells.longLine      = config.getSizeOr("smell.long_line", s.smells.longLine);
            s.smells.maxNesting    = config.getSizeOr("smell.max_nesting", s.smells.maxNesting);
            s.smells.indentWidth   = config.getSizeOr("smell.indent_width", s.smells.indentWidth);
            s.smells.maxConditions = config.getSizeOr("smell.max_conditions", s.smells.maxConditions);

            s.classifier.seed = static_cast<std::uint32_t>(config.getSizeOr("classifier.seed", s.classifier.seed));
            s.classifier.syntheticSamples =
                config.getSizeOr("classifier.synthetic_samples", s.classifier.syntheticSamples);
            s.classifier.maxFeatures = config.getSizeOr("classifier.max_features", s.classifier.maxFeatures);
            s.classifier.nEstimators = config.getSizeOr("classifier.n_estimators", s.classifier.nEstimators);
            s.classifier.trainedConfidence =
                unitInterval(config, "classifier.trained_confidence", s.classifier.trainedConfidence);

            if (s.classifier.maxFeatures == 0)
                throw ConfigError("classifier.max_features must be positive");
            if (s.classifier.nEstimators == 0)
                throw ConfigError("classifier.n_estimators must be positive");

            s.fusion.mlWeight        = unitInterval(config, "fusion.ml_weight", s.fusion.mlWeight);
            s.fusion.patternWeight   = unitInterval(config, "fusion.pattern_weight", s.fusion.patternWeight);
            s.fusion.highThreshold   = unitInterval(config, "fusion.high_threshold", s.fusion.highThreshold);
            s.fusion.mediumThreshold = unitInterval(config, "fusion.medium_threshold", s.fusion.mediumThreshold);
            s.fusion.patternNormalizer =
                config.getDoubleOr("fusion.pattern_normalizer", s.fusion.patternNormalizer);

            if (s.fusion.patternNormalizer <= 0.0)
                throw ConfigError("fusion.pattern_normalizer must be positive");
            if (s.fusion.mediumThreshold > s.fusion.highThreshold)
                throw ConfigError("fusion.medium_threshold must not exceed fusion.high_threshold");

            s.rulesFile = config.getString("rules.file");
            s.logFile   = config.getString("log_file");

            if (auto levelText = config.getString("log_level"))
            {
                auto level = Utils::parseLogLevel(*levelText);
                if (!level)
                    throw ConfigError("log_level: unknown level '" + *levelText + "'");
                s.logLevel = *level;
            }

            return s;
        }

        void AnalyzerSettings::applyLogging() const
        {
            auto &log = Utils::getLogger();
            log.setLevel(logLevel);
            if (logFile && !logFile->empty() && !log.openFile(*logFile))
                log.warn("Cannot open log file '" + *logFile + "'; logging to console only");
        }

    } // namespace Analysis
} // namespace CodeRisk
