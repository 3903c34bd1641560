#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "analysis/AnalyzerSettings.hpp"
#include "utils/ConfigLoader.hpp"

using namespace CodeRisk;

TEST(ConfigLoaderTest, ParsesKeyValueLines) {
    Utils::ConfigLoader config;
    config.loadFromString(
        "# comment\n"
        "; another comment\n"
        "smell.long_line = 100\r\n"
        "fusion.ml_weight=0.25\n"
        "rule.x = python | error | Msg | a=b\n"
        "not a pair\n"
        "\n");

    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config.getInt("smell.long_line"), 100);
    EXPECT_DOUBLE_EQ(config.getDoubleOr("fusion.ml_weight", 0.0), 0.25);
    EXPECT_EQ(config.getStringOr("rule.x", ""), "python | error | Msg | a=b");
    EXPECT_FALSE(config.hasKey("not a pair"));
}

TEST(ConfigLoaderTest, TypedGettersRejectBadValues) {
    Utils::ConfigLoader config;
    config.set("count", "-3");
    config.set("word", "abc");

    EXPECT_FALSE(config.getSize("count").has_value());
    EXPECT_EQ(config.getSizeOr("count", 7u), 7u);
    EXPECT_FALSE(config.getInt("word").has_value());
    EXPECT_EQ(config.getStringOr("missing", "fallback"), "fallback");
}

TEST(ConfigLoaderTest, LastDuplicateWinsAndPrefixKeysAreSorted) {
    Utils::ConfigLoader config;
    config.loadFromString("rule.b = 1\nrule.a = 2\nother = 3\nrule.b = 4\n");

    const std::vector<std::string> expected = {"rule.a", "rule.b"};
    EXPECT_EQ(config.keysWithPrefix("rule."), expected);
    EXPECT_EQ(config.getInt("rule.b"), 4);
}

TEST(ConfigLoaderTest, MissingFileFails) {
    Utils::ConfigLoader config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/code_risk.conf"));
}

TEST(AnalyzerSettingsTest, EmptyConfigKeepsDefaults) {
    Utils::ConfigLoader config;
    const auto settings = Analysis::AnalyzerSettings::fromConfig(config);

    EXPECT_EQ(settings.smells.longLine, 120u);
    EXPECT_EQ(settings.smells.maxNesting, 4u);
    EXPECT_EQ(settings.smells.maxConditions, 3u);
    EXPECT_EQ(settings.classifier.seed, 42u);
    EXPECT_EQ(settings.classifier.nEstimators, 100u);
    EXPECT_DOUBLE_EQ(settings.fusion.mlWeight, 0.4);
    EXPECT_DOUBLE_EQ(settings.fusion.patternWeight, 0.6);
    EXPECT_DOUBLE_EQ(settings.fusion.patternNormalizer, 5.0);
    EXPECT_DOUBLE_EQ(settings.fusion.highThreshold, 0.7);
    EXPECT_DOUBLE_EQ(settings.fusion.mediumThreshold, 0.4);
    EXPECT_FALSE(settings.rulesFile.has_value());
    EXPECT_EQ(settings.logLevel, Utils::LogLevel::INFO);
}

TEST(AnalyzerSettingsTest, OverridesAreApplied) {
    Utils::ConfigLoader config;
    config.loadFromString(
        "smell.long_line = 80\n"
        "classifier.seed = 7\n"
        "fusion.high_threshold = 0.9\n"
        "rules.file = config/extra_rules.conf\n"
        "log_level = warning\n");

    const auto settings = Analysis::AnalyzerSettings::fromConfig(config);
    EXPECT_EQ(settings.smells.longLine, 80u);
    EXPECT_EQ(settings.classifier.seed, 7u);
    EXPECT_DOUBLE_EQ(settings.fusion.highThreshold, 0.9);
    ASSERT_TRUE(settings.rulesFile.has_value());
    EXPECT_EQ(*settings.rulesFile, "config/extra_rules.conf");
    EXPECT_EQ(settings.logLevel, Utils::LogLevel::WARN);
}

TEST(AnalyzerSettingsTest, InvalidValuesThrow) {
    const std::vector<std::string> invalid = {
        "log_level = loud\n",
        "fusion.medium_threshold = 0.8\nfusion.high_threshold = 0.5\n",
        "fusion.ml_weight = 1.5\n",
        "fusion.pattern_normalizer = 0\n",
        "classifier.n_estimators = 0\n",
    };

    for (const auto &text : invalid)
    {
        Utils::ConfigLoader config;
        config.loadFromString(text);
        EXPECT_THROW(Analysis::AnalyzerSettings::fromConfig(config), Analysis::ConfigError) << text;
    }
}
