#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rules/PatternRuleEngine.hpp"
#include "rules/RuleCatalog.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

using namespace CodeRisk;
using core::Severity;

class RuleEngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        Utils::getLogger().setLevel(Utils::LogLevel::ERROR);
        catalog = std::make_shared<const Rules::RuleCatalog>(Rules::RuleCatalog::builtIn());
    }

    static void TearDownTestSuite() {
        catalog.reset();
    }

    std::vector<std::string> ruleIds(const std::vector<core::FlaggedSection> &flagged) const {
        std::vector<std::string> ids;
        for (const auto &f : flagged)
            ids.push_back(f.ruleId);
        return ids;
    }

    static std::shared_ptr<const Rules::RuleCatalog> catalog;
};

std::shared_ptr<const Rules::RuleCatalog> RuleEngineTest::catalog;

TEST_F(RuleEngineTest, BuiltInCatalogSize) {
    EXPECT_EQ(catalog->size(), 46u);
    EXPECT_EQ(catalog->rulesFor("python").size(), 17u + 4u);
    EXPECT_EQ(catalog->rulesFor("javascript").size(), 13u + 4u);
    EXPECT_EQ(catalog->rulesFor("java").size(), 12u + 4u);
    EXPECT_EQ(catalog->rulesFor("typescript").size(), 4u);
    EXPECT_EQ(catalog->rulesFor("cobol").size(), 4u);
}

TEST_F(RuleEngineTest, BareExceptWithPass) {
    Rules::PatternRuleEngine engine(catalog);
    const auto flagged = engine.scan("except:\n    pass\n", "python");

    ASSERT_EQ(flagged.size(), 2u);
    EXPECT_EQ(flagged[0].ruleId, "python.bare_except");
    EXPECT_EQ(flagged[0].line, 1);
    EXPECT_EQ(flagged[0].code, "except:");
    EXPECT_EQ(flagged[0].severity, Severity::Error);
    EXPECT_EQ(flagged[1].ruleId, "python.bare_pass");
    EXPECT_EQ(flagged[1].line, 2);
    EXPECT_EQ(flagged[1].code, "pass");
    EXPECT_EQ(flagged[1].severity, Severity::Info);

    const std::vector<std::string> issues = {
        "Line 1: Bare except clause catches all exceptions",
        "Line 2: Empty block with pass",
    };
    EXPECT_EQ(Rules::PatternRuleEngine::issueSummaries(flagged), issues);
}

TEST_F(RuleEngineTest, HitsAreGroupedByRuleThenLine) {
    Rules::PatternRuleEngine engine(catalog);
    const auto flagged = engine.scan("exec(c)\neval(a)\neval(b)\n", "py");

    const std::vector<std::string> ids = {"python.eval", "python.eval", "python.exec"};
    EXPECT_EQ(ruleIds(flagged), ids);
    ASSERT_EQ(flagged.size(), 3u);
    EXPECT_EQ(flagged[0].line, 2);
    EXPECT_EQ(flagged[1].line, 3);
    EXPECT_EQ(flagged[2].line, 1);
}

TEST_F(RuleEngineTest, MatchingIsCaseInsensitive) {
    Rules::PatternRuleEngine engine(catalog);
    const auto flagged = engine.scan("EVAL(x)", "python");

    ASSERT_EQ(flagged.size(), 1u);
    EXPECT_EQ(flagged[0].ruleId, "python.eval");
    EXPECT_EQ(flagged[0].severity, Severity::Security);
}

TEST_F(RuleEngineTest, UnknownLanguageUsesGeneralRulesOnly) {
    Rules::PatternRuleEngine engine(catalog);

    EXPECT_EQ(ruleIds(engine.scan("token = get()", "cobol")), std::vector<std::string>{"general.secret"});
    EXPECT_TRUE(engine.scan("eval(x)", "cobol").empty());
}

TEST_F(RuleEngineTest, ScanIsDeterministic) {
    Rules::PatternRuleEngine engine(catalog);
    const std::string code = "var x = 1;\nif (x == null) { console.log(x); }\n// TODO: fix\n";

    EXPECT_EQ(engine.scan(code, "javascript"), engine.scan(code, "javascript"));
    EXPECT_FALSE(engine.scan(code, "javascript").empty());
}

TEST_F(RuleEngineTest, EmptyInputHasNoHits) {
    Rules::PatternRuleEngine engine(catalog);
    EXPECT_TRUE(engine.scan("", "python").empty());
}

TEST_F(RuleEngineTest, OverlongLinesAreSkippedInEveryLanguage) {
    Rules::PatternRuleEngine engine(catalog);
    const std::string filler(200000, 'a');

    const std::vector<std::pair<std::string, std::string>> samples = {
        {"python",     "print(\"" + filler + "\")\neval(x)\n"},
        {"javascript", "p.then(function(){" + filler + "});\neval(x)\n"},
        {"typescript", "p.then(function(){" + filler + "});\ntoken = get()\n"},
        {"java",       "String s = \"" + filler + "\"; // TODO\nSystem.out.println(x);\n"},
        {"cobol",      "password = '" + filler + "'\ntoken = get()\n"},
    };

    for (const auto &[language, code] : samples)
    {
        const auto flagged = engine.scan(code, language);
        ASSERT_FALSE(flagged.empty()) << language;
        for (const auto &section : flagged)
            EXPECT_EQ(section.line, 2) << language << " " << section.ruleId;
    }
}

TEST_F(RuleEngineTest, LineLengthCapIsInclusive) {
    Rules::PatternRuleEngine engine(catalog);
    const std::size_t cap = Rules::PatternRuleEngine::kMaxLineLength;

    const std::string atCap = "eval(x)" + std::string(cap - 7, ' ');
    const std::string overCap = atCap + " ";

    EXPECT_EQ(ruleIds(engine.scan(atCap, "python")), std::vector<std::string>{"python.eval"});
    EXPECT_TRUE(engine.scan(overCap, "python").empty());
}

TEST(RuleCatalogTest, ExtraRulesAppendInKeyOrderAndReplaceById) {
    auto catalog = Rules::RuleCatalog::builtIn();

    Utils::ConfigLoader config;
    config.loadFromString(
        "rule.z.custom = python | warning | Custom thing | custom_call\\(\n"
        "rule.python.eval = python | info | Replaced | eval\\s*\\(\n"
        "rule.a.other = general | suggestion | Other | zzz|yyy\n");

    EXPECT_EQ(catalog.loadExtraRules(config), 3u);
    ASSERT_EQ(catalog.size(), 48u);
    EXPECT_EQ(catalog.rules()[1].id, "python.eval");
    EXPECT_EQ(catalog.rules()[1].message, "Replaced");
    EXPECT_EQ(catalog.rules()[1].severity, Severity::Info);
    EXPECT_EQ(catalog.rules()[46].id, "a.other");
    EXPECT_EQ(catalog.rules()[47].id, "z.custom");

    Rules::PatternRuleEngine engine(std::make_shared<const Rules::RuleCatalog>(std::move(catalog)));
    const auto flagged = engine.scan("custom_call()\nyyy\n", "python");
    ASSERT_EQ(flagged.size(), 2u);
    EXPECT_EQ(flagged[0].ruleId, "z.custom");
    EXPECT_EQ(flagged[0].severity, Severity::Warning);
    EXPECT_EQ(flagged[1].ruleId, "a.other");
    EXPECT_EQ(flagged[1].line, 2);
}

TEST(RuleCatalogTest, InvalidRulesAreRejected) {
    Rules::RuleCatalog catalog;

    EXPECT_THROW(catalog.addRule("python", "bad.regex", "(unclosed", "msg", Severity::Error),
                 Rules::RuleCatalogError);
    EXPECT_THROW(catalog.addRule("python", "bad.severity", "x", "msg", "fatal"), Rules::RuleCatalogError);
    EXPECT_THROW(catalog.addRule("python", "", "x", "msg", Severity::Info), Rules::RuleCatalogError);
    EXPECT_EQ(catalog.size(), 0u);

    const std::vector<std::string> malformed = {
        "rule.x = python | warning | only three\n",
        "rule.x = python | fatal | msg | pat\n",
        "rule.x = python | warning | | pat\n",
    };
    for (const auto &text : malformed)
    {
        Utils::ConfigLoader config;
        config.loadFromString(text);
        EXPECT_THROW(catalog.loadExtraRules(config), Rules::RuleCatalogError) << text;
    }
}

TEST(RuleCatalogTest, MissingRulesFileThrows) {
    Rules::RuleCatalog catalog;
    EXPECT_THROW(catalog.loadExtraRulesFromFile("/nonexistent/rules.conf"), Rules::RuleCatalogError);
}

TEST(RuleCatalogTest, DuplicateIdKeepsPosition) {
    Rules::RuleCatalog catalog;
    catalog.addRule("python", "first", "a", "A", Severity::Info);
    catalog.addRule("python", "second", "b", "B", Severity::Info);
    catalog.addRule("python", "first", "c", "C", Severity::Error);

    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog.rules()[0].id, "first");
    EXPECT_EQ(catalog.rules()[0].pattern, "c");
    EXPECT_EQ(catalog.rules()[1].id, "second");
}
