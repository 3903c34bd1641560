#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/Report.hpp"
#include "report/JsonReporter.hpp"
#include "report/ReportGenerator.hpp"
#include "utils/StringUtils.hpp"

using namespace CodeRisk;
using core::Severity;

namespace {

core::DefectPrediction samplePrediction() {
    core::FlaggedSection section;
    section.line     = 1;
    section.code     = "except:";
    section.issue    = "Bare";
    section.severity = Severity::Error;
    section.ruleId   = "python.bare_except";

    core::DefectPrediction p;
    p.riskScore       = 0.344;
    p.riskLevel       = core::RiskLevel::Low;
    p.flaggedSections = {section};
    p.confidence      = 0.8;
    p.issuesDetected  = {"Line 1: Bare"};
    return p;
}

core::SeveritySummary summaryOf(const core::DefectPrediction &p) {
    core::SeveritySummary summary;
    for (Severity s : core::kAllSeverities)
        summary[s] = 0;
    for (const auto &f : p.flaggedSections)
        ++summary[f.severity];
    return summary;
}

} // namespace

TEST(JsonReporterTest, CompactPrediction) {
    Report::JsonReporter reporter;
    const auto p = samplePrediction();

    EXPECT_EQ(reporter.predictionToJson(p, summaryOf(p)),
              "{\"risk_score\":0.344,\"risk_level\":\"low\","
              "\"flagged_sections\":[{\"line\":1,\"code\":\"except:\",\"issue\":\"Bare\","
              "\"severity\":\"error\",\"rule_id\":\"python.bare_except\"}],"
              "\"confidence\":0.8,\"issues_detected\":[\"Line 1: Bare\"],"
              "\"severity_summary\":{\"error\":1,\"security\":0,\"warning\":0,\"info\":0,\"suggestion\":0}}");
}

TEST(JsonReporterTest, MissingSeveritiesAreWrittenAsZero) {
    Report::JsonReporter reporter;
    const auto json = reporter.predictionToJson(core::DefectPrediction{}, core::SeveritySummary{});

    EXPECT_NE(json.find("\"flagged_sections\":[]"), std::string::npos);
    EXPECT_NE(json.find("{\"error\":0,\"security\":0,\"warning\":0,\"info\":0,\"suggestion\":0}"),
              std::string::npos);
}

TEST(JsonReporterTest, PrettyPrintIndentsTwoSpaces) {
    Report::JsonReporter reporter(Report::JsonReporter::PrettyPrint::PRETTY);
    const auto p    = samplePrediction();
    const auto json = reporter.predictionToJson(p, summaryOf(p));

    EXPECT_EQ(json.rfind("{\n  \"risk_score\": 0.344,\n  \"risk_level\": \"low\",", 0), 0u);
    EXPECT_NE(json.find("\n    {\n      \"line\": 1,"), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}

TEST(JsonReporterTest, MetricsFields) {
    core::MetricsRecord m;
    m.totalLines        = 9;
    m.codeLines         = 5;
    m.blankLines        = 3;
    m.commentLines      = 1;
    m.functionCount     = 2;
    m.classCount        = 0;
    m.importCount       = 1;
    m.complexityScore   = 5.0;
    m.avgFunctionLength = 2.5;

    EXPECT_EQ(Report::JsonReporter().metricsToJson(m),
              "{\"total_lines\":9,\"code_lines\":5,\"blank_lines\":3,\"comment_lines\":1,"
              "\"functions_count\":2,\"classes_count\":0,\"imports_count\":1,"
              "\"complexity_score\":5,\"avg_function_length\":2.5}");
}

TEST(JsonReporterTest, StructureViewCapsImports) {
    core::ParseResult parsed;
    parsed.language = "python";
    for (int i = 0; i < 25; ++i)
        parsed.imports.push_back("mod" + std::to_string(i));

    core::FunctionEntity fn;
    fn.name      = "f";
    fn.startLine = 3;
    fn.parameters.push_back({"a", std::nullopt, std::nullopt});
    parsed.functions.push_back(fn);

    Report::JsonReporter reporter;
    const auto structure = reporter.structureToJson(parsed);
    EXPECT_EQ(Utils::countOccurrences(structure, "\"mod"), 20u);
    EXPECT_NE(structure.find("{\"name\":\"f\",\"line\":3,\"params\":[\"a\"]}"), std::string::npos);

    const auto full = reporter.parseResultToJson(parsed);
    EXPECT_EQ(Utils::countOccurrences(full, "\"mod"), 25u);
    EXPECT_NE(full.find("\"declared_type\":null,\"default_literal\":null"), std::string::npos);
    EXPECT_NE(full.find("\"complexity_score\":0"), std::string::npos);
}

TEST(JsonReporterTest, StringsAreEscaped) {
    auto p = samplePrediction();
    p.flaggedSections[0].code = "print(\"a\\tb\")";

    const auto json = Report::JsonReporter().predictionToJson(p, summaryOf(p));
    EXPECT_NE(json.find("\"code\":\"print(\\\"a\\\\tb\\\")\""), std::string::npos);
}

TEST(JsonReporterTest, ReportContainsOnlyComputedViews) {
    core::Report report("sample.py", "python");
    const auto p = samplePrediction();
    report.setPrediction(p, summaryOf(p));

    const auto json = Report::JsonReporter().reportToJson(report);
    EXPECT_EQ(json.rfind("{\"source\":\"sample.py\",\"language\":\"python\",\"analysis_time_ms\":", 0), 0u);
    EXPECT_NE(json.find("\"defects\":{\"risk_score\":0.344"), std::string::npos);
    EXPECT_EQ(json.find("\"metrics\""), std::string::npos);
    EXPECT_EQ(json.find("\"parse\""), std::string::npos);
}

TEST(ReportGeneratorTest, JsonOutputEndsWithNewline) {
    core::Report report("sample.py", "python");
    report.setMetrics(core::MetricsRecord{});

    auto generator = Report::Factory::createJsonReport(false);
    generator->generateReport(report);

    std::ostringstream out;
    ASSERT_TRUE(generator->writeReport(out));
    EXPECT_EQ(out.str().back(), '\n');
    EXPECT_NE(out.str().find("\"metrics\":{\"total_lines\":0"), std::string::npos);
}

TEST(ReportGeneratorTest, ConsoleOutputMentionsRisk) {
    core::Report report("sample.py", "python");
    const auto p = samplePrediction();
    report.setPrediction(p, summaryOf(p));

    auto generator = Report::Factory::createConsoleReport();
    generator->generateReport(report);

    const std::string text = generator->getReportString();
    EXPECT_NE(text.find("sample.py"), std::string::npos);
    EXPECT_NE(text.find("except:"), std::string::npos);
}
