#include "report/JsonReporter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string_view>
#include <vector>

#include "core/Severity.hpp"
#include "utils/StringUtils.hpp"

namespace CodeRisk
{
namespace Report
{
    namespace
    {
        /**
         * Streaming JSON text builder. Tracks, per open container, whether
         * the next element needs a separating comma.
         */
        class JsonWriter
        {
        public:
            explicit JsonWriter(bool pretty) : m_pretty(pretty) {}

            JsonWriter &beginObject() { open('{'); return *this; }
            JsonWriter &endObject()   { close('}'); return *this; }
            JsonWriter &beginArray()  { open('['); return *this; }
            JsonWriter &endArray()    { close(']'); return *this; }

            JsonWriter &key(std::string_view k)
            {
                beforeValue();
                m_out += '"';
                m_out += Utils::escapeJson(k);
                m_out += m_pretty ? "\": " : "\":";
                m_afterKey = true;
                return *this;
            }

            JsonWriter &string(std::string_view s)
            {
                beforeValue();
                m_out += '"';
                m_out += Utils::escapeJson(s);
                m_out += '"';
                return *this;
            }

            JsonWriter &optionalString(const std::optional<std::string> &s)
            {
                return s ? string(*s) : null();
            }

            JsonWriter &number(double v)
            {
                if (!std::isfinite(v))
                    return null();
                beforeValue();
                std::ostringstream oss;
                oss << std::setprecision(15) << v;
                m_out += oss.str();
                return *this;
            }

            JsonWriter &integer(long long v)
            {
                beforeValue();
                m_out += std::to_string(v);
                return *this;
            }

            JsonWriter &boolean(bool v)
            {
                beforeValue();
                m_out += v ? "true" : "false";
                return *this;
            }

            JsonWriter &null()
            {
                beforeValue();
                m_out += "null";
                return *this;
            }

            JsonWriter &stringArray(const std::vector<std::string> &values, std::size_t limit = 0)
            {
                const std::size_t n = limit == 0 ? values.size() : std::min(limit, values.size());
                beginArray();
                for (std::size_t i = 0; i < n; ++i)
                    string(values[i]);
                return endArray();
            }

            const std::string &text() const noexcept { return m_out; }

        private:
            void newline()
            {
                m_out += '\n';
                m_out.append(m_firstInScope.size() * 2, ' ');
            }

            void beforeValue()
            {
                if (m_afterKey)
                {
                    m_afterKey = false;
                    return;
                }
                if (m_firstInScope.empty())
                    return;
                if (!m_firstInScope.back())
                    m_out += ',';
                m_firstInScope.back() = false;
                if (m_pretty)
                    newline();
            }

            void open(char bracket)
            {
                beforeValue();
                m_out += bracket;
                m_firstInScope.push_back(true);
            }

            void close(char bracket)
            {
                const bool empty = m_firstInScope.back();
                m_firstInScope.pop_back();
                if (m_pretty && !empty)
                    newline();
                m_out += bracket;
            }

        private:
            bool              m_pretty;
            bool              m_afterKey = false;
            std::vector<bool> m_firstInScope;
            std::string       m_out;
        };

        void writeFunction(JsonWriter &w, const core::FunctionEntity &fn)
        {
            w.beginObject();
            w.key("name").string(fn.name);
            w.key("start_line").integer(fn.startLine);
            w.key("end_line").integer(fn.endLine);
            w.key("signature").string(fn.signature);
            w.key("parameters").beginArray();
            for (const auto &p : fn.parameters)
            {
                w.beginObject();
                w.key("name").string(p.name);
                w.key("declared_type").optionalString(p.declaredType);
                w.key("default_literal").optionalString(p.defaultLiteral);
                w.endObject();
            }
            w.endArray();
            w.key("return_type").optionalString(fn.returnType);
            w.key("body").string(fn.body);
            w.key("decorators").stringArray(fn.decorators);
            w.key("docstring").optionalString(fn.docstring);
            w.key("is_async").boolean(fn.isAsync);
            w.key("is_method").boolean(fn.isMethod);
            w.key("class_name").optionalString(fn.className);
            w.endObject();
        }

        void writeClass(JsonWriter &w, const core::ClassEntity &cls)
        {
            w.beginObject();
            w.key("name").string(cls.name);
            w.key("start_line").integer(cls.startLine);
            w.key("end_line").integer(cls.endLine);
            w.key("bases").stringArray(cls.bases);
            w.key("methods").beginArray();
            for (const auto &m : cls.methods)
                writeFunction(w, m);
            w.endArray();
            w.key("attributes").beginArray();
            for (const auto &a : cls.attributes)
            {
                w.beginObject();
                w.key("name").string(a.name);
                w.key("declared_type").optionalString(a.declaredType);
                w.key("line").integer(a.line);
                w.endObject();
            }
            w.endArray();
            w.key("docstring").optionalString(cls.docstring);
            w.key("decorators").stringArray(cls.decorators);
            w.endObject();
        }

        void writeParseResult(JsonWriter &w, const core::ParseResult &r)
        {
            w.beginObject();
            w.key("language").string(r.language);
            w.key("functions").beginArray();
            for (const auto &fn : r.functions)
                writeFunction(w, fn);
            w.endArray();
            w.key("classes").beginArray();
            for (const auto &cls : r.classes)
                writeClass(w, cls);
            w.endArray();
            w.key("imports").stringArray(r.imports);
            w.key("global_variables").beginArray();
            for (const auto &g : r.globalVariables)
            {
                w.beginObject();
                w.key("name").string(g.name);
                w.key("line").integer(g.line);
                w.key("value_repr").string(g.valueRepr);
                w.endObject();
            }
            w.endArray();
            w.key("errors").stringArray(r.errors);
            w.key("complexity_score").number(r.complexityScore);
            w.endObject();
        }

        void writeStructure(JsonWriter &w, const core::ParseResult &r)
        {
            w.beginObject();
            w.key("functions").beginArray();
            for (const auto &fn : r.functions)
            {
                std::vector<std::string> params;
                for (const auto &p : fn.parameters)
                    params.push_back(p.name);
                w.beginObject();
                w.key("name").string(fn.name);
                w.key("line").integer(fn.startLine);
                w.key("params").stringArray(params);
                w.endObject();
            }
            w.endArray();
            w.key("classes").beginArray();
            for (const auto &cls : r.classes)
            {
                std::vector<std::string> methods;
                for (const auto &m : cls.methods)
                    methods.push_back(m.name);
                w.beginObject();
                w.key("name").string(cls.name);
                w.key("line").integer(cls.startLine);
                w.key("methods").stringArray(methods);
                w.endObject();
            }
            w.endArray();
            w.key("imports").stringArray(r.imports, JsonReporter::kStructureImportLimit);
            w.key("errors").stringArray(r.errors);
            w.endObject();
        }

        void writeMetrics(JsonWriter &w, const core::MetricsRecord &m)
        {
            w.beginObject();
            w.key("total_lines").integer(static_cast<long long>(m.totalLines));
            w.key("code_lines").integer(static_cast<long long>(m.codeLines));
            w.key("blank_lines").integer(static_cast<long long>(m.blankLines));
            w.key("comment_lines").integer(static_cast<long long>(m.commentLines));
            w.key("functions_count").integer(static_cast<long long>(m.functionCount));
            w.key("classes_count").integer(static_cast<long long>(m.classCount));
            w.key("imports_count").integer(static_cast<long long>(m.importCount));
            w.key("complexity_score").number(m.complexityScore);
            w.key("avg_function_length").number(m.avgFunctionLength);
            w.endObject();
        }

        void writePrediction(JsonWriter &w, const core::DefectPrediction &p, const core::SeveritySummary &summary)
        {
            w.beginObject();
            w.key("risk_score").number(p.riskScore);
            w.key("risk_level").string(core::riskLevelName(p.riskLevel));
            w.key("flagged_sections").beginArray();
            for (const auto &s : p.flaggedSections)
            {
                w.beginObject();
                w.key("line").integer(s.line);
                w.key("code").string(s.code);
                w.key("issue").string(s.issue);
                w.key("severity").string(core::severityName(s.severity));
                w.key("rule_id").string(s.ruleId);
                w.endObject();
            }
            w.endArray();
            w.key("confidence").number(p.confidence);
            w.key("issues_detected").stringArray(p.issuesDetected);
            w.key("severity_summary").beginObject();
            for (core::Severity sev : core::kAllSeverities)
            {
                auto it = summary.find(sev);
                w.key(core::severityName(sev)).integer(
                    it == summary.end() ? 0 : static_cast<long long>(it->second));
            }
            w.endObject();
            w.endObject();
        }
    } // namespace

    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    std::string JsonReporter::parseResultToJson(const core::ParseResult &result) const
    {
        JsonWriter w(m_prettyPrint == PrettyPrint::PRETTY);
        writeParseResult(w, result);
        return w.text();
    }

    std::string JsonReporter::structureToJson(const core::ParseResult &result) const
    {
        JsonWriter w(m_prettyPrint == PrettyPrint::PRETTY);
        writeStructure(w, result);
        return w.text();
    }

    std::string JsonReporter::metricsToJson(const core::MetricsRecord &metrics) const
    {
        JsonWriter w(m_prettyPrint == PrettyPrint::PRETTY);
        writeMetrics(w, metrics);
        return w.text();
    }

    std::string JsonReporter::predictionToJson(const core::DefectPrediction &prediction,
                                               const core::SeveritySummary &summary) const
    {
        JsonWriter w(m_prettyPrint == PrettyPrint::PRETTY);
        writePrediction(w, prediction, summary);
        return w.text();
    }

    std::string JsonReporter::reportToJson(const core::Report &report) const
    {
        JsonWriter w(m_prettyPrint == PrettyPrint::PRETTY);
        w.beginObject();
        w.key("source").string(report.sourceName());
        w.key("language").string(report.language());
        w.key("analysis_time_ms").number(std::round(report.durationMillis() * 1000.0) / 1000.0);

        if (const auto &parsed = report.parseResult())
        {
            w.key("parse");
            writeParseResult(w, *parsed);
            w.key("structure");
            writeStructure(w, *parsed);
        }
        if (const auto &metrics = report.metrics())
        {
            w.key("metrics");
            writeMetrics(w, *metrics);
        }
        if (const auto &prediction = report.prediction())
        {
            w.key("defects");
            writePrediction(w, *prediction, report.severitySummary());
        }
        w.endObject();
        return w.text();
    }

    void JsonReporter::writeJson(const core::Report &report, std::ostream &output) const
    {
        output << reportToJson(report) << '\n';
    }

} // namespace Report
} // namespace CodeRisk
