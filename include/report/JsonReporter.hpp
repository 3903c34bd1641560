#pragma once

#include <ostream>
#include <string>

#include "core/CodeEntities.hpp"
#include "core/Findings.hpp"
#include "core/Report.hpp"

namespace CodeRisk
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Serialise parse results, metrics and defect predictions with
         *    snake_case field names ("risk_score", "flagged_sections", ...).
         *  - Render the condensed "structure" view: functions
         *    {name, line, params}, classes {name, line, methods}, imports
         *    (first 20) and errors.
         *
         * Design notes:
         *  - Hand-written writer, RFC 8259 escaping via Utils::escapeJson.
         *  - Compact and pretty-print modes; field order is fixed.
         *  - Absent optionals are written as null.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // Indented, two spaces per level
            };

            static constexpr std::size_t kStructureImportLimit = 20;

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            std::string parseResultToJson(const core::ParseResult &result) const;
            std::string structureToJson(const core::ParseResult &result) const;
            std::string metricsToJson(const core::MetricsRecord &metrics) const;
            std::string predictionToJson(const core::DefectPrediction &prediction,
                                         const core::SeveritySummary &summary) const;

            /// Whole report: source, language, duration, then each present view.
            std::string reportToJson(const core::Report &report) const;

            void writeJson(const core::Report &report, std::ostream &output) const;

            void setPrettyPrint(PrettyPrint mode) noexcept { m_prettyPrint = mode; }

        private:
            PrettyPrint m_prettyPrint;
        };

    } // namespace Report
} // namespace CodeRisk
