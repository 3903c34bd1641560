#pragma once

#include <cstddef>
#include <iostream>

#include "core/CodeEntities.hpp"
#include "core/Findings.hpp"
#include "core/Report.hpp"

namespace CodeRisk
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Plain-text summaries of a parse result, a metrics record and a
         *    defect prediction.
         *  - Risk-level colouring and a risk bar when writing to a terminal.
         *
         * Design notes:
         *  - Flagged sections are capped (default 10) and their code snippets
         *    truncated (default 60 characters); the additional-issues list is
         *    capped at 5.
         *  - Writes to any std::ostream; colours auto-detected for stdout only.
         */
        class ConsoleReporter
        {
        public:
            enum class Verbosity
            {
                NORMAL,   // Summaries and capped lists
                VERBOSE   // Also parameters, docstrings and globals
            };

            explicit ConsoleReporter(std::ostream &output = std::cout, Verbosity verbosity = Verbosity::NORMAL);

            ConsoleReporter(const ConsoleReporter &)            = default;
            ConsoleReporter &operator=(const ConsoleReporter &) = default;

            void generateReport(const core::Report &report);

            void printStructure(const core::ParseResult &result);
            void printMetrics(const core::MetricsRecord &metrics);
            void printPrediction(const core::DefectPrediction &prediction, const core::SeveritySummary &summary);

            void flush();

            void setVerbosity(Verbosity level) noexcept { m_verbosity = level; }
            void setEnableColors(bool enable) noexcept { m_colorsEnabled = enable; }
            void setMaxFlagged(std::size_t count) noexcept { m_maxFlagged = count; }
            void setSnippetWidth(std::size_t chars) noexcept { m_snippetWidth = chars; }
            void setMaxExtraIssues(std::size_t count) noexcept { m_maxExtraIssues = count; }

        private:
            static const char *riskColor(core::RiskLevel level) noexcept;
            static void printRiskBar(std::ostream &os, double riskScore, int width = 20);

        private:
            std::ostream *m_output;
            Verbosity     m_verbosity;
            bool          m_colorsEnabled;
            std::size_t   m_maxFlagged     = 10;
            std::size_t   m_snippetWidth   = 60;
            std::size_t   m_maxExtraIssues = 5;
        };

    } // namespace Report
} // namespace CodeRisk
