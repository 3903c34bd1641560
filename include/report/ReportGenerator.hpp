#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "core/Report.hpp"
#include "report/ConsoleReporter.hpp"
#include "report/JsonReporter.hpp"

namespace CodeRisk
{
    namespace Report
    {
        /**
         * ReportGenerator
         *
         * Responsibilities:
         *  - Hold one finished analysis report.
         *  - Render it through the reporter matching the output format.
         *  - Write to a stream or a file.
         *
         * Design notes:
         *  - Strategy by enum: CONSOLE uses ConsoleReporter, JSON and
         *    JSON_PRETTY use JsonReporter.
         */
        class ReportGenerator
        {
        public:
            enum class OutputFormat
            {
                CONSOLE,      // Human-readable text
                JSON,         // Single-line JSON
                JSON_PRETTY   // Indented JSON
            };

            explicit ReportGenerator(OutputFormat format = OutputFormat::CONSOLE);

            void generateReport(core::Report report);

            /// Returns false if the stream is in a failed state afterwards.
            bool writeReport(std::ostream &output) const;

            /// Returns false if the file cannot be opened or written.
            bool writeReportToFile(const std::string &filePath) const;

            std::string getReportString() const;

            void setFormat(OutputFormat format) noexcept { m_format = format; }
            void setVerbose(bool verbose) noexcept { m_verbose = verbose; }

        private:
            core::Report m_report;
            OutputFormat m_format;
            bool         m_verbose = false;
        };

        namespace Factory
        {
            std::unique_ptr<ReportGenerator> createConsoleReport();
            std::unique_ptr<ReportGenerator> createJsonReport(bool pretty);
        }

    } // namespace Report
} // namespace CodeRisk
