#include "report/ReportGenerator.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "utils/Logger.hpp"

namespace CodeRisk
{
namespace Report
{
    ReportGenerator::ReportGenerator(OutputFormat format)
        : m_format(format)
    {
    }

    void ReportGenerator::generateReport(core::Report report)
    {
        m_report = std::move(report);

        std::size_t flagged = 0;
        if (m_report.prediction())
            flagged = m_report.prediction()->flaggedSections.size();

        Utils::getLogger().debug("Report generated for " + m_report.sourceName() + ": "
                                 + std::to_string(flagged) + " flagged sections");
    }

    bool ReportGenerator::writeReport(std::ostream &output) const
    {
        switch (m_format)
        {
            case OutputFormat::CONSOLE:
            {
                ConsoleReporter console(output, m_verbose ? ConsoleReporter::Verbosity::VERBOSE
                                                          : ConsoleReporter::Verbosity::NORMAL);
                console.generateReport(m_report);
                break;
            }
            case OutputFormat::JSON:
                JsonReporter(JsonReporter::PrettyPrint::COMPACT).writeJson(m_report, output);
                break;
            case OutputFormat::JSON_PRETTY:
                JsonReporter(JsonReporter::PrettyPrint::PRETTY).writeJson(m_report, output);
                break;
        }
        output.flush();
        return static_cast<bool>(output);
    }

    bool ReportGenerator::writeReportToFile(const std::string &filePath) const
    {
        std::ofstream out(filePath, std::ios::out | std::ios::trunc);
        if (!out.is_open())
        {
            Utils::getLogger().error("Cannot open report file: " + filePath);
            return false;
        }

        const bool ok = writeReport(out);
        if (ok)
            Utils::getLogger().info("Report written: " + filePath);
        else
            Utils::getLogger().error("Failed writing report: " + filePath);
        return ok;
    }

    std::string ReportGenerator::getReportString() const
    {
        std::ostringstream oss;
        writeReport(oss);
        return oss.str();
    }

    namespace Factory
    {
        std::unique_ptr<ReportGenerator> createConsoleReport()
        {
            return std::make_unique<ReportGenerator>(ReportGenerator::OutputFormat::CONSOLE);
        }

        std::unique_ptr<ReportGenerator> createJsonReport(bool pretty)
        {
            return std::make_unique<ReportGenerator>(pretty ? ReportGenerator::OutputFormat::JSON_PRETTY
                                                            : ReportGenerator::OutputFormat::JSON);
        }
    } // namespace Factory

} // namespace Report
} // namespace CodeRisk
