#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <iomanip>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/Severity.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace CodeRisk
{
namespace Report
{
    namespace
    {
        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        constexpr const char *kReset = "\033[0m";

        std::string upper(std::string_view s)
        {
            std::string out(s);
            for (char &c : out)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return out;
        }
    } // namespace

    ConsoleReporter::ConsoleReporter(std::ostream &output, Verbosity verbosity)
        : m_output(&output),
          m_verbosity(verbosity),
          m_colorsEnabled(&output == &std::cout && stdoutIsTty())
    {
    }

    void ConsoleReporter::generateReport(const core::Report &report)
    {
        *m_output << "\n=== CODE RISK REPORT ===\n";
        *m_output << "Generated: " << Utils::formatTimestamp(Utils::now()) << "\n";
        *m_output << "Source:    " << report.sourceName() << "\n";
        *m_output << "Language:  " << report.language() << "\n";
        *m_output << "Duration:  " << std::fixed << std::setprecision(1) << report.durationMillis() << " ms\n";

        if (report.parseResult())
            printStructure(*report.parseResult());
        if (report.metrics())
            printMetrics(*report.metrics());
        if (report.prediction())
            printPrediction(*report.prediction(), report.severitySummary());

        *m_output << "=== END REPORT ===\n\n";
        flush();
    }

    void ConsoleReporter::printStructure(const core::ParseResult &result)
    {
        *m_output << "\nStructure\n" << std::string(40, '-') << "\n";
        *m_output << "Functions: " << result.functions.size()
                  << "  Classes: " << result.classes.size()
                  << "  Imports: " << result.imports.size()
                  << "  Complexity: " << std::fixed << std::setprecision(0) << result.complexityScore << "\n";

        for (const auto &fn : result.functions)
        {
            *m_output << "  " << (fn.isAsync ? "async " : "") << "fn " << fn.name
                      << " (lines " << fn.startLine << "-" << fn.endLine << ")\n";
            if (m_verbosity == Verbosity::VERBOSE)
            {
                *m_output << "      " << fn.signature << "\n";
                if (fn.docstring)
                    *m_output << "      \"" << Utils::truncate(*fn.docstring, m_snippetWidth) << "\"\n";
            }
        }

        for (const auto &cls : result.classes)
        {
            *m_output << "  class " << cls.name << " (lines " << cls.startLine << "-" << cls.endLine << ")";
            if (!cls.bases.empty())
                *m_output << " : " << Utils::join(cls.bases, ", ");
            *m_output << "\n";
            for (const auto &m : cls.methods)
                *m_output << "    method " << m.name << " (line " << m.startLine << ")\n";
        }

        if (!result.imports.empty())
        {
            std::vector<std::string> shown(result.imports.begin(),
                                           result.imports.begin()
                                               + static_cast<std::ptrdiff_t>(std::min<std::size_t>(20, result.imports.size())));
            *m_output << "  imports: " << Utils::join(shown, ", ");
            if (result.imports.size() > shown.size())
                *m_output << " ... (+" << (result.imports.size() - shown.size()) << ")";
            *m_output << "\n";
        }

        if (m_verbosity == Verbosity::VERBOSE)
        {
            for (const auto &g : result.globalVariables)
                *m_output << "  global " << g.name << " = " << Utils::truncate(g.valueRepr, m_snippetWidth)
                          << " (line " << g.line << ")\n";
        }

        for (const auto &e : result.errors)
            *m_output << "  ! " << e << "\n";
    }

    void ConsoleReporter::printMetrics(const core::MetricsRecord &m)
    {
        *m_output << "\nMetrics\n" << std::string(40, '-') << "\n";
        *m_output << std::left
                  << std::setw(22) << "Total lines" << m.totalLines << "\n"
                  << std::setw(22) << "Code lines" << m.codeLines << "\n"
                  << std::setw(22) << "Blank lines" << m.blankLines << "\n"
                  << std::setw(22) << "Comment lines" << m.commentLines << "\n"
                  << std::setw(22) << "Functions" << m.functionCount << "\n"
                  << std::setw(22) << "Classes" << m.classCount << "\n"
                  << std::setw(22) << "Imports" << m.importCount << "\n"
                  << std::setw(22) << "Complexity" << std::fixed << std::setprecision(0) << m.complexityScore << "\n"
                  << std::setw(22) << "Avg function length" << std::setprecision(1) << m.avgFunctionLength << "\n"
                  << std::right;
    }

    void ConsoleReporter::printPrediction(const core::DefectPrediction &p, const core::SeveritySummary &summary)
    {
        const char *color = m_colorsEnabled ? riskColor(p.riskLevel) : "";
        const char *reset = m_colorsEnabled ? kReset : "";

        *m_output << "\nDefect risk\n" << std::string(40, '-') << "\n";
        *m_output << "Risk:       " << color << std::fixed << std::setprecision(3) << p.riskScore << " ("
                  << upper(core::riskLevelName(p.riskLevel)) << ")" << reset << "\n";
        *m_output << "            " << color;
        printRiskBar(*m_output, p.riskScore);
        *m_output << reset << "\n";
        *m_output << "Confidence: " << std::setprecision(2) << p.confidence << "\n";

        *m_output << "Severities:";
        for (core::Severity sev : core::kAllSeverities)
        {
            auto it = summary.find(sev);
            *m_output << " " << core::severityName(sev) << "=" << (it == summary.end() ? 0 : it->second);
        }
        *m_output << "\n";

        if (p.flaggedSections.empty())
        {
            *m_output << "No anti-patterns flagged.\n";
        }
        else
        {
            const std::size_t limit = std::min(m_maxFlagged, p.flaggedSections.size());
            *m_output << "Flagged sections (showing " << limit << " of " << p.flaggedSections.size() << ")\n";
            for (std::size_t i = 0; i < limit; ++i)
            {
                const auto &s = p.flaggedSections[i];
                *m_output << "  [" << std::left << std::setw(10) << core::severityName(s.severity) << std::right
                          << "] line " << s.line << ": " << s.issue << "\n"
                          << "      " << Utils::truncate(s.code, m_snippetWidth) << "\n";
            }
            if (limit < p.flaggedSections.size())
                *m_output << "  ... and " << (p.flaggedSections.size() - limit) << " more\n";
        }

        // Issues not already shown as flagged sections: code smells, mostly.
        std::unordered_set<std::string> shown;
        for (const auto &s : p.flaggedSections)
            shown.insert("Line " + std::to_string(s.line) + ": " + s.issue);

        std::vector<std::string> extra;
        for (const auto &issue : p.issuesDetected)
        {
            if (shown.count(issue) == 0)
                extra.push_back(issue);
        }
        if (!extra.empty())
        {
            const std::size_t limit = std::min(m_maxExtraIssues, extra.size());
            *m_output << "Additional issues\n";
            for (std::size_t i = 0; i < limit; ++i)
                *m_output << "  - " << extra[i] << "\n";
            if (limit < extra.size())
                *m_output << "  ... and " << (extra.size() - limit) << " more\n";
        }
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    const char *ConsoleReporter::riskColor(core::RiskLevel level) noexcept
    {
        switch (level)
        {
            case core::RiskLevel::High:   return "\033[91m"; // bright red
            case core::RiskLevel::Medium: return "\033[93m"; // yellow
            case core::RiskLevel::Low:    return "\033[92m"; // green
        }
        return "";
    }

    void ConsoleReporter::printRiskBar(std::ostream &os, double riskScore, int width)
    {
        if (width <= 0)
            return;

        const int full  = std::clamp(static_cast<int>(riskScore * width + 0.5), 0, width);
        const int empty = width - full;
        os << std::string(full, '=') << std::string(empty, '.');
    }

} // namespace Report
} // namespace CodeRisk
