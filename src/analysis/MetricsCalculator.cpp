#include "analysis/MetricsCalculator.hpp"

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        MetricsCalculator::MetricsCalculator(const Parser::CodeParser &parser)
            : m_parser(parser)
        {
        }

        core::MetricsRecord MetricsCalculator::metrics(std::string_view code, std::string_view language) const
        {
            return fromParse(code, m_parser.parse(code, language));
        }

        LineCounts MetricsCalculator::countLines(std::string_view code)
        {
            LineCounts counts;
            for (std::string_view line : Utils::splitLines(code))
            {
                ++counts.total;
                const std::string_view t = Utils::trim(line);
                if (t.empty())
                    ++counts.blank;
                else if (Utils::startsWith(t, "#") || Utils::startsWith(t, "//")
                         || Utils::startsWith(t, "/*") || Utils::startsWith(t, "*"))
                    ++counts.comment;
            }
            counts.code = counts.total - counts.blank - counts.comment;
            return counts;
        }

        core::MetricsRecord MetricsCalculator::fromParse(std::string_view code, const core::ParseResult &parsed)
        {
            const LineCounts lines = countLines(code);

            core::MetricsRecord record;
            record.totalLines      = lines.total;
            record.codeLines       = lines.code;
            record.blankLines      = lines.blank;
            record.commentLines    = lines.comment;
            record.functionCount   = parsed.functions.size();
            record.classCount      = parsed.classes.size();
            record.importCount     = parsed.imports.size();
            record.complexityScore = parsed.complexityScore;

            if (!parsed.functions.empty())
            {
                double sum = 0.0;
                for (const auto &fn : parsed.functions)
                    sum += static_cast<double>(fn.endLine - fn.startLine + 1);
                record.avgFunctionLength = sum / static_cast<double>(parsed.functions.size());
            }
            return record;
        }

    } // namespace Analysis
} // namespace CodeRisk
