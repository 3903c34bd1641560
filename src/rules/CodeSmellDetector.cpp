#include "rules/CodeSmellDetector.hpp"

#include <iterator>

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Rules
    {
        namespace
        {
            /// Length in characters; UTF-8 continuation bytes are not counted.
            std::size_t characterCount(std::string_view line) noexcept
            {
                std::size_t count = 0;
                for (char c : line)
                {
                    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
                        ++count;
                }
                return count;
            }

            std::string lineLabel(std::size_t index)
            {
                return "Line " + std::to_string(index + 1) + ": ";
            }
        } // namespace

        CodeSmellDetector::CodeSmellDetector(SmellThresholds thresholds)
            : m_thresholds(thresholds)
            , m_combinator(R"re((and|or|&&|\|\|))re", std::regex::ECMAScript | std::regex::icase)
        {
            if (m_thresholds.indentWidth == 0)
                m_thresholds.indentWidth = 1;
        }

        std::vector<std::string> CodeSmellDetector::detect(std::string_view code) const
        {
            const auto lines = Utils::splitLines(code);
            std::vector<std::string> issues;

            const std::string longLine = "Line too long (> " + std::to_string(m_thresholds.longLine) + " chars)";
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                const std::size_t length = characterCount(lines[i]);
                if (length > m_thresholds.longLine)
                    issues.push_back(lineLabel(i) + longLine + " (" + std::to_string(length) + " chars)");
            }

            const std::string deepNesting = "Deep nesting level (> " + std::to_string(m_thresholds.maxNesting) + ")";
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                const std::size_t nesting = Utils::leadingWhitespace(lines[i]) / m_thresholds.indentWidth;
                if (nesting > m_thresholds.maxNesting)
                    issues.push_back(lineLabel(i) + deepNesting + " (level " + std::to_string(nesting) + ")");
            }

            const std::string complexCondition =
                "Complex boolean condition (> " + std::to_string(m_thresholds.maxConditions) + " operators)";
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                const std::string_view line = lines[i];
                const auto operators = std::distance(
                    std::cregex_iterator(line.data(), line.data() + line.size(), m_combinator),
                    std::cregex_iterator());
                if (static_cast<std::size_t>(operators) > m_thresholds.maxConditions)
                    issues.push_back(lineLabel(i) + complexCondition);
            }

            return issues;
        }

    } // namespace Rules
} // namespace CodeRisk
