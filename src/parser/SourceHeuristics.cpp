#include "parser/SourceHeuristics.hpp"

#include <algorithm>
#include <array>

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        int lineAtOffset(std::string_view text, std::size_t offset) noexcept
        {
            const std::size_t end = std::min(offset, text.size());
            const auto newlines = std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(end), '\n');
            return static_cast<int>(newlines) + 1;
        }

        BraceBlock matchBraces(std::string_view text, std::size_t openOffset) noexcept
        {
            int depth = 0;
            for (std::size_t i = openOffset; i < text.size(); ++i)
            {
                if (text[i] == '{')
                {
                    ++depth;
                }
                else if (text[i] == '}')
                {
                    --depth;
                    if (depth == 0)
                        return {text.substr(openOffset, i - openOffset + 1), i};
                }
            }
            return {openOffset < text.size() ? text.substr(openOffset) : std::string_view{}, text.size()};
        }

        double heuristicComplexity(std::string_view code) noexcept
        {
            static constexpr std::array<std::string_view, 11> kKeywords{
                "if", "else", "for", "while", "switch", "case", "try", "catch", "&&", "||", "?"};

            std::size_t raw = 1;
            for (std::string_view kw : kKeywords)
                raw += Utils::countOccurrences(code, kw);

            return std::min(100.0, static_cast<double>(raw) * 2.0);
        }

    } // namespace Parser
} // namespace CodeRisk
