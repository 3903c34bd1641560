#pragma once

#include <cstddef>
#include <string_view>

namespace CodeRisk
{
    namespace Parser
    {
        /**
         * Text-level helpers shared by the regex extractors and the generic
         * fallback. None of them understand strings or comments: a brace inside
         * a literal counts like any other brace.
         */

        /// 1-indexed line that contains the byte at offset ('\n' count before it, plus one).
        int lineAtOffset(std::string_view text, std::size_t offset) noexcept;

        struct BraceBlock
        {
            std::string_view text;          // from the opening '{' to its match, inclusive
            std::size_t      closeOffset;   // offset of the matching '}', or text.size()
        };

        /**
         * Balance braces starting at the '{' at openOffset with a depth
         * counter. An unterminated block runs to the end of the text and
         * reports closeOffset == text.size().
         */
        BraceBlock matchBraces(std::string_view text, std::size_t openOffset) noexcept;

        /**
         * Keyword-count complexity for code without a syntax tree:
         * 1 + occurrences of if, else, for, while, switch, case, try, catch,
         * &&, || and ?, scaled as min(100, raw * 2). Occurrences are plain
         * non-overlapping substring matches.
         */
        double heuristicComplexity(std::string_view code) noexcept;

    } // namespace Parser
} // namespace CodeRisk
