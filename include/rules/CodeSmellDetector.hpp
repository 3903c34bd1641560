#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace CodeRisk
{
    namespace Rules
    {
        struct SmellThresholds
        {
            std::size_t longLine      = 120;   // characters
            std::size_t maxNesting    = 4;     // levels
            std::size_t indentWidth   = 4;     // leading whitespace per level
            std::size_t maxConditions = 3;     // and / or / && / || per line
        };

        /**
         * CodeSmellDetector
         *
         * Threshold checks that have no fixed severity or rule id, reported
         * as issue strings only:
         *
         *   "Line 7: Line too long (> 120 chars) (131 chars)"
         *   "Line 9: Deep nesting level (> 4) (level 6)"
         *   "Line 3: Complex boolean condition (> 3 operators)"
         *
         * All long-line findings come first, then nesting, then conditions.
         * Combinators are counted as plain substrings, so "or" inside "for"
         * counts too.
         */
        class CodeSmellDetector
        {
        public:
            explicit CodeSmellDetector(SmellThresholds thresholds = {});

            std::vector<std::string> detect(std::string_view code) const;

            const SmellThresholds &thresholds() const noexcept { return m_thresholds; }

        private:
            SmellThresholds m_thresholds;
            std::regex      m_combinator;
        };

    } // namespace Rules
} // namespace CodeRisk
