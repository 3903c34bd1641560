#pragma once

#include <array>
#include <regex>
#include <string>
#include <string_view>

#include "core/CodeEntities.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        /**
         * BraceLanguageParser
         *
         * Approximate, regex-driven extractor for brace-delimited languages
         * (JavaScript, TypeScript, Java) where no syntax tree is built.
         *
         * Responsibilities:
         *  - Imports, function/method declarations and class declarations
         *    found by a fixed, ordered set of patterns.
         *  - Block extents by brace balancing from the first '{' at or after
         *    each match; unterminated blocks consume to end of input.
         *  - Keyword-count heuristic complexity.
         *
         * Design notes:
         *  - Patterns are compiled once in the constructor; parse calls are
         *    const and may run concurrently.
         *  - Braces inside strings and comments are not skipped. This is a
         *    known precision limit, kept for compatibility.
         *  - Every pattern repeat is capped at 512 and lines over 2048
         *    characters are hidden from the patterns (brace matching still
         *    sees them), so matching stays bounded on minified input.
         */
        class BraceLanguageParser
        {
        public:
            BraceLanguageParser();

            /// JavaScript and TypeScript share one extractor.
            core::ParseResult parseJavaScript(std::string_view code, const std::string &languageTag) const;

            core::ParseResult parseJava(std::string_view code, const std::string &languageTag) const;

        private:
            std::regex                m_jsImport;
            std::array<std::regex, 3> m_jsFunctions;   // named, arrow, function expression
            std::regex                m_jsClass;

            std::regex m_javaImport;
            std::regex m_javaClass;
            std::regex m_javaMethod;
        };

    } // namespace Parser
} // namespace CodeRisk
