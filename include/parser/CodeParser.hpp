#pragma once

#include <string_view>

#include "core/CodeEntities.hpp"
#include "parser/BraceLanguageParser.hpp"
#include "parser/PythonParser.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        /**
         * CodeParser
         *
         * Entry point of the structural parser. Maps the declared language tag
         * to core::Language and dispatches with an exhaustive switch:
         *
         *   Python                -> PythonParser (statement tree)
         *   JavaScript/TypeScript -> BraceLanguageParser::parseJavaScript
         *   Java                  -> BraceLanguageParser::parseJava
         *   Generic               -> empty structure, one diagnostic,
         *                            heuristic complexity
         *
         * parse() never throws for malformed code.
         */
        class CodeParser
        {
        public:
            CodeParser() = default;

            core::ParseResult parse(std::string_view code, std::string_view language) const;

        private:
            core::ParseResult parseGeneric(std::string_view code, const std::string &languageTag) const;

        private:
            PythonParser        m_python;
            BraceLanguageParser m_braces;
        };

    } // namespace Parser
} // namespace CodeRisk
