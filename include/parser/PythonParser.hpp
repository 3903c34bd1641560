#pragma once

#include <string>
#include <string_view>

#include "core/CodeEntities.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        /**
         * PythonParser
         *
         * Responsibilities:
         *  - Parse Python source into a tree-sitter syntax tree.
         *  - Extract top-level functions, classes (with methods and annotated
         *    attributes), imports and module-level globals.
         *  - Compute the tree-walk complexity score.
         *
         * Design notes:
         *  - Syntax errors never escape parse(): the first ERROR or MISSING node
         *    becomes a single "Syntax error at line N: message" entry, with no
         *    structure and a complexity of 0.
         *  - A leading UTF-8 byte order mark is skipped.
         *  - Each call owns its TSParser; one instance can be shared across threads.
         */
        class PythonParser
        {
        public:
            core::ParseResult parse(std::string_view code, const std::string &languageTag) const;
        };

        /**
         * Clean a docstring the way inspect.cleandoc does: expand tabs, strip
         * the first line, remove the common indentation of the remaining lines
         * and drop leading/trailing empty lines.
         */
        std::string cleanDocstring(std::string_view raw);

    } // namespace Parser
} // namespace CodeRisk
