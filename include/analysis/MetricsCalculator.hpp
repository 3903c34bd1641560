#pragma once

#include <cstddef>
#include <string_view>

#include "core/CodeEntities.hpp"
#include "core/Findings.hpp"
#include "parser/CodeParser.hpp"

namespace CodeRisk
{
    namespace Analysis
    {
        struct LineCounts
        {
            std::size_t total   = 0;
            std::size_t code    = 0;
            std::size_t blank   = 0;
            std::size_t comment = 0;
        };

        /**
         * MetricsCalculator
         *
         * Size and shape statistics of a snippet. Line classes are
         * textual: after trimming, a line opening with a hash, a double
         * slash, a block-comment opener or a star is a comment line in every
         * language. Entity counts and complexity come from the structural
         * parser.
         *
         * Holds a reference to the parser; the parser must outlive it.
         */
        class MetricsCalculator
        {
        public:
            explicit MetricsCalculator(const Parser::CodeParser &parser);

            core::MetricsRecord metrics(std::string_view code, std::string_view language) const;

            /// Same record from an existing parse of the same code.
            static core::MetricsRecord fromParse(std::string_view code, const core::ParseResult &parsed);

            /// code + blank + comment == total for every input.
            static LineCounts countLines(std::string_view code);

        private:
            const Parser::CodeParser &m_parser;
        };

    } // namespace Analysis
} // namespace CodeRisk
