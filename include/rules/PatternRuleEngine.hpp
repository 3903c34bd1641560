#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/Findings.hpp"
#include "rules/RuleCatalog.hpp"

namespace CodeRisk
{
    namespace Rules
    {
        /**
         * PatternRuleEngine
         *
         * Applies the catalog rules for a language (its own rules, then the
         * general ones) to every source line independently, with a
         * case-insensitive regex search. One FlaggedSection per (rule, line)
         * hit; output is rule-major, then line-ascending.
         *
         * Matching is purely textual: hits inside strings and comments count.
         * scan() never throws; every pattern was validated by the catalog.
         *
         * Lines longer than kMaxLineLength are skipped: std::regex matches
         * recursively, one stack frame per repeated character.
         */
        class PatternRuleEngine
        {
        public:
            static constexpr std::size_t kMaxLineLength = 2048;

            explicit PatternRuleEngine(std::shared_ptr<const RuleCatalog> catalog);

            std::vector<core::FlaggedSection> scan(std::string_view code, std::string_view language) const;

            /// "Line N: <issue>" for each section, in order.
            static std::vector<std::string> issueSummaries(const std::vector<core::FlaggedSection> &flagged);

            const RuleCatalog &catalog() const noexcept { return *m_catalog; }

        private:
            std::shared_ptr<const RuleCatalog> m_catalog;
        };

    } // namespace Rules
} // namespace CodeRisk
