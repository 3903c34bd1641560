#pragma once

#include <cstddef>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/Severity.hpp"
#include "utils/ConfigLoader.hpp"

namespace CodeRisk
{
    namespace Rules
    {
        /// Thrown while building a catalog: bad pattern, unknown severity, malformed entry.
        class RuleCatalogError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        /**
         * One anti-pattern rule. The pattern is a line-local regular
         * expression, compiled case-insensitive when the rule is added.
         */
        struct Rule
        {
            std::string    language;   // canonical language tag, or "general"
            std::string    id;
            std::string    pattern;
            std::string    message;
            core::Severity severity = core::Severity::Info;
            std::regex     compiled;
        };

        /**
         * RuleCatalog
         *
         * Responsibilities:
         *  - Hold the ordered anti-pattern rules per language plus the
         *    language-agnostic "general" set.
         *  - Validate every rule when it is added, so scanning never fails.
         *  - Load extra rules from configuration:
         *
         *      rule.<id> = <language> | <severity> | <message> | <pattern>
         *
         *    Only the first three '|' split; the pattern may contain more.
         *
         * Design notes:
         *  - Built once at startup and shared read-only
         *    (std::shared_ptr<const RuleCatalog>).
         *  - Adding a rule with an existing id replaces it in place.
         */
        class RuleCatalog
        {
        public:
            static constexpr std::string_view kGeneral = "general";

            /// Empty catalog.
            RuleCatalog() = default;

            /// Catalog with the built-in python / javascript / java / general rules.
            static RuleCatalog builtIn();

            void addRule(std::string_view language,
                         std::string      id,
                         std::string      pattern,
                         std::string      message,
                         core::Severity   severity);

            /// Same, with the severity given as a tag ("error", "security", ...).
            void addRule(std::string_view language,
                         std::string      id,
                         std::string      pattern,
                         std::string      message,
                         std::string_view severityTag);

            /**
             * Append every "rule.<id>" entry of config, in lexicographic id
             * order. Returns the number of rules added or replaced.
             */
            std::size_t loadExtraRules(const Utils::ConfigLoader &config);

            /// Load a rules file (ConfigLoader format). Throws RuleCatalogError if unreadable.
            std::size_t loadExtraRulesFromFile(const std::string &path);

            /**
             * Rules applied to a language: its own rules, then the general
             * rules, each in catalog order. Pointers stay valid while the
             * catalog is not modified.
             */
            std::vector<const Rule *> rulesFor(std::string_view language) const;

            const std::vector<Rule> &rules() const noexcept { return m_rules; }

            std::size_t size() const noexcept { return m_rules.size(); }

        private:
            std::vector<Rule>                            m_rules;
            std::unordered_map<std::string, std::size_t> m_idIndex;
        };

    } // namespace Rules
} // namespace CodeRisk
