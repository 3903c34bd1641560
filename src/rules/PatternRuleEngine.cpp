#include "rules/PatternRuleEngine.hpp"

#include <stdexcept>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Rules
    {
        PatternRuleEngine::PatternRuleEngine(std::shared_ptr<const RuleCatalog> catalog)
            : m_catalog(std::move(catalog))
        {
            if (!m_catalog)
                throw std::invalid_argument("PatternRuleEngine requires a rule catalog");
        }

        std::vector<core::FlaggedSection> PatternRuleEngine::scan(std::string_view code,
                                                                  std::string_view language) const
        {
            const auto lines = Utils::splitLines(code);
            const auto rules = m_catalog->rulesFor(language);

            std::size_t skipped = 0;
            for (std::string_view line : lines)
                skipped += line.size() > kMaxLineLength ? 1 : 0;

            std::vector<core::FlaggedSection> flagged;
            for (const Rule *rule : rules)
            {
                for (std::size_t i = 0; i < lines.size(); ++i)
                {
                    const std::string_view line = lines[i];
                    if (line.size() > kMaxLineLength)
                        continue;
                    if (!std::regex_search(line.data(), line.data() + line.size(), rule->compiled))
                        continue;

                    core::FlaggedSection section;
                    section.line     = static_cast<int>(i + 1);
                    section.code     = std::string(Utils::trim(line));
                    section.issue    = rule->message;
                    section.severity = rule->severity;
                    section.ruleId   = rule->id;
                    flagged.push_back(std::move(section));
                }
            }

            Utils::getLogger().debug("Pattern scan: " + std::to_string(rules.size()) + " rules, "
                                     + std::to_string(lines.size()) + " lines ("
                                     + std::to_string(skipped) + " over length cap), "
                                     + std::to_string(flagged.size()) + " hits");
            return flagged;
        }

        std::vector<std::string> PatternRuleEngine::issueSummaries(const std::vector<core::FlaggedSection> &flagged)
        {
            std::vector<std::string> issues;
            issues.reserve(flagged.size());
            for (const auto &section : flagged)
                issues.push_back("Line " + std::to_string(section.line) + ": " + section.issue);
            return issues;
        }

    } // namespace Rules
} // namespace CodeRisk
