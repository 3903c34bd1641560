#include "parser/CodeParser.hpp"

#include "core/Language.hpp"
#include "parser/SourceHeuristics.hpp"
#include "utils/Logger.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        core::ParseResult CodeParser::parse(std::string_view code, std::string_view language) const
        {
            const std::string tag = core::normaliseLanguageTag(language);

            core::ParseResult result;
            switch (core::languageFromTag(tag))
            {
            case core::Language::Python:
                result = m_python.parse(code, tag);
                break;
            case core::Language::JavaScript:
            case core::Language::TypeScript:
                result = m_braces.parseJavaScript(code, tag);
                break;
            case core::Language::Java:
                result = m_braces.parseJava(code, tag);
                break;
            case core::Language::Generic:
                result = parseGeneric(code, tag);
                break;
            }

            auto &log = Utils::getLogger();
            if (log.isEnabled(Utils::LogLevel::DEBUG))
            {
                log.debug("Parsed " + tag + " source: "
                          + std::to_string(result.functions.size()) + " functions, "
                          + std::to_string(result.classes.size()) + " classes, "
                          + std::to_string(result.imports.size()) + " imports, complexity "
                          + std::to_string(result.complexityScore));
            }
            return result;
        }

        core::ParseResult CodeParser::parseGeneric(std::string_view code, const std::string &languageTag) const
        {
            Utils::getLogger().warn("No structural extractor for '" + languageTag + "', falling back to metrics only");

            core::ParseResult result;
            result.language = languageTag;
            result.errors.push_back("No specific parser for " + languageTag + ", using generic analysis");
            result.complexityScore = heuristicComplexity(code);
            return result;
        }

    } // namespace Parser
} // namespace CodeRisk
