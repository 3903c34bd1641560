#include "core/Language.hpp"

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
namespace core
{

std::string normaliseLanguageTag(std::string_view tag)
{
    std::string lower = Utils::toLower(Utils::trim(tag));
    if (lower == "py" || lower == "python3")
        return "python";
    if (lower == "js" || lower == "node")
        return "javascript";
    if (lower == "ts")
        return "typescript";
    return lower;
}

Language languageFromTag(std::string_view tag)
{
    const std::string lower = normaliseLanguageTag(tag);
    if (lower == "python") return Language::Python;
    if (lower == "javascript") return Language::JavaScript;
    if (lower == "typescript") return Language::TypeScript;
    if (lower == "java") return Language::Java;
    return Language::Generic;
}

const char* languageName(Language language) noexcept
{
    switch (language)
    {
    case Language::Python:     return "python";
    case Language::JavaScript: return "javascript";
    case Language::TypeScript: return "typescript";
    case Language::Java:       return "java";
    case Language::Generic:    return "generic";
    }
    return "generic";
}

std::string languageTagForExtension(std::string_view extension)
{
    const std::string ext = Utils::toLower(extension);
    if (ext == ".py" || ext == ".pyw") return "python";
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs" || ext == ".jsx") return "javascript";
    if (ext == ".ts" || ext == ".tsx") return "typescript";
    if (ext == ".java") return "java";
    if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" || ext == ".hpp" || ext == ".h") return "cpp";
    if (ext == ".go") return "go";
    return {};
}

} // namespace core
} // namespace CodeRisk
