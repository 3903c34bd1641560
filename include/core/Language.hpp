#ifndef CORE_LANGUAGE_HPP
#define CORE_LANGUAGE_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace CodeRisk
{
namespace core
{

/**
 * @brief Languages with a dedicated structural extractor.
 *
 * Dispatch on this enum is always an exhaustive switch; adding a
 * language means adding an enumerator and handling it everywhere the
 * compiler (-Wswitch) points at. Every other tag maps to Generic.
 */
enum class Language : std::uint8_t
{
    Python = 0,
    JavaScript,
    TypeScript,
    Java,
    Generic      ///< No dedicated extractor: metrics-only analysis.
};

/// Map a declared tag ("python", "JS", "ts", ...) to a Language (case-insensitive).
Language languageFromTag(std::string_view tag);

/// Canonical lowercase tag ("python", "javascript", ...). Generic yields "generic".
const char* languageName(Language language) noexcept;

/**
 * @brief Normalise a declared tag for reporting and rule lookup.
 *
 * Trims and lowercases. Known aliases ("py", "js", "ts") expand to their
 * canonical names; unknown tags are returned lowercased as-is.
 */
std::string normaliseLanguageTag(std::string_view tag);

/// Guess a language tag from a file extension (".py" -> "python"); "" if unknown.
std::string languageTagForExtension(std::string_view extension);

} // namespace core
} // namespace CodeRisk

#endif // CORE_LANGUAGE_HPP
