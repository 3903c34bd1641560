#ifndef CORE_SEVERITY_HPP
#define CORE_SEVERITY_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace CodeRisk
{
namespace core
{

/**
 * @brief Severity of an anti-pattern rule hit.
 *
 * The set is closed; rule catalogs are validated against it at load time.
 */
enum class Severity : std::uint8_t
{
    Error = 0,
    Security,
    Warning,
    Info,
    Suggestion
};

/// All severities in reporting order.
inline constexpr std::array<Severity, 5> kAllSeverities{
    Severity::Error, Severity::Security, Severity::Warning, Severity::Info, Severity::Suggestion};

/// Lowercase tag: "error", "security", "warning", "info", "suggestion".
constexpr const char* severityName(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Error:      return "error";
    case Severity::Security:   return "security";
    case Severity::Warning:    return "warning";
    case Severity::Info:       return "info";
    case Severity::Suggestion: return "suggestion";
    }
    return "info";
}

/// Parse a severity tag (case-insensitive); std::nullopt for anything outside the set.
std::optional<Severity> severityFromString(std::string_view text);

/**
 * @brief Weight of a severity in the pattern score.
 *
 * error=1.0, security=0.9, warning=0.5, info=0.2, suggestion=0.1
 */
constexpr double severityWeight(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Error:      return 1.0;
    case Severity::Security:   return 0.9;
    case Severity::Warning:    return 0.5;
    case Severity::Info:       return 0.2;
    case Severity::Suggestion: return 0.1;
    }
    return 0.2;
}

} // namespace core
} // namespace CodeRisk

#endif // CORE_SEVERITY_HPP
