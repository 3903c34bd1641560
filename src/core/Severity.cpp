#include "core/Severity.hpp"

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
namespace core
{

std::optional<Severity> severityFromString(std::string_view text)
{
    const std::string lower = Utils::toLower(Utils::trim(text));
    for (Severity s : kAllSeverities)
    {
        if (lower == severityName(s))
            return s;
    }
    return std::nullopt;
}

} // namespace core
} // namespace CodeRisk
