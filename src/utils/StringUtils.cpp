#include "utils/StringUtils.hpp"

#include <cstdio>

namespace
{
    bool isSpace(unsigned char c) noexcept
    {
        return std::isspace(c) != 0;
    }
}

namespace CodeRisk::Utils {

std::string collapseWhitespace(std::string_view sv)
{
    std::string out;
    out.reserve(sv.size());

    bool pendingSpace = false;
    for (char c : sv)
    {
        if (isSpace(static_cast<unsigned char>(c)))
        {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace)
        {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, std::string_view delimiter)
{
    if (parts.empty()) return {};

    std::size_t totalSize = 0;
    for (const auto& s : parts) totalSize += s.size();
    totalSize += delimiter.size() * (parts.size() - 1);

    std::string result;
    result.reserve(totalSize);

    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i) result += delimiter;
        result += parts[i];
    }

    return result;
}

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string truncate(std::string_view s, std::size_t maxChars)
{
    if (s.size() <= maxChars)
        return std::string(s);
    return std::string(s.substr(0, maxChars)) + "...";
}

} // namespace CodeRisk::Utils
