#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace CodeRisk
{
    namespace Utils
    {
        /**
         * String helpers for source-text handling.
         *
         * All functions are stateless and thread-safe, and use
         * std::string_view where possible to avoid copies.
         */

        /// Trim whitespace (space, tab, CR, LF, FF, VT) from the left side.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            const auto offset = static_cast<std::size_t>(it - sv.begin());
            return sv.substr(offset);
        }

        /// Trim whitespace from the right side.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            if (it == sv.rend())
            {
                return std::string_view{};
            }
            return std::string_view(sv.data(),
                                    static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); }
            );
            return result;
        }

        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size()
                   && sv.compare(sv.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        inline bool contains(std::string_view sv, std::string_view needle) noexcept
        {
            if (needle.empty())
            {
                return true;
            }
            return sv.find(needle) != std::string_view::npos;
        }

        /**
         * Split a string_view by a single-character delimiter.
         *
         * Empty fields are preserved if keepEmpty == true. Tokens are not
         * trimmed.
         */
        inline std::vector<std::string_view> split(
            std::string_view sv,
            char delimiter,
            bool keepEmpty = false)
        {
            std::vector<std::string_view> result;
            std::size_t start = 0;

            while (start <= sv.size())
            {
                const std::size_t pos = sv.find(delimiter, start);
                const bool found = (pos != std::string_view::npos);
                const std::size_t end = found ? pos : sv.size();

                if (end > start || keepEmpty)
                {
                    result.emplace_back(sv.data() + start, end - start);
                }

                if (!found)
                {
                    break;
                }
                start = end + 1;
            }

            return result;
        }

        /**
         * Split source text into lines on '\n'.
         *
         * Mirrors the usual "text.split('\n')" semantics: a trailing newline
         * produces a final empty line. Empty input produces no lines.
         * A '\r' before the newline is kept on the line.
         */
        inline std::vector<std::string_view> splitLines(std::string_view text)
        {
            if (text.empty())
            {
                return {};
            }
            return split(text, '\n', true);
        }

        /// Number of leading whitespace characters (each tab counts as one).
        inline std::size_t leadingWhitespace(std::string_view line) noexcept
        {
            return line.size() - ltrim(line).size();
        }

        /**
         * Count non-overlapping occurrences of needle in haystack, scanning
         * left to right. An empty needle counts zero.
         */
        inline std::size_t countOccurrences(std::string_view haystack,
                                            std::string_view needle) noexcept
        {
            if (needle.empty())
            {
                return 0;
            }
            std::size_t count = 0;
            std::size_t pos   = 0;
            while ((pos = haystack.find(needle, pos)) != std::string_view::npos)
            {
                ++count;
                pos += needle.size();
            }
            return count;
        }

        /// Return a copy with all occurrences of 'from' replaced by 'to'.
        inline std::string replaceAll(std::string_view sv,
                                      std::string_view from,
                                      std::string_view to)
        {
            std::string result(sv);
            if (from.empty())
            {
                return result;
            }

            std::size_t pos = 0;
            while ((pos = result.find(from, pos)) != std::string::npos)
            {
                result.replace(pos, from.size(), to);
                pos += to.size();
            }
            return result;
        }

        /// Collapse every run of whitespace (newlines included) to one space and trim.
        std::string collapseWhitespace(std::string_view sv);

        /// Join parts with a delimiter.
        std::string join(const std::vector<std::string>& parts, std::string_view delimiter);

        /// Escape a string for embedding in a JSON string literal (RFC 8259).
        std::string escapeJson(std::string_view s);

        /// Truncate to maxChars characters, appending "..." when shortened.
        std::string truncate(std::string_view s, std::size_t maxChars);

    } // namespace Utils
} // namespace CodeRisk
