#include "parser/BraceLanguageParser.hpp"

#include <algorithm>
#include <vector>

#include "parser/SourceHeuristics.hpp"
#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Parser
    {
        namespace
        {
            using MatchIterator = std::cregex_iterator;

            MatchIterator matchesBegin(std::string_view code, const std::regex &re)
            {
                return MatchIterator(code.data(), code.data() + code.size(), re);
            }

            std::string group(const std::cmatch &m, std::size_t index)
            {
                return m[index].matched ? m[index].str() : std::string{};
            }

            /// Split on delimiter outside (), [], {} and <>.
            std::vector<std::string_view> splitOutsideBrackets(std::string_view text, char delimiter)
            {
                std::vector<std::string_view> parts;
                int         depth = 0;
                std::size_t start = 0;
                for (std::size_t i = 0; i < text.size(); ++i)
                {
                    const char c = text[i];
                    if (c == '(' || c == '[' || c == '{' || c == '<')
                        ++depth;
                    else if (c == ')' || c == ']' || c == '}' || c == '>')
                        --depth;
                    else if (c == delimiter && depth == 0)
                    {
                        parts.push_back(text.substr(start, i - start));
                        start = i + 1;
                    }
                }
                parts.push_back(text.substr(start));
                return parts;
            }

            std::size_t findOutsideBrackets(std::string_view text, char target)
            {
                int depth = 0;
                for (std::size_t i = 0; i < text.size(); ++i)
                {
                    const char c = text[i];
                    if (c == '(' || c == '[' || c == '{' || c == '<')
                        ++depth;
                    else if (c == ')' || c == ']' || c == '}' || c == '>')
                        --depth;
                    else if (c == target && depth == 0)
                        return i;
                }
                return std::string_view::npos;
            }

            /// "a", "b: number", "c = 1", "d?: string = 'x'", "...rest"
            std::vector<core::Parameter> parseScriptParameters(std::string_view list)
            {
                std::vector<core::Parameter> params;
                for (std::string_view raw : splitOutsideBrackets(list, ','))
                {
                    std::string_view piece = Utils::trim(raw);
                    if (Utils::startsWith(piece, "..."))
                        piece = Utils::trim(piece.substr(3));
                    if (piece.empty())
                        continue;

                    core::Parameter p;

                    const std::size_t eq = findOutsideBrackets(piece, '=');
                    std::string_view  left = piece;
                    if (eq != std::string_view::npos)
                    {
                        p.defaultLiteral = std::string(Utils::trim(piece.substr(eq + 1)));
                        left = piece.substr(0, eq);
                    }

                    const std::size_t colon = findOutsideBrackets(left, ':');
                    if (colon != std::string_view::npos)
                    {
                        p.declaredType = std::string(Utils::trim(left.substr(colon + 1)));
                        left = left.substr(0, colon);
                    }

                    left = Utils::trim(left);
                    if (Utils::endsWith(left, "?"))
                        left = Utils::rtrim(left.substr(0, left.size() - 1));
                    if (left.empty())
                        continue;

                    p.name = std::string(left);
                    params.push_back(std::move(p));
                }
                return params;
            }

            /// Java "Type name, final Other<T> x" -> {name, type} pairs.
            std::vector<core::Parameter> parseJavaParameters(std::string_view list)
            {
                std::vector<core::Parameter> params;
                if (Utils::trim(list).empty())
                    return params;

                for (std::string_view raw : Utils::split(list, ','))
                {
                    const std::string        collapsed = Utils::collapseWhitespace(raw);
                    std::vector<std::string> words;
                    for (std::string_view w : Utils::split(collapsed, ' '))
                        words.emplace_back(w);
                    if (words.size() < 2)
                        continue;

                    core::Parameter p;
                    p.name = words.back();
                    words.pop_back();
                    p.declaredType = Utils::join(words, " ");
                    params.push_back(std::move(p));
                }
                return params;
            }

            /// Body and end line for a declaration starting at matchStart.
            void attachBlock(std::string_view code, std::size_t matchStart, core::FunctionEntity &fn)
            {
                const std::size_t open = code.find('{', matchStart);
                if (open == std::string_view::npos)
                {
                    fn.body.clear();
                    fn.endLine = fn.startLine;
                    return;
                }
                const BraceBlock block = matchBraces(code, open);
                fn.body    = std::string(block.text);
                fn.endLine = lineAtOffset(code, block.closeOffset);
            }

            int blockEndLine(std::string_view code, std::size_t matchStart, int startLine)
            {
                const std::size_t open = code.find('{', matchStart);
                if (open == std::string_view::npos)
                    return startLine;
                return lineAtOffset(code, matchBraces(code, open).closeOffset);
            }

            constexpr int         kMaxRepeat     = 512;
            constexpr std::size_t kMaxLineLength = 2048;

            /// Copy of code with every overlong line blanked to NUL bytes.
            /// Offsets and line numbers stay valid for the original text.
            std::string maskLongLines(std::string_view code)
            {
                std::string masked(code);
                std::size_t start = 0;
                while (start <= masked.size())
                {
                    std::size_t end = masked.find('\n', start);
                    if (end == std::string::npos)
                        end = masked.size();
                    if (end - start > kMaxLineLength)
                        std::fill(masked.begin() + static_cast<std::ptrdiff_t>(start),
                                  masked.begin() + static_cast<std::ptrdiff_t>(end), '\0');
                    start = end + 1;
                }
                return masked;
            }

            /// Rewrite every '*' and '+' outside a bracket expression to a
            /// {0,N} / {1,N} interval. std::regex matches recursively, so an
            /// unbounded repeat over a long stretch of source overflows the stack.
            std::regex compile(std::string_view pattern)
            {
                const std::string limit = std::to_string(kMaxRepeat);

                std::string bounded;
                bool inClass = false;
                for (std::size_t i = 0; i < pattern.size(); ++i)
                {
                    const char c = pattern[i];
                    if (c == '\\' && i + 1 < pattern.size())
                    {
                        bounded += c;
                        bounded += pattern[++i];
                    }
                    else if (inClass)
                    {
                        bounded += c;
                        inClass = c != ']';
                    }
                    else if (c == '[')
                    {
                        bounded += c;
                        inClass = true;
                        if (i + 1 < pattern.size() && pattern[i + 1] == '^')
                            bounded += pattern[++i];
                        if (i + 1 < pattern.size() && pattern[i + 1] == ']')
                            bounded += pattern[++i];   // leading ']' is a literal
                    }
                    else if (c == '*')
                        bounded += "{0," + limit + "}";
                    else if (c == '+')
                        bounded += "{1," + limit + "}";
                    else
                        bounded += c;
                }
                return std::regex(bounded, std::regex::ECMAScript | std::regex::optimize);
            }
        } // namespace

        BraceLanguageParser::BraceLanguageParser()
            : m_jsImport(compile(R"re(import\s+(?:\{[^}]+\}|\*\s+as\s+\w+|\w+)\s+from\s+['"]([^'"]+)['"])re"))
            , m_jsFunctions{
                  compile(R"re((?:async\s+)?function\s+(\w+)\s*\(([^)]*)\)\s*(?::\s*(\w+))?\s*\{)re"),
                  compile(R"re((?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?\([^)]*\)\s*(?::\s*(\w+))?\s*=>\s*\{?)re"),
                  compile(R"re((?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?function\s*\([^)]*\))re")}
            , m_jsClass(compile(R"re(class\s+(\w+)(?:\s+extends\s+(\w+))?\s*\{)re"))
            , m_javaImport(compile(R"re(import\s+([\w.]+);)re"))
            , m_javaClass(compile(R"re((?:public\s+)?(?:abstract\s+)?class\s+(\w+)(?:\s+extends\s+(\w+))?(?:\s+implements\s+([\w,\s]+))?\s*\{)re"))
            , m_javaMethod(compile(R"re((?:public|private|protected)?\s*(?:static\s+)?(?:final\s+)?(\w+(?:<[^>]+>)?)\s+(\w+)\s*\(([^)]*)\)\s*(?:throws\s+[\w,\s]+)?\s*\{)re"))
        {
        }

        core::ParseResult BraceLanguageParser::parseJavaScript(std::string_view code, const std::string &languageTag) const
        {
            core::ParseResult result;
            result.language = languageTag;

            const std::string masked = maskLongLines(code);
            const std::string_view text = masked;

            for (auto it = matchesBegin(text, m_jsImport); it != MatchIterator(); ++it)
                result.imports.push_back(group(*it, 1));

            for (std::size_t p = 0; p < m_jsFunctions.size(); ++p)
            {
                for (auto it = matchesBegin(text, m_jsFunctions[p]); it != MatchIterator(); ++it)
                {
                    const std::cmatch &m     = *it;
                    const auto         start = static_cast<std::size_t>(m.position(0));

                    core::FunctionEntity fn;
                    fn.name      = group(m, 1);
                    fn.startLine = lineAtOffset(code, start);
                    fn.signature = m.str(0);
                    fn.isAsync   = Utils::contains(fn.signature, "async");

                    if (p == 0)
                    {
                        fn.parameters = parseScriptParameters(group(m, 2));
                        if (m[3].matched)
                            fn.returnType = group(m, 3);
                    }
                    else if (p == 1 && m[2].matched)
                    {
                        fn.returnType = group(m, 2);
                    }

                    attachBlock(code, start, fn);
                    result.functions.push_back(std::move(fn));
                }
            }

            for (auto it = matchesBegin(text, m_jsClass); it != MatchIterator(); ++it)
            {
                const std::cmatch &m     = *it;
                const auto         start = static_cast<std::size_t>(m.position(0));

                core::ClassEntity cls;
                cls.name      = group(m, 1);
                cls.startLine = lineAtOffset(code, start);
                cls.endLine   = blockEndLine(code, start, cls.startLine);
                if (m[2].matched)
                    cls.bases.push_back(group(m, 2));
                result.classes.push_back(std::move(cls));
            }

            result.complexityScore = heuristicComplexity(code);
            return result;
        }

        core::ParseResult BraceLanguageParser::parseJava(std::string_view code, const std::string &languageTag) const
        {
            core::ParseResult result;
            result.language = languageTag;

            const std::string masked = maskLongLines(code);
            const std::string_view text = masked;

            for (auto it = matchesBegin(text, m_javaImport); it != MatchIterator(); ++it)
                result.imports.push_back(group(*it, 1));

            for (auto it = matchesBegin(text, m_javaClass); it != MatchIterator(); ++it)
            {
                const std::cmatch &m     = *it;
                const auto         start = static_cast<std::size_t>(m.position(0));

                core::ClassEntity cls;
                cls.name      = group(m, 1);
                cls.startLine = lineAtOffset(code, start);
                cls.endLine   = blockEndLine(code, start, cls.startLine);
                if (m[2].matched)
                    cls.bases.push_back(group(m, 2));
                if (m[3].matched)
                {
                    const std::string interfaces = m[3].str();
                    for (std::string_view iface : Utils::split(interfaces, ','))
                    {
                        const std::string_view name = Utils::trim(iface);
                        if (!name.empty())
                            cls.bases.emplace_back(name);
                    }
                }
                result.classes.push_back(std::move(cls));
            }

            for (auto it = matchesBegin(text, m_javaMethod); it != MatchIterator(); ++it)
            {
                const std::cmatch &m    = *it;
                const std::string  name = group(m, 2);
                if (name == "if" || name == "while" || name == "for" || name == "switch"
                    || name == "try" || name == "catch")
                    continue;

                // A leading \s* can open the match on the previous line.
                const std::size_t start      = text.find_first_not_of(" \t\r\n", static_cast<std::size_t>(m.position(0)));
                const std::string returnType = group(m, 1);
                const std::string params     = group(m, 3);

                core::FunctionEntity fn;
                fn.name       = name;
                fn.startLine  = lineAtOffset(code, start);
                fn.signature  = returnType + " " + name + "(" + params + ")";
                fn.parameters = parseJavaParameters(params);
                fn.returnType = returnType;
                attachBlock(code, start, fn);
                result.functions.push_back(std::move(fn));
            }

            result.complexityScore = heuristicComplexity(code);
            return result;
        }

    } // namespace Parser
} // namespace CodeRisk
