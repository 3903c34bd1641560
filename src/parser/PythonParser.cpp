#include "parser/PythonParser.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <tree_sitter/api.h>

#include "utils/StringUtils.hpp"

extern "C"
{
    const TSLanguage *tree_sitter_python();
}

namespace CodeRisk
{
    namespace Parser
    {
        namespace
        {
            constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

            bool isType(TSNode node, const char *type)
            {
                return std::strcmp(ts_node_type(node), type) == 0;
            }

            TSNode field(TSNode node, const char *name)
            {
                return ts_node_child_by_field_name(node, name, static_cast<std::uint32_t>(std::strlen(name)));
            }

            int firstLine(TSNode node)
            {
                return static_cast<int>(ts_node_start_point(node).row) + 1;
            }

            /// A node that stops at column 0 ends on the previous line.
            int lastLine(TSNode node)
            {
                const TSPoint start = ts_node_start_point(node);
                const TSPoint end   = ts_node_end_point(node);
                if (end.column == 0 && end.row > start.row)
                    return static_cast<int>(end.row);
                return static_cast<int>(end.row) + 1;
            }

            /// Named children without comments.
            std::vector<TSNode> namedChildren(TSNode node)
            {
                std::vector<TSNode> out;
                const std::uint32_t count = ts_node_named_child_count(node);
                out.reserve(count);
                for (std::uint32_t i = 0; i < count; ++i)
                {
                    const TSNode child = ts_node_named_child(node, i);
                    if (!isType(child, "comment"))
                        out.push_back(child);
                }
                return out;
            }

            /// The function_definition or class_definition behind an optional decorated_definition.
            TSNode definitionOf(TSNode node)
            {
                return isType(node, "decorated_definition") ? field(node, "definition") : node;
            }

            class SourceView
            {
            public:
                explicit SourceView(std::string_view code)
                    : m_code(code), m_lines(Utils::splitLines(code))
                {
                }

                std::string text(TSNode node) const
                {
                    const std::uint32_t begin = ts_node_start_byte(node);
                    const std::uint32_t end   = ts_node_end_byte(node);
                    return std::string(m_code.substr(begin, end - begin));
                }

                std::string lines(int startLine, int endLine) const
                {
                    std::vector<std::string> parts;
                    for (int n = startLine; n <= endLine; ++n)
                    {
                        if (n >= 1 && static_cast<std::size_t>(n) <= m_lines.size())
                            parts.emplace_back(m_lines[static_cast<std::size_t>(n - 1)]);
                    }
                    return Utils::join(parts, "\n");
                }

            private:
                std::string_view              m_code;
                std::vector<std::string_view> m_lines;
            };

            class TreeCursor
            {
            public:
                explicit TreeCursor(TSNode root) : m_cursor(ts_tree_cursor_new(root)) {}
                ~TreeCursor() { ts_tree_cursor_delete(&m_cursor); }

                TreeCursor(const TreeCursor &)            = delete;
                TreeCursor &operator=(const TreeCursor &) = delete;

                TSNode node() const { return ts_tree_cursor_current_node(&m_cursor); }

                /// Pre-order step; descend only when asked. False once the walk is done.
                bool advance(bool descend)
                {
                    if (descend && ts_tree_cursor_goto_first_child(&m_cursor))
                        return true;
                    while (!ts_tree_cursor_goto_next_sibling(&m_cursor))
                    {
                        if (!ts_tree_cursor_goto_parent(&m_cursor))
                            return false;
                    }
                    return true;
                }

            private:
                TSTreeCursor m_cursor;
            };

            // ---------------------------------------------------------------
            // Syntax errors
            // ---------------------------------------------------------------

            std::optional<TSNode> firstErrorNode(TSNode root)
            {
                TreeCursor cursor(root);
                do
                {
                    const TSNode node = cursor.node();
                    if (ts_node_is_missing(node) || isType(node, "ERROR"))
                        return node;
                    if (!cursor.advance(ts_node_has_error(node)))
                        break;
                } while (true);
                return std::nullopt;
            }

            std::string describeError(TSNode node)
            {
                if (ts_node_is_missing(node))
                    return std::string("expected '") + ts_node_type(node) + "'";

                std::vector<std::string> open;
                const std::uint32_t count = ts_node_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i)
                {
                    const std::string type = ts_node_type(ts_node_child(node, i));
                    if (type == "(" || type == "[" || type == "{")
                        open.push_back(type);
                    else if ((type == ")" || type == "]" || type == "}") && !open.empty())
                        open.pop_back();
                }
                if (!open.empty())
                    return "'" + open.back() + "' was never closed";
                return "invalid syntax";
            }

            // ---------------------------------------------------------------
            // String literals / docstrings
            // ---------------------------------------------------------------

            std::string unescape(std::string_view s)
            {
                std::string out;
                out.reserve(s.size());
                for (std::size_t i = 0; i < s.size(); ++i)
                {
                    const char c = s[i];
                    if (c != '\\' || i + 1 >= s.size())
                    {
                        out += c;
                        continue;
                    }
                    const char n = s[++i];
                    switch (n)
                    {
                    case '\n': break;
                    case '\\': out += '\\'; break;
                    case '\'': out += '\''; break;
                    case '"':  out += '"';  break;
                    case 'n':  out += '\n'; break;
                    case 't':  out += '\t'; break;
                    case 'r':  out += '\r'; break;
                    case 'a':  out += '\a'; break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'v':  out += '\v'; break;
                    default:
                        out += '\\';
                        out += n;
                        break;
                    }
                }
                return out;
            }

            /// Value of a str literal; nullopt for bytes and f-strings.
            std::optional<std::string> stringValue(std::string_view text)
            {
                const std::size_t q = text.find_first_of("'\"");
                if (q == std::string_view::npos)
                    return std::nullopt;

                const std::string prefix = Utils::toLower(text.substr(0, q));
                if (prefix.find('b') != std::string::npos || prefix.find('f') != std::string::npos)
                    return std::nullopt;

                const char        quote  = text[q];
                const bool        triple = text.size() >= q + 6 && text[q + 1] == quote && text[q + 2] == quote;
                const std::size_t qlen   = triple ? 3 : 1;
                if (text.size() < q + 2 * qlen)
                    return std::nullopt;

                const std::string_view content = text.substr(q + qlen, text.size() - q - 2 * qlen);
                if (prefix.find('r') != std::string::npos)
                    return std::string(content);
                return unescape(content);
            }

            std::optional<std::string> docstringOf(TSNode block, const SourceView &src)
            {
                if (ts_node_is_null(block))
                    return std::nullopt;

                const std::vector<TSNode> statements = namedChildren(block);
                if (statements.empty() || !isType(statements.front(), "expression_statement"))
                    return std::nullopt;

                const std::vector<TSNode> exprs = namedChildren(statements.front());
                if (exprs.size() != 1)
                    return std::nullopt;

                std::vector<TSNode> pieces;
                if (isType(exprs.front(), "string"))
                    pieces.push_back(exprs.front());
                else if (isType(exprs.front(), "concatenated_string"))
                    pieces = namedChildren(exprs.front());
                else
                    return std::nullopt;

                std::string value;
                for (TSNode piece : pieces)
                {
                    if (!isType(piece, "string"))
                        return std::nullopt;
                    auto part = stringValue(src.text(piece));
                    if (!part)
                        return std::nullopt;
                    value += *part;
                }
                return cleanDocstring(value);
            }

            // ---------------------------------------------------------------
            // Entities
            // ---------------------------------------------------------------

            std::vector<std::string> decoratorsOf(TSNode definition, const SourceView &src)
            {
                std::vector<std::string> out;
                const TSNode parent = ts_node_parent(definition);
                if (ts_node_is_null(parent) || !isType(parent, "decorated_definition"))
                    return out;

                for (TSNode child : namedChildren(parent))
                {
                    if (!isType(child, "decorator"))
                        continue;
                    const std::vector<TSNode> expr = namedChildren(child);
                    if (!expr.empty())
                        out.push_back(src.text(expr.front()));
                }
                return out;
            }

            std::vector<core::Parameter> extractParameters(TSNode list, const SourceView &src)
            {
                std::vector<core::Parameter> params;
                if (ts_node_is_null(list))
                    return params;

                bool keywordOnly = false;
                const std::uint32_t count = ts_node_child_count(list);
                for (std::uint32_t i = 0; i < count; ++i)
                {
                    const TSNode p = ts_node_child(list, i);
                    if (isType(p, "positional_separator") || isType(p, "/"))
                    {
                        // Everything so far was positional-only.
                        params.clear();
                        continue;
                    }
                    if (isType(p, "keyword_separator") || isType(p, "*") || isType(p, "list_splat_pattern"))
                    {
                        keywordOnly = true;
                        continue;
                    }
                    if (keywordOnly || !ts_node_is_named(p))
                        continue;

                    core::Parameter param;
                    if (isType(p, "identifier"))
                    {
                        param.name = src.text(p);
                    }
                    else if (isType(p, "default_parameter") || isType(p, "typed_default_parameter"))
                    {
                        const TSNode name = field(p, "name");
                        if (ts_node_is_null(name) || !isType(name, "identifier"))
                            continue;
                        param.name = src.text(name);

                        const TSNode type = field(p, "type");
                        if (!ts_node_is_null(type))
                            param.declaredType = src.text(type);
                        param.defaultLiteral = src.text(field(p, "value"));
                    }
                    else if (isType(p, "typed_parameter"))
                    {
                        const std::vector<TSNode> parts = namedChildren(p);
                        if (parts.empty())
                            continue;
                        if (isType(parts.front(), "list_splat_pattern"))
                        {
                            keywordOnly = true;   // *args: T
                            continue;
                        }
                        if (!isType(parts.front(), "identifier"))
                            continue;
                        param.name         = src.text(parts.front());
                        param.declaredType = src.text(field(p, "type"));
                    }
                    else
                    {
                        continue;   // **kwargs, tuple patterns
                    }
                    params.push_back(std::move(param));
                }
                return params;
            }

            std::string renderSignature(const core::FunctionEntity &fn)
            {
                std::vector<std::string> parts;
                for (const auto &p : fn.parameters)
                {
                    std::string s = p.name;
                    if (p.declaredType)
                        s += ": " + *p.declaredType;
                    if (p.defaultLiteral)
                        s += " = " + *p.defaultLiteral;
                    parts.push_back(std::move(s));
                }

                std::string sig = "def " + fn.name + "(" + Utils::join(parts, ", ") + ")";
                if (fn.returnType)
                    sig += " -> " + *fn.returnType;
                return sig;
            }

            core::FunctionEntity extractFunction(TSNode node,
                                                 const SourceView &src,
                                                 const std::optional<std::string> &className)
            {
                core::FunctionEntity fn;
                fn.name       = src.text(field(node, "name"));
                fn.startLine  = firstLine(node);
                fn.endLine    = std::max(fn.startLine, lastLine(node));
                fn.parameters = extractParameters(field(node, "parameters"), src);

                const TSNode returns = field(node, "return_type");
                if (!ts_node_is_null(returns))
                    fn.returnType = src.text(returns);

                fn.signature  = renderSignature(fn);
                fn.body       = src.lines(fn.startLine, fn.endLine);
                fn.decorators = decoratorsOf(node, src);
                fn.docstring  = docstringOf(field(node, "body"), src);
                fn.isAsync    = ts_node_child_count(node) > 0 && isType(ts_node_child(node, 0), "async");
                fn.isMethod   = className.has_value();
                fn.className  = className;
                return fn;
            }

            core::ClassEntity extractClass(TSNode node, const SourceView &src)
            {
                core::ClassEntity cls;
                cls.name      = src.text(field(node, "name"));
                cls.startLine = firstLine(node);
                cls.endLine   = std::max(cls.startLine, lastLine(node));

                const TSNode superclasses = field(node, "superclasses");
                if (!ts_node_is_null(superclasses))
                {
                    for (TSNode arg : namedChildren(superclasses))
                    {
                        if (isType(arg, "keyword_argument") || isType(arg, "list_splat")
                            || isType(arg, "dictionary_splat"))
                            continue;
                        cls.bases.push_back(src.text(arg));
                    }
                }

                const TSNode body = field(node, "body");
                if (!ts_node_is_null(body))
                {
                    for (TSNode member : namedChildren(body))
                    {
                        const TSNode definition = definitionOf(member);
                        if (!ts_node_is_null(definition) && isType(definition, "function_definition"))
                        {
                            cls.methods.push_back(extractFunction(definition, src, cls.name));
                            continue;
                        }
                        if (!isType(member, "expression_statement"))
                            continue;

                        const std::vector<TSNode> exprs = namedChildren(member);
                        if (exprs.size() != 1 || !isType(exprs.front(), "assignment"))
                            continue;
                        const TSNode left = field(exprs.front(), "left");
                        const TSNode type = field(exprs.front(), "type");
                        if (ts_node_is_null(type) || !isType(left, "identifier"))
                            continue;

                        core::Attribute attr;
                        attr.name         = src.text(left);
                        attr.declaredType = src.text(type);
                        attr.line         = firstLine(member);
                        cls.attributes.push_back(std::move(attr));
                    }
                }

                cls.docstring  = docstringOf(body, src);
                cls.decorators = decoratorsOf(node, src);
                return cls;
            }

            std::string importedName(TSNode node, const SourceView &src)
            {
                return isType(node, "aliased_import") ? src.text(field(node, "name")) : src.text(node);
            }

            void collectImports(TSNode node, const SourceView &src, std::vector<std::string> &imports)
            {
                if (isType(node, "import_statement"))
                {
                    for (TSNode name : namedChildren(node))
                        imports.push_back(importedName(name, src));
                    return;
                }

                // from-imports; the __future__ form has no module_name field.
                const TSNode moduleNode = field(node, "module_name");
                std::string  module     = "__future__";
                if (!ts_node_is_null(moduleNode))
                {
                    module.clear();
                    if (isType(moduleNode, "relative_import"))
                    {
                        // relative-import dots are not part of the module name
                        for (TSNode part : namedChildren(moduleNode))
                        {
                            if (isType(part, "dotted_name"))
                                module = src.text(part);
                        }
                    }
                    else
                    {
                        module = src.text(moduleNode);
                    }
                }

                for (TSNode child : namedChildren(node))
                {
                    if (!ts_node_is_null(moduleNode) && ts_node_eq(child, moduleNode))
                        continue;
                    if (isType(child, "wildcard_import"))
                        imports.push_back(module + ".*");
                    else
                        imports.push_back(module + "." + importedName(child, src));
                }
            }

            void collectGlobals(TSNode statement, const SourceView &src, std::vector<core::GlobalVariable> &globals)
            {
                if (!isType(statement, "expression_statement"))
                    return;
                const std::vector<TSNode> exprs = namedChildren(statement);
                if (exprs.size() != 1 || !isType(exprs.front(), "assignment"))
                    return;

                std::vector<TSNode> targets;
                TSNode value = exprs.front();
                while (!ts_node_is_null(value) && isType(value, "assignment"))
                {
                    if (!ts_node_is_null(field(value, "type")))
                        return;   // annotated assignment
                    targets.push_back(field(value, "left"));
                    value = field(value, "right");
                }
                if (ts_node_is_null(value))
                    return;

                const std::string repr = src.text(value);
                const int         line = firstLine(statement);
                for (TSNode target : targets)
                {
                    if (isType(target, "identifier"))
                        globals.push_back({src.text(target), line, repr});
                }
            }

            // ---------------------------------------------------------------
            // Tree walk
            // ---------------------------------------------------------------

            struct TreeFacts
            {
                std::vector<TSNode> classes;   // pre-order
                std::vector<TSNode> imports;   // pre-order
                int                 complexity = 1;
            };

            bool isDecisionPoint(const char *type)
            {
                static const char *const kDecisionTypes[] = {
                    "if_statement", "elif_clause", "for_statement", "while_statement",
                    "except_clause", "except_group_clause", "boolean_operator"};

                for (const char *candidate : kDecisionTypes)
                {
                    if (std::strcmp(type, candidate) == 0)
                        return true;
                }
                return false;
            }

            TreeFacts walkTree(TSNode root)
            {
                TreeFacts  facts;
                TreeCursor cursor(root);
                do
                {
                    const TSNode node = cursor.node();
                    const char  *type = ts_node_type(node);

                    // One per branch; a chain of N boolean operands nests N-1 operators.
                    if (isDecisionPoint(type))
                        ++facts.complexity;
                    else if (std::strcmp(type, "class_definition") == 0)
                        facts.classes.push_back(node);
                    else if (std::strcmp(type, "import_statement") == 0
                             || std::strcmp(type, "import_from_statement") == 0
                             || std::strcmp(type, "future_import_statement") == 0)
                        facts.imports.push_back(node);
                } while (cursor.advance(true));
                return facts;
            }
        } // namespace

        std::string cleanDocstring(std::string_view raw)
        {
            std::vector<std::string> lines;
            for (std::string_view line : Utils::split(raw, '\n', true))
            {
                std::string expanded;
                for (char c : line)
                {
                    if (c == '\t')
                        expanded.append(8 - expanded.size() % 8, ' ');
                    else
                        expanded += c;
                }
                lines.push_back(std::move(expanded));
            }
            if (lines.empty())
                return {};

            std::size_t margin = std::numeric_limits<std::size_t>::max();
            for (std::size_t i = 1; i < lines.size(); ++i)
            {
                const std::string_view content = Utils::ltrim(lines[i]);
                if (!content.empty())
                    margin = std::min(margin, lines[i].size() - content.size());
            }

            lines[0] = std::string(Utils::ltrim(lines[0]));
            for (std::size_t i = 1; i < lines.size(); ++i)
                lines[i] = margin < lines[i].size() ? lines[i].substr(margin) : std::string{};

            while (!lines.empty() && lines.back().empty())
                lines.pop_back();
            std::size_t first = 0;
            while (first < lines.size() && lines[first].empty())
                ++first;
            lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));

            return Utils::join(lines, "\n");
        }

        core::ParseResult PythonParser::parse(std::string_view code, const std::string &languageTag) const
        {
            if (Utils::startsWith(code, kByteOrderMark))
                code.remove_prefix(kByteOrderMark.size());

            std::unique_ptr<TSParser, void (*)(TSParser *)> parser(ts_parser_new(), ts_parser_delete);
            if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python()))
                throw std::runtime_error("Failed to create tree-sitter parser for Python");

            const char *text = code.empty() ? "" : code.data();
            std::unique_ptr<TSTree, void (*)(TSTree *)> tree(
                ts_parser_parse_string(parser.get(), nullptr, text, static_cast<std::uint32_t>(code.size())),
                ts_tree_delete);
            if (!tree)
                throw std::runtime_error("tree-sitter returned no syntax tree for Python source");

            core::ParseResult result;
            result.language = languageTag;

            const TSNode root = ts_tree_root_node(tree.get());
            if (ts_node_has_error(root))
            {
                const std::optional<TSNode> bad = firstErrorNode(root);
                const int         line    = bad ? firstLine(*bad) : 1;
                const std::string message = bad ? describeError(*bad) : "invalid syntax";
                result.errors.push_back("Syntax error at line " + std::to_string(line) + ": " + message);
                result.complexityScore = 0.0;
                return result;
            }

            const SourceView src(code);
            const TreeFacts  facts = walkTree(root);

            for (TSNode node : facts.classes)
                result.classes.push_back(extractClass(node, src));
            for (TSNode node : facts.imports)
                collectImports(node, src, result.imports);

            for (TSNode statement : namedChildren(root))
            {
                const TSNode definition = definitionOf(statement);
                if (!ts_node_is_null(definition) && isType(definition, "function_definition"))
                    result.functions.push_back(extractFunction(definition, src, std::nullopt));
                else
                    collectGlobals(statement, src, result.globalVariables);
            }

            result.complexityScore = std::min(100.0, static_cast<double>(facts.complexity) * 5.0);
            return result;
        }

    } // namespace Parser
} // namespace CodeRisk
