#include "rules/RuleCatalog.hpp"

#include "core/Language.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Rules
    {
        namespace
        {
            using core::Severity;

            struct BuiltInRule
            {
                const char *language;
                const char *id;
                const char *pattern;
                const char *message;
                Severity    severity;
            };

            // Catalog order is scan order.
            const BuiltInRule kBuiltInRules[] = {
                // python
                {"python", "python.bare_except",       R"re(except\s*:)re",              "Bare except clause catches all exceptions",      Severity::Error},
                {"python", "python.eval",              R"re(eval\s*\()re",               "Use of eval() is a security risk",               Severity::Security},
                {"python", "python.exec",              R"re(exec\s*\()re",               "Use of exec() is a security risk",               Severity::Security},
                {"python", "python.wildcard_import",   R"re(from\s+\w+\s+import\s+\*)re", "Wildcard import pollutes namespace",             Severity::Warning},
                {"python", "python.global",            R"re(global\s+\w+)re",            "Global variable usage",                          Severity::Warning},
                {"python", "python.debug_print",       R"re(print\s*\(.*\)\s*$)re",      "Debug print statement",                          Severity::Info},
                {"python", "python.todo",              R"re(#\s*TODO)re",                "TODO comment found",                             Severity::Info},
                {"python", "python.fixme",             R"re(#\s*FIXME)re",               "FIXME comment found",                            Severity::Warning},
                {"python", "python.hack",              R"re(#\s*HACK)re",                "HACK comment found",                             Severity::Warning},
                {"python", "python.hardcoded_password", R"re(password\s*=\s*['"])re",    "Hardcoded password detected",                    Severity::Security},
                {"python", "python.hardcoded_api_key", R"re(api[_-]?key\s*=\s*['"])re",  "Hardcoded API key detected",                     Severity::Security},
                {"python", "python.sleep_polling",     R"re(sleep\s*\(\s*\d+\s*\))re",   "Sleep call may indicate polling anti-pattern",   Severity::Warning},
                {"python", "python.generic_exception", R"re(except\s+Exception\s*:)re",  "Catching generic Exception",                     Severity::Warning},
                {"python", "python.str_format",        R"re(\.format\(.*\)\s*$)re",      "Consider using f-strings for formatting",        Severity::Suggestion},
                {"python", "python.bare_pass",         R"re(^\s*pass\s*$)re",            "Empty block with pass",                          Severity::Info},
                {"python", "python.assert",            R"re(assert\s+)re",               "Assert statement (disabled in optimized mode)",  Severity::Warning},
                {"python", "python.os_system",         R"re(os\.system\s*\()re",         "os.system() is vulnerable to command injection", Severity::Security},

                // javascript
                {"javascript", "javascript.var",             R"re(\bvar\s+)re",                   "Use let/const instead of var",              Severity::Warning},
                {"javascript", "javascript.eval",            R"re(eval\s*\()re",                  "Use of eval() is a security risk",          Severity::Security},
                {"javascript", "javascript.inner_html",      R"re(innerHTML\s*=)re",              "innerHTML can lead to XSS vulnerabilities", Severity::Security},
                {"javascript", "javascript.document_write",  R"re(document\.write\s*\()re",       "document.write() is deprecated",            Severity::Warning},
                {"javascript", "javascript.loose_null_eq",   R"re(==\s*null|null\s*==)re",        "Use === for strict equality",               Severity::Warning},
                {"javascript", "javascript.loose_null_ne",   R"re(!=\s*null|null\s*!=)re",        "Use !== for strict inequality",             Severity::Warning},
                {"javascript", "javascript.console_log",     R"re(console\.log\s*\()re",          "Console log statement (debug)",             Severity::Info},
                {"javascript", "javascript.debugger",        R"re(debugger)re",                   "Debugger statement found",                  Severity::Warning},
                {"javascript", "javascript.alert",           R"re(alert\s*\()re",                 "Alert statement (debug/bad UX)",            Severity::Warning},
                {"javascript", "javascript.promise_chain",   R"re(\.then\s*\(.*\.then\s*\()re",   "Promise chain - consider async/await",      Severity::Suggestion},
                {"javascript", "javascript.nested_callbacks", R"re(callback.*callback)re",        "Nested callbacks - consider async/await",   Severity::Warning},
                {"javascript", "javascript.new_function",    R"re(new\s+Function\s*\()re",        "Dynamic function creation is risky",        Severity::Security},
                {"javascript", "javascript.string_timeout",  R"re(setTimeout\s*\(['"])re",        "String in setTimeout is like eval",         Severity::Security},

                // java
                {"java", "java.catch_exception",     R"re(catch\s*\(\s*Exception\s+)re",     "Catching generic Exception",                     Severity::Warning},
                {"java", "java.catch_throwable",     R"re(catch\s*\(\s*Throwable\s+)re",     "Catching Throwable is too broad",                Severity::Error},
                {"java", "java.print_stack_trace",   R"re(e\.printStackTrace\s*\(\s*\))re",  "printStackTrace() in production code",           Severity::Warning},
                {"java", "java.system_out",          R"re(System\.out\.print)re",            "System.out usage (use logger)",                  Severity::Warning},
                {"java", "java.public_field",        R"re(public\s+\w+\s+\w+\s*;)re",        "Public field without getter/setter",             Severity::Warning},
                {"java", "java.new_string",          R"re(new\s+String\s*\(\s*['"])re",      "Unnecessary String object creation",             Severity::Suggestion},
                {"java", "java.string_identity",     R"re(==\s*"|"\s*==)re",                 "String comparison with == instead of equals()",  Severity::Error},
                {"java", "java.equals_null",         R"re(\.equals\s*\(\s*null\s*\))re",     "null.equals() will throw NPE",                   Severity::Error},
                {"java", "java.synchronized_this",   R"re(synchronized\s*\(\s*this\s*\))re", "Synchronizing on 'this' is risky",               Severity::Warning},
                {"java", "java.thread_sleep",        R"re(Thread\.sleep\s*\()re",            "Thread.sleep() in production code",              Severity::Warning},
                {"java", "java.todo",                R"re(//\s*TODO)re",                     "TODO comment found",                             Severity::Info},
                {"java", "java.fixme",               R"re(//\s*FIXME)re",                    "FIXME comment found",                            Severity::Warning},

                // general
                {"general", "general.password",      R"re(password|passwd|pwd)re",      "Potential password handling",     Severity::Security},
                {"general", "general.secret",        R"re(secret|api[_-]?key|token)re", "Potential secret/token handling", Severity::Security},
                {"general", "general.unfinished",    R"re(TODO|FIXME|HACK|XXX)re",      "Unfinished code marker",          Severity::Warning},
                {"general", "general.magic_number",  R"re([A-Za-z]+\d{3,})re",          "Magic number in identifier",      Severity::Info},
            };

            std::string canonicalLanguage(std::string_view language)
            {
                const std::string tag = core::normaliseLanguageTag(language);
                if (tag.empty())
                    throw RuleCatalogError("Rule language must not be empty");
                return tag;
            }
        } // namespace

        RuleCatalog RuleCatalog::builtIn()
        {
            RuleCatalog catalog;
            for (const BuiltInRule &r : kBuiltInRules)
                catalog.addRule(r.language, r.id, r.pattern, r.message, r.severity);

            Utils::getLogger().info("RuleCatalog loaded " + std::to_string(catalog.size()) + " built-in rules");
            return catalog;
        }

        void RuleCatalog::addRule(std::string_view language,
                                  std::string      id,
                                  std::string      pattern,
                                  std::string      message,
                                  core::Severity   severity)
        {
            if (id.empty())
                throw RuleCatalogError("Rule id must not be empty");
            if (pattern.empty())
                throw RuleCatalogError("Rule '" + id + "' has an empty pattern");

            Rule rule;
            rule.language = canonicalLanguage(language);
            rule.severity = severity;

            try
            {
                rule.compiled = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
            }
            catch (const std::regex_error &e)
            {
                throw RuleCatalogError("Invalid pattern for rule '" + id + "': " + e.what());
            }

            rule.id      = std::move(id);
            rule.pattern = std::move(pattern);
            rule.message = std::move(message);

            auto it = m_idIndex.find(rule.id);
            if (it != m_idIndex.end())
            {
                Utils::getLogger().debug("Replacing rule '" + rule.id + "'");
                m_rules[it->second] = std::move(rule);
                return;
            }

            m_idIndex.emplace(rule.id, m_rules.size());
            m_rules.push_back(std::move(rule));
        }

        void RuleCatalog::addRule(std::string_view language,
                                  std::string      id,
                                  std::string      pattern,
                                  std::string      message,
                                  std::string_view severityTag)
        {
            const auto severity = core::severityFromString(severityTag);
            if (!severity)
            {
                throw RuleCatalogError("Rule '" + id + "' has unknown severity '"
                                       + std::string(severityTag) + "'");
            }
            addRule(language, std::move(id), std::move(pattern), std::move(message), *severity);
        }

        std::size_t RuleCatalog::loadExtraRules(const Utils::ConfigLoader &config)
        {
            static constexpr std::string_view kPrefix = "rule.";

            std::size_t loaded = 0;
            for (const std::string &key : config.keysWithPrefix(kPrefix))
            {
                const std::string id    = key.substr(kPrefix.size());
                const std::string value = config.getStringOr(key, "");

                // language | severity | message | pattern
                std::vector<std::string_view> fields;
                std::string_view rest = value;
                for (int i = 0; i < 3; ++i)
                {
                    const std::size_t bar = rest.find('|');
                    if (bar == std::string_view::npos)
                        break;
                    fields.push_back(Utils::trim(rest.substr(0, bar)));
                    rest.remove_prefix(bar + 1);
                }
                fields.push_back(Utils::trim(rest));

                bool complete = !id.empty() && fields.size() == 4;
                for (std::string_view f : fields)
                    complete = complete && !f.empty();
                if (!complete)
                {
                    throw RuleCatalogError("Malformed rule '" + key
                                           + "': expected <language> | <severity> | <message> | <pattern>");
                }

                addRule(fields[0], id, std::string(fields[3]), std::string(fields[2]), fields[1]);
                ++loaded;
            }

            if (loaded > 0)
                Utils::getLogger().info("RuleCatalog loaded " + std::to_string(loaded) + " extra rules");
            return loaded;
        }

        std::size_t RuleCatalog::loadExtraRulesFromFile(const std::string &path)
        {
            Utils::ConfigLoader rulesFile;
            if (!rulesFile.loadFromFile(path))
                throw RuleCatalogError("Cannot open rules file: " + path);
            return loadExtraRules(rulesFile);
        }

        std::vector<const Rule *> RuleCatalog::rulesFor(std::string_view language) const
        {
            const std::string tag = core::normaliseLanguageTag(language);

            std::vector<const Rule *> selected;
            if (tag != kGeneral)
            {
                for (const Rule &rule : m_rules)
                {
                    if (rule.language == tag)
                        selected.push_back(&rule);
                }
            }
            for (const Rule &rule : m_rules)
            {
                if (rule.language == kGeneral)
                    selected.push_back(&rule);
            }
            return selected;
        }

    } // namespace Rules
} // namespace CodeRisk
