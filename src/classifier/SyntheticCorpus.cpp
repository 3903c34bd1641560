#include "classifier/SyntheticCorpus.hpp"

#include <array>

#include "utils/StringUtils.hpp"

namespace CodeRisk
{
    namespace Classifier
    {
        namespace
        {
            const std::array<std::string, 3> kCleanExemplars{
                "def calculate_sum(numbers: List[int]) -> int:\n"
                "    '''Calculate the sum of numbers.'''\n"
                "    if not numbers:\n"
                "        return 0\n"
                "    return sum(numbers)",

                "async def fetch_data(url: str) -> dict:\n"
                "    '''Fetch data from URL with proper error handling.'''\n"
                "    try:\n"
                "        response = await client.get(url)\n"
                "        response.raise_for_status()\n"
                "        return response.json()\n"
                "    except HTTPError as e:\n"
                "        logger.error(f\"HTTP error: {e}\")\n"
                "        raise",

                "class UserService:\n"
                "    '''Service for user operations.'''\n"
                "    \n"
                "    def __init__(self, repository: UserRepository):\n"
                "        self._repository = repository\n"
                "    \n"
                "    def get_user(self, user_id: int) -> Optional[User]:\n"
                "        '''Get user by ID.'''\n"
                "        return self._repository.find_by_id(user_id)",
            };

            const std::array<std::string, 4> kDefectiveExemplars{
                "def process(x):\n"
                "    try:\n"
                "        result = eval(x)\n"
                "        exec(x)\n"
                "    except:\n"
                "        pass\n"
                "    return result",

                "def login(user, pwd):\n"
                "    password = \"admin123\"\n"
                "    if pwd == password:\n"
                "        global logged_in\n"
                "        logged_in = True\n"
                "    print(\"Login: \" + pwd)",

                "def fetch(url):\n"
                "    import os\n"
                "    os.system(\"curl \" + url)\n"
                "    data = None\n"
                "    if data == None:\n"
                "        pass",

                "var x = 1;\n"
                "eval(userInput);\n"
                "document.innerHTML = data;\n"
                "console.log(x);",
            };

            const std::array<std::string, 3> kCleanTemplates{
                "def {name}({params}) -> {ret}:\n    '''{doc}'''\n    return {value}",
                "class {name}:\n    '''{doc}'''\n    def __init__(self):\n        pass",
                "async def {name}():\n    '''{doc}'''\n    result = await operation()\n    return result",
            };
            const std::array<std::string, 5> kCleanNames{ "process", "calculate", "fetch", "handle", "validate" };
            const std::array<std::string, 4> kCleanParams{ "data: dict", "items: list", "value: int", "name: str" };
            const std::array<std::string, 3> kCleanDocs{ "Process the data.", "Calculate result.", "Handle operation." };

            const std::array<std::string, 4> kDefectiveTemplates{
                "def {name}():\n    try:\n        eval(input())\n    except:\n        pass",
                "var {name};\nconsole.log({name});\neval(data);",
                "def {name}(x):\n    global state\n    exec(x)\n    password = 'secret123'",
                "function {name}() {\n    document.innerHTML = data;\n    eval(code);\n}",
            };
            const std::array<std::string, 4> kDefectiveNames{ "process", "handle", "execute", "run" };
        } // namespace

        SyntheticCorpus::SyntheticCorpus(std::uint32_t seed, std::size_t generatedPerClass)
            : m_rng(seed),
              m_generatedPerClass(generatedPerClass)
        {
        }

        std::vector<LabelledSample> SyntheticCorpus::build()
        {
            std::vector<LabelledSample> samples;
            samples.reserve(kCleanExemplars.size() + kDefectiveExemplars.size() + 2 * m_generatedPerClass);

            for (const auto &code : kCleanExemplars)
                samples.push_back({ code, 0 });
            for (const auto &code : kDefectiveExemplars)
                samples.push_back({ code, 1 });

            for (std::size_t i = 0; i < m_generatedPerClass; ++i)
            {
                samples.push_back({ generateClean(), 0 });
                samples.push_back({ generateDefective(), 1 });
            }
            return samples;
        }

        std::string SyntheticCorpus::generateClean()
        {
            // Draw order is fixed: template, name, params, doc.
            const std::string &tmpl   = pick(kCleanTemplates);
            const std::string &name   = pick(kCleanNames);
            const std::string &params = pick(kCleanParams);
            const std::string &doc    = pick(kCleanDocs);

            std::string code = Utils::replaceAll(tmpl, "{name}", name);
            code = Utils::replaceAll(code, "{params}", params);
            code = Utils::replaceAll(code, "{ret}", "dict");
            code = Utils::replaceAll(code, "{doc}", doc);
            return Utils::replaceAll(code, "{value}", "result");
        }

        std::string SyntheticCorpus::generateDefective()
        {
            const std::string &tmpl = pick(kDefectiveTemplates);
            const std::string &name = pick(kDefectiveNames);
            return Utils::replaceAll(tmpl, "{name}", name);
        }

    } // namespace Classifier
} // namespace CodeRisk
