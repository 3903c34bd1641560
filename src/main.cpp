#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "analysis/AnalyzerSettings.hpp"
#include "analysis/CodeAnalyzer.hpp"
#include "core/Language.hpp"
#include "core/Report.hpp"
#include "input/SourceReader.hpp"
#include "report/ReportGenerator.hpp"
#include "rules/RuleCatalog.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

using namespace CodeRisk;

namespace
{
    constexpr int kExitOk          = 0;
    constexpr int kExitUsage       = 1;   // also I/O failures
    constexpr int kExitConfigError = 2;

    enum class Mode
    {
        Parse,
        Metrics,
        Defects,
        All
    };

    // -------------------------
    // CLI
    // -------------------------
    struct CliOptions
    {
        std::string inputFile;
        std::string language;      // empty: infer from extension
        std::string configFile;    // empty: built-in defaults
        std::string outputFile;    // empty: stdout
        Mode mode    = Mode::All;
        bool json    = false;
        bool pretty  = false;
        bool verbose = false;
        bool help    = false;
        std::string error;         // set when the command line is unusable
    };

    std::optional<Mode> parseMode(const std::string &text)
    {
        if (text == "parse")   return Mode::Parse;
        if (text == "metrics") return Mode::Metrics;
        if (text == "defects") return Mode::Defects;
        if (text == "all")     return Mode::All;
        return std::nullopt;
    }

    CliOptions parseArgs(int argc, char *argv[])
    {
        CliOptions opts;

        auto takeValue = [&](int &i, const std::string &flag, std::string &into) {
            if (i + 1 >= argc)
            {
                opts.error = "missing value for " + flag;
                return;
            }
            into = argv[++i];
        };

        for (int i = 1; i < argc && opts.error.empty(); ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                opts.help = true;
            }
            else if (arg == "--language" || arg == "-l")
            {
                takeValue(i, arg, opts.language);
            }
            else if (arg == "--config" || arg == "-c")
            {
                takeValue(i, arg, opts.configFile);
            }
            else if (arg == "--output" || arg == "-o")
            {
                takeValue(i, arg, opts.outputFile);
            }
            else if (arg == "--mode" || arg == "-m")
            {
                std::string value;
                takeValue(i, arg, value);
                if (!opts.error.empty())
                    break;
                if (auto mode = parseMode(value))
                    opts.mode = *mode;
                else
                    opts.error = "unknown mode '" + value + "' (expected parse, metrics, defects or all)";
            }
            else if (arg == "--json")
            {
                opts.json = true;
            }
            else if (arg == "--pretty")
            {
                opts.json   = true;
                opts.pretty = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                opts.verbose = true;
            }
            else if (arg == "-" || (!arg.empty() && arg[0] != '-'))
            {
                if (!opts.inputFile.empty())
                    opts.error = "more than one input file given";
                else
                    opts.inputFile = arg;
            }
            else
            {
                opts.error = "unknown option '" + arg + "'";
            }
        }

        return opts;
    }

    void printUsage(const char *progName)
    {
        std::cout
            << "Usage: " << progName << " [OPTIONS] <file>\n\n"
            << "Static defect-risk analysis of one source file ('-' reads stdin).\n\n"
            << "OPTIONS:\n"
            << "  -l, --language LANG      python, javascript, typescript, java, ...\n"
            << "                           (default: inferred from the file extension)\n"
            << "  -c, --config FILE        key = value configuration file\n"
            << "  -m, --mode MODE          parse | metrics | defects | all (default: all)\n"
            << "      --json               JSON output\n"
            << "      --pretty             Indented JSON output (implies --json)\n"
            << "  -o, --output FILE        Write the report to FILE instead of stdout\n"
            << "  -v, --verbose            Debug logging, detailed console report\n"
            << "  -h, --help               Show this help\n\n"
            << "Exit status: 0 success, 1 usage or I/O error, 2 configuration error.\n";
    }

    std::optional<Analysis::AnalyzerSettings> loadSettings(const CliOptions &opts)
    {
        auto &logger = Utils::getLogger();
        Utils::ConfigLoader config;

        if (!opts.configFile.empty())
        {
            if (!config.loadFromFile(opts.configFile))
            {
                logger.error("Cannot read config file: " + opts.configFile);
                return std::nullopt;
            }
            logger.info("Config: " + opts.configFile + " (" + std::to_string(config.size()) + " keys)");
        }

        try
        {
            return Analysis::AnalyzerSettings::fromConfig(config);
        }
        catch (const Analysis::ConfigError &ex)
        {
            logger.error(std::string("Invalid configuration: ") + ex.what());
            return std::nullopt;
        }
    }

    core::Report runAnalysis(const Analysis::CodeAnalyzer &analyzer,
                             const CliOptions &opts,
                             const std::string &code,
                             const std::string &language)
    {
        core::Report report(opts.inputFile, core::normaliseLanguageTag(language));
        const auto started = Utils::now();

        if (opts.mode == Mode::Parse || opts.mode == Mode::All)
            report.setParseResult(analyzer.parse(code, language));

        if (opts.mode == Mode::Metrics || opts.mode == Mode::All)
            report.setMetrics(analyzer.metrics(code, language));

        if (opts.mode == Mode::Defects || opts.mode == Mode::All)
        {
            auto prediction = analyzer.analyze(code, language);
            auto summary    = Analysis::CodeAnalyzer::summarize(prediction.flaggedSections);
            report.setPrediction(std::move(prediction), std::move(summary));
        }

        report.setTiming(started, Utils::now());
        return report;
    }
} // namespace

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return kExitOk;
    }
    if (!opts.error.empty() || opts.inputFile.empty())
    {
        std::cerr << "Error: " << (opts.error.empty() ? "input file required." : opts.error) << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto &logger = Utils::getLogger();
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);

    const auto settings = loadSettings(opts);
    if (!settings)
        return kExitConfigError;

    settings->applyLogging();
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);

    logger.info("Input: " + opts.inputFile);

    const auto code = Input::SourceReader::readFile(opts.inputFile);
    if (!code)
    {
        logger.error("Cannot read input file: " + opts.inputFile);
        return kExitUsage;
    }

    std::string language = opts.language;
    if (language.empty())
    {
        language = Input::SourceReader::inferLanguage(opts.inputFile);
        if (language.empty())
        {
            logger.warn("Cannot infer language of '" + opts.inputFile + "'; using generic analysis");
            language = "generic";
        }
    }

    try
    {
        const auto analyzer = Analysis::CodeAnalyzer::fromSettings(*settings);
        core::Report report = runAnalysis(*analyzer, opts, *code, language);

        Report::ReportGenerator generator(opts.pretty ? Report::ReportGenerator::OutputFormat::JSON_PRETTY
                                          : opts.json ? Report::ReportGenerator::OutputFormat::JSON
                                                      : Report::ReportGenerator::OutputFormat::CONSOLE);
        generator.setVerbose(opts.verbose);
        generator.generateReport(std::move(report));

        const bool written = opts.outputFile.empty() ? generator.writeReport(std::cout)
                                                     : generator.writeReportToFile(opts.outputFile);
        if (!written)
            return kExitUsage;
    }
    catch (const Rules::RuleCatalogError &ex)
    {
        logger.error(std::string("Rule catalog error: ") + ex.what());
        return kExitConfigError;
    }
    catch (const std::exception &ex)
    {
        logger.critical(std::string("Analysis failed: ") + ex.what());
        return kExitUsage;
    }

    return kExitOk;
}
