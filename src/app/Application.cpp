#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "config/PipelineSettings.hpp"
#include "processing/DateNormalizer.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/DictionaryScriptConverter.hpp"
#include "processing/IScriptConverter.hpp"
#include "processing/PagePipeline.hpp"
#include "processing/SentenceReflow.hpp"
#include "record/Criteria.hpp"
#include "record/PageRecord.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

void Application::PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] <extraction.json | ->\n";
    std::cout << "Normalize one extracted newspaper page\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>      Configuration file (default: config.toml)\n";
    std::cout << "  --json               Print the record as JSON instead of text\n";
    std::cout << "  --verbose            Trace every pipeline stage to the pipeline log\n";
    std::cout << "  --dictionary <path>  Conversion table, repeatable (replaces configured tables)\n";
    std::cout << "  --no-convert         Skip script conversion\n";
    std::cout << "  --date <text>        Print the normalized form of a date and exit\n";
    std::cout << "  --reflow <path>      Print the reflowed text of a file and exit\n";
    std::cout << "  --criteria <path>    Print the fields flagged by a criteria JSON and exit\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void Application::PrintVersion()
{
    std::cout << "pagenorm " << PAGENORM_VERSION_STRING << "\n";
}

bool Application::parseCommandLineArgs(const std::vector<std::string>& args, Options& outOptions,
                                       std::string& outError)
{
    Options options;
    bool have_input = false;

    auto take_value = [&](std::size_t& i, const std::string& flag, std::string& out) -> bool
    {
        if (i + 1 >= args.size())
        {
            outError = flag + " requires a value";
            return false;
        }
        out = args[++i];
        return true;
    };

    auto set_mode = [&](Mode mode, const std::string& flag) -> bool
    {
        if (options.mode != Mode::Page && options.mode != mode)
        {
            outError = flag + " cannot be combined with another mode";
            return false;
        }
        options.mode = mode;
        return true;
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help")
        {
            options.mode = Mode::Help;
            outOptions = std::move(options);
            return true;
        }
        else if (arg == "--version")
        {
            options.mode = Mode::Version;
            outOptions = std::move(options);
            return true;
        }
        else if (arg == "--config")
        {
            if (!take_value(i, arg, options.config_path))
                return false;
        }
        else if (arg == "--json")
        {
            options.json_output = true;
        }
        else if (arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "--no-convert")
        {
            options.no_convert = true;
        }
        else if (arg == "--dictionary")
        {
            std::string path;
            if (!take_value(i, arg, path))
                return false;
            options.dictionaries.push_back(std::move(path));
        }
        else if (arg == "--date" || arg == "--reflow" || arg == "--criteria")
        {
            Mode mode = arg == "--date" ? Mode::Date : (arg == "--reflow" ? Mode::Reflow : Mode::Criteria);
            if (have_input)
            {
                outError = arg + " cannot be combined with an extraction file";
                return false;
            }
            if (!set_mode(mode, arg) || !take_value(i, arg, options.input))
                return false;
            have_input = true;
        }
        else if (arg.size() > 1 && arg.rfind("--", 0) == 0)
        {
            outError = "Unknown option: " + arg;
            return false;
        }
        else if (!have_input)
        {
            options.input = arg;
            have_input = true;
        }
        else
        {
            outError = "Unexpected argument: " + arg;
            return false;
        }
    }

    if (!have_input)
    {
        outError = "No extraction file given";
        return false;
    }

    outOptions = std::move(options);
    return true;
}

int Application::run()
{
    std::vector<std::string> args;
    for (int i = 1; i < argc_; ++i)
        args.emplace_back(argv_[i]);
    std::string error;
    if (!parseCommandLineArgs(args, options_, error))
    {
        std::cerr << "Error: " << error << "\n";
        PrintUsage(argc_ > 0 ? argv_[0] : "pagenorm");
        return kExitUsage;
    }

    if (options_.mode == Mode::Help)
    {
        PrintUsage(argc_ > 0 ? argv_[0] : "pagenorm");
        return kExitOk;
    }
    if (options_.mode == Mode::Version)
    {
        PrintVersion();
        return kExitOk;
    }

    if (!initialize())
    {
        reportPendingErrors();
        return kExitFailure;
    }

    int rc = kExitFailure;
    switch (options_.mode)
    {
    case Mode::Date:
        rc = runDate();
        break;
    case Mode::Reflow:
        rc = runReflow();
        break;
    case Mode::Criteria:
        rc = runCriteria();
        break;
    default:
        rc = runPage();
        break;
    }

    reportPendingErrors();
    return rc;
}

bool Application::initialize()
{
    PROFILE_SCOPE_FUNCTION();

    if (!initializeLogging())
        return false;

    initializeConfig();

    processing::Diagnostics::SetVerbose(options_.verbose || settings_->verbose);
    processing::Diagnostics::SetMaxPreview(settings_->max_preview);

    return setupConverter();
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(options_.config_path))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filename = "run.log",
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = 10 * 1024 * 1024,
                                                     .backup_count = 3,
                                                     .add_console_appender = true });

    ok = utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
             { .name = "pipeline",
               .filename = "pipeline.log",
               .append_override = std::nullopt,
               .level_override = std::nullopt,
               .max_file_size = 10 * 1024 * 1024,
               .backup_count = 3,
               .add_console_appender = false }) &&
         ok;

#if PAGENORM_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                         .filename = "profiling.log",
                                                                         .append_override = std::nullopt,
                                                                         .level_override = plog::debug,
                                                                         .max_file_size = 10 * 1024 * 1024,
                                                                         .backup_count = 3,
                                                                         .add_console_appender = false });
#endif

    PLOG_INFO << "pagenorm " << PAGENORM_VERSION_STRING << " starting";
    return ok;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_ = std::make_unique<PipelineSettings>();
    settings_->registerWith(*config_);
    if (!config_->load())
    {
        PLOG_WARNING << "Continuing with default settings: " << config_->lastError();
    }
}

bool Application::setupConverter()
{
    if (options_.no_convert || !settings_->conversion_enabled)
    {
        PLOG_INFO << "Script conversion disabled";
        return true;
    }

    const auto& tables = options_.dictionaries.empty() ? settings_->dictionaries : options_.dictionaries;
    if (tables.empty())
    {
        converter_ = std::make_unique<processing::IdentityScriptConverter>();
        return true;
    }

    auto converter = std::make_unique<processing::DictionaryScriptConverter>();
    for (const auto& path : tables)
    {
        std::string error;
        if (!converter->loadFile(path, error))
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Conversion, "Failed to load conversion table",
                                              error);
            return false;
        }
    }

    PLOG_INFO << "Script converter " << converter->name() << " ready (" << converter->entryCount() << " entries)";
    converter_ = std::move(converter);
    return true;
}

int Application::runPage()
{
    std::string text;
    std::string error;
    if (!readInput(options_.input, text, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Extraction, "Cannot read extraction", error);
        return kExitFailure;
    }

    processing::PagePipeline pipeline(converter_.get());
    record::NewspaperPage page;
    text_processing::NormalizationReport report;
    if (!pipeline.process(text, page, error, &report))
    {
        std::cerr << "Error: " << error << "\n";
        return kExitFailure;
    }

    if (options_.json_output)
        std::cout << record::toJson(page).dump(2) << "\n";
    else
        std::cout << record::toText(page) << "\n";

    if (!report.allStagesSucceeded())
        PLOG_WARNING << "Page normalized with stage fallbacks";
    return kExitOk;
}

int Application::runDate()
{
    processing::DateValue value = processing::DateNormalizer::normalize(options_.input);
    if (options_.json_output)
    {
        nlohmann::json j = { { "published_date", processing::toString(value) },
                             { "published_date_parsed", processing::isCalendarDate(value) } };
        std::cout << j.dump() << "\n";
    }
    else
    {
        std::cout << processing::toString(value) << "\n";
    }
    return kExitOk;
}

int Application::runReflow()
{
    std::string text;
    std::string error;
    if (!readInput(options_.input, text, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Extraction, "Cannot read text", error);
        return kExitFailure;
    }

    std::string reflowed = processing::SentenceReflow::reflow(text);
    if (converter_)
        reflowed = converter_->convert(reflowed);
    std::cout << reflowed << "\n";
    return kExitOk;
}

int Application::runCriteria()
{
    std::string text;
    std::string error;
    if (!readInput(options_.input, text, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Extraction, "Cannot read criteria", error);
        return kExitFailure;
    }

    record::CriteriaParser parser;
    record::Criteria criteria;
    if (!parser.parse(text, criteria, error))
    {
        std::cerr << "Error: " << error << "\n";
        return kExitFailure;
    }

    auto flagged = record::flaggedFields(criteria, settings_->flag_threshold);
    if (options_.json_output)
    {
        nlohmann::json j = { { "threshold", settings_->flag_threshold }, { "flagged_fields", flagged } };
        std::cout << j.dump(2) << "\n";
    }
    else
    {
        for (const auto& field : flagged)
            std::cout << field << "\n";
    }
    return kExitOk;
}

void Application::reportPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::Drain())
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
}

bool Application::readInput(const std::string& source, std::string& outText, std::string& outError)
{
    if (source == "-")
    {
        outText.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream file(source, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open " + source;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    outText = buffer.str();
    return true;
}
