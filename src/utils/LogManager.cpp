#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../log/Utf8FileFormatter.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace fs = std::filesystem;

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
bool LogManager::s_utc_timestamps = false;
std::string LogManager::s_log_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::map<int, std::function<void(plog::Severity)>> LogManager::s_severity_setters;

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    ReadConfig(config_path);

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    const plog::Severity level = config.level_override.value_or(s_default_level);

    auto registered = s_severity_setters.find(InstanceId);
    if (registered != s_severity_setters.end())
    {
        registered->second(level);
        return true;
    }

    try
    {
        const std::string filepath = (fs::path(s_log_directory) / config.filename).string();

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(filepath, std::ios::trunc).close();
        }

        std::unique_ptr<plog::IAppender> file_appender;
        if (s_utc_timestamps)
            file_appender = std::make_unique<plog::RollingFileAppender<Utf8UtcFileFormatter>>(
                filepath.c_str(), config.max_file_size, config.backup_count);
        else
            file_appender = std::make_unique<plog::RollingFileAppender<Utf8FileFormatter>>(
                filepath.c_str(), config.max_file_size, config.backup_count);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        s_severity_setters[InstanceId] = [](plog::Severity severity)
        {
            if (auto logger = plog::get<InstanceId>())
                logger->setMaxSeverity(severity);
        };
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if PAGENORM_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    for (const auto& entry : s_severity_setters)
        entry.second(plog::none);
    s_initialized = false;
}

bool LogManager::IsRegistered(int instance_id) { return s_severity_setters.count(instance_id) != 0; }

std::size_t LogManager::AppenderCount() { return s_appenders.size(); }

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetLogDirectory() { return s_log_directory; }

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    fs::create_directories(s_log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "Unable to prepare log directory " + s_log_directory, ec.message());
        return false;
    }
    return true;
}

void LogManager::ReadConfig(const std::string& config_path)
{
    if (!fs::exists(config_path))
        return;

    try
    {
        auto cfg = toml::parse_file(config_path);
        if (auto logging = cfg["logging"].as_table())
        {
            if (auto append = (*logging)["append"].value<bool>())
            {
                s_append_logs = *append;
            }

            if (auto utc = (*logging)["utc"].value<bool>())
            {
                s_utc_timestamps = *utc;
            }

            if (auto directory = (*logging)["directory"].value<std::string>())
            {
                if (!directory->empty())
                    s_log_directory = *directory;
            }

            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                {
                    s_default_level = static_cast<plog::Severity>(level_int);
                }
            }
        }
    }
    catch (const toml::parse_error& pe)
    {
        // ConfigManager reports the same file with line details; keep defaults here
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(pe.description()));
    }
}

} // namespace utils
