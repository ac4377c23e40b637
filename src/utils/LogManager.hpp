#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders. Settings come from the [logging] table of the
// configuration file; a missing file or table leaves the defaults in place.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filename;   // relative to the log directory
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;   // console output goes to stderr
    };

    static bool Initialize(const std::string& config_path = "config.toml");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Silences every registered logger. Appenders stay alive until exit because
    // plog loggers keep raw pointers to them; a later RegisterLogger for the
    // same instance re-enables the existing appenders instead of adding more.
    static void Shutdown();

    static bool IsRegistered(int instance_id);
    static std::size_t AppenderCount();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogDirectory();
    static bool PrepareLogDirectory();

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_utc_timestamps;
    static plog::Severity s_default_level;
    static std::string s_log_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::map<int, std::function<void(plog::Severity)>> s_severity_setters;
};

} // namespace utils
