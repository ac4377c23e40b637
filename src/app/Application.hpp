#pragma once

#include <memory>
#include <string>
#include <vector>

class ConfigManager;
struct PipelineSettings;

namespace processing
{
class IScriptConverter;
}

// Command line front end: one extraction document in, one normalized record out.
class Application
{
public:
    enum class Mode
    {
        Page,      // normalize an extraction JSON document
        Date,      // --date <text>
        Reflow,    // --reflow <file>
        Criteria,  // --criteria <file>
        Help,
        Version
    };

    struct Options
    {
        Mode mode = Mode::Page;
        std::string config_path = "config.toml";
        std::string input;                   // file path, "-" for stdin, or the date text
        bool json_output = false;
        bool verbose = false;
        bool no_convert = false;
        std::vector<std::string> dictionaries;
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

    // Returns false with a message on malformed arguments
    static bool parseCommandLineArgs(const std::vector<std::string>& args, Options& outOptions, std::string& outError);

    static void PrintUsage(const char* program_name);
    static void PrintVersion();

private:
    bool initialize();
    bool initializeLogging();
    void initializeConfig();
    bool setupConverter();

    int runPage();
    int runDate();
    int runReflow();
    int runCriteria();

    void reportPendingErrors();

    static bool readInput(const std::string& source, std::string& outText, std::string& outError);

    int argc_;
    char** argv_;
    Options options_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<PipelineSettings> settings_;
    std::unique_ptr<processing::IScriptConverter> converter_;
};
