#include <catch2/catch_test_macros.hpp>
#include "config/ConfigManager.hpp"
#include "config/PipelineSettings.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace
{

// Test fixture for a temporary config file
class TempConfig
{
public:
    explicit TempConfig(const std::string& content)
    {
        file_path_ = "test_temp_config.toml";
        std::ofstream file(file_path_);
        file << content;
        file.close();
    }

    ~TempConfig()
    {
        if (fs::exists(file_path_))
        {
            fs::remove(file_path_);
        }
    }

    const std::string& path() const { return file_path_; }

private:
    std::string file_path_;
};

} // namespace

TEST_CASE("ConfigManager - Missing file keeps defaults", "[config]")
{
    ConfigManager config("no_such_config.toml");
    PipelineSettings settings;
    REQUIRE(settings.registerWith(config));

    REQUIRE(config.load());
    REQUIRE_FALSE(settings.verbose);
    REQUIRE(settings.max_preview == 160);
    REQUIRE(settings.conversion_enabled);
    REQUIRE(settings.dictionaries.empty());
    REQUIRE(settings.flag_threshold == 5);
}

TEST_CASE("ConfigManager - Tables reach their handlers", "[config]")
{
    TempConfig file(R"(
[pipeline]
verbose = true
max_preview = 64

[conversion]
enabled = false
dictionaries = ["tables/s2t.json", "tables/t2hk.json", 3]

[criteria]
flag_threshold = 7
)");

    ConfigManager config(file.path());
    PipelineSettings settings;
    REQUIRE(settings.registerWith(config));
    REQUIRE(config.load());

    REQUIRE(settings.verbose);
    REQUIRE(settings.max_preview == 64);
    REQUIRE_FALSE(settings.conversion_enabled);
    REQUIRE(settings.dictionaries == std::vector<std::string>{ "tables/s2t.json", "tables/t2hk.json" });
    REQUIRE(settings.flag_threshold == 7);
}

TEST_CASE("ConfigManager - Out of range values are ignored", "[config]")
{
    TempConfig file(R"(
[pipeline]
max_preview = 0

[criteria]
flag_threshold = 42
)");

    ConfigManager config(file.path());
    PipelineSettings settings;
    REQUIRE(settings.registerWith(config));
    REQUIRE(config.load());

    REQUIRE(settings.max_preview == 160);
    REQUIRE(settings.flag_threshold == 5);
}

TEST_CASE("ConfigManager - Parse error falls back to defaults", "[config]")
{
    utils::ErrorReporter::Clear();
    TempConfig file("[pipeline\nverbose = true\n");

    ConfigManager config(file.path());
    PipelineSettings settings;
    settings.verbose = true;
    REQUIRE(settings.registerWith(config));

    REQUIRE_FALSE(config.load());
    REQUIRE(std::string(config.lastError()).find("parse error") != std::string::npos);
    REQUIRE(settings.verbose);

    auto last = utils::ErrorReporter::LastReport();
    REQUIRE(last.category == utils::ErrorCategory::Configuration);
    utils::ErrorReporter::Clear();
}

TEST_CASE("ConfigManager - Key ownership is exclusive", "[config]")
{
    ConfigManager config("unused.toml");
    TableCallbacks noop{ [](const toml::table&) {} };

    REQUIRE(config.registerTable("pipeline", noop, { "verbose" }));
    REQUIRE(config.registerTable("pipeline", noop, { "max_preview" }));
    REQUIRE_FALSE(config.registerTable("pipeline", noop, { "verbose" }));
    REQUIRE(config.registerTable("other", noop, { "verbose" }));
}
