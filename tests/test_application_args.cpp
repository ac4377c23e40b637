#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"

namespace
{

bool parse(std::vector<std::string> args, Application::Options& options, std::string& error)
{
    return Application::parseCommandLineArgs(args, options, error);
}

} // namespace

TEST_CASE("Application - Page mode arguments", "[cli]")
{
    Application::Options options;
    std::string error;

    REQUIRE(parse({ "--json", "--config", "custom.toml", "--dictionary", "a.json", "--dictionary", "b.json",
                    "page.json" },
                  options, error));
    REQUIRE(options.mode == Application::Mode::Page);
    REQUIRE(options.json_output);
    REQUIRE(options.config_path == "custom.toml");
    REQUIRE(options.dictionaries == std::vector<std::string>{ "a.json", "b.json" });
    REQUIRE(options.input == "page.json");
    REQUIRE_FALSE(options.no_convert);
}

TEST_CASE("Application - Utility modes", "[cli]")
{
    Application::Options options;
    std::string error;

    REQUIRE(parse({ "--date", "2023/05/10" }, options, error));
    REQUIRE(options.mode == Application::Mode::Date);
    REQUIRE(options.input == "2023/05/10");

    REQUIRE(parse({ "--no-convert", "--reflow", "-" }, options, error));
    REQUIRE(options.mode == Application::Mode::Reflow);
    REQUIRE(options.no_convert);

    REQUIRE(parse({ "--criteria", "scores.json", "--json" }, options, error));
    REQUIRE(options.mode == Application::Mode::Criteria);

    REQUIRE(parse({ "--help", "--bogus" }, options, error));
    REQUIRE(options.mode == Application::Mode::Help);

    REQUIRE(parse({ "--version" }, options, error));
    REQUIRE(options.mode == Application::Mode::Version);
}

TEST_CASE("Application - Usage errors", "[cli]")
{
    Application::Options options;
    std::string error;

    REQUIRE_FALSE(parse({}, options, error));
    REQUIRE(error == "No extraction file given");

    REQUIRE_FALSE(parse({ "--config" }, options, error));
    REQUIRE(error == "--config requires a value");

    REQUIRE_FALSE(parse({ "--frobnicate", "page.json" }, options, error));
    REQUIRE(error == "Unknown option: --frobnicate");

    REQUIRE_FALSE(parse({ "one.json", "two.json" }, options, error));
    REQUIRE_FALSE(parse({ "--date", "2023/05/10", "--reflow", "x.txt" }, options, error));
    REQUIRE_FALSE(parse({ "page.json", "--date", "2023/05/10" }, options, error));
}
