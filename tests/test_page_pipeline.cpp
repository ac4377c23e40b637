#include <catch2/catch_test_macros.hpp>
#include "processing/DictionaryScriptConverter.hpp"
#include "processing/PagePipeline.hpp"
#include "utils/ErrorReporter.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

using namespace processing;
using json = nlohmann::json;

namespace
{

class ThrowingConverter : public IScriptConverter
{
public:
    std::string convert(const std::string&) const override { throw std::runtime_error("table corrupted"); }
    std::string name() const override { return "throwing"; }
};

json extraction()
{
    return json{ { "page_section_letter", "A" },
                 { "page_section_number", 1 },
                 { "page_section_title", "头版" },
                 { "published_date", "2023年05月10日" },
                 { "author", "记者" },
                 { "content", "今天天气\n很好。\n\n**标题**\n正文" },
                 { "tables", json::array({ { { "csv_string", "项目,数量" }, { "caption", "统计" } } }) },
                 { "images", json::array({ { { "description", "头版照片" }, { "caption", nullptr } } }) } };
}

const text_processing::StageOutcome* findStage(const text_processing::NormalizationReport& report,
                                               const std::string& name)
{
    for (const auto& stage : report.stages)
    {
        if (stage.stage_name == name)
            return &stage;
    }
    return nullptr;
}

} // namespace

TEST_CASE("PagePipeline - Without converter", "[pipeline]")
{
    utils::ErrorReporter::Clear();

    PagePipeline pipeline;
    record::NewspaperPage page;
    std::string error;
    text_processing::NormalizationReport report;

    REQUIRE(pipeline.process(extraction().dump(), page, error, &report));

    REQUIRE(std::get<CalendarDate>(page.published_date) == CalendarDate{ 2023, 5, 10 });
    REQUIRE(page.content == "今天天气很好。\n\n**标题**\n正文");
    REQUIRE(page.page_section_title == "头版");

    REQUIRE(report.date_parsed);
    REQUIRE(report.allStagesSucceeded());
    REQUIRE_FALSE(report.script_converter.has_value());
    REQUIRE(report.stages.size() == 3);

    const auto* conversion = findStage(report, "script_conversion");
    REQUIRE(conversion != nullptr);
    REQUIRE(conversion->skipped);

    REQUIRE_FALSE(utils::ErrorReporter::HasPending());
}

TEST_CASE("PagePipeline - Conversion covers every free-text field", "[pipeline]")
{
    DictionaryScriptConverter converter;
    std::string error;
    REQUIRE(converter.loadJson(R"({"头": "頭", "记": "記", "统计": "統計", "项": "項", "数": "數", "题": "題", "气": "氣"})",
                               "s2hk", error));

    PagePipeline pipeline(&converter);
    record::NewspaperPage page;
    text_processing::NormalizationReport report;
    REQUIRE(pipeline.process(extraction().dump(), page, error, &report));

    REQUIRE(page.page_section_title == "頭版");
    REQUIRE(page.author == "記者");
    REQUIRE(page.content == "今天天氣很好。\n\n**标題**\n正文");
    REQUIRE(page.tables[0].csv_string == "項目,數量");
    REQUIRE(page.tables[0].caption == "統計");
    REQUIRE(page.images[0].description == "頭版照片");
    REQUIRE_FALSE(page.images[0].caption.has_value());

    REQUIRE(report.script_converter == "dictionary(s2hk)");
}

TEST_CASE("PagePipeline - Conversion runs after reflow", "[pipeline]")
{
    // Maps the ideographic full stop away; reflow must already have used it
    DictionaryScriptConverter converter;
    std::string error;
    REQUIRE(converter.loadJson(R"({"。": "."})", "punct", error));

    PagePipeline pipeline(&converter);
    record::NewspaperPage page;
    REQUIRE(pipeline.process(extraction().dump(), page, error));
    REQUIRE(page.content == "今天天气很好.\n\n**标题**\n正文");
}

TEST_CASE("PagePipeline - Unparsed date is kept and reported", "[pipeline]")
{
    utils::ErrorReporter::Clear();

    json j = extraction();
    j["published_date"] = "上週三";

    PagePipeline pipeline;
    record::NewspaperPage page;
    std::string error;
    text_processing::NormalizationReport report;
    REQUIRE(pipeline.process(j.dump(), page, error, &report));

    REQUIRE(std::get<std::string>(page.published_date) == "上週三");
    REQUIRE_FALSE(report.date_parsed);
    REQUIRE(report.allStagesSucceeded());

    REQUIRE(utils::ErrorReporter::HasPending());
    auto last = utils::ErrorReporter::LastReport();
    REQUIRE(last.category == utils::ErrorCategory::Normalization);
    REQUIRE(last.details == "上週三");
    utils::ErrorReporter::Clear();
}

TEST_CASE("PagePipeline - Converter failure keeps the unconverted page", "[pipeline]")
{
    utils::ErrorReporter::Clear();

    ThrowingConverter converter;
    PagePipeline pipeline(&converter);
    record::NewspaperPage page;
    std::string error;
    text_processing::NormalizationReport report;
    REQUIRE(pipeline.process(extraction().dump(), page, error, &report));

    REQUIRE(page.page_section_title == "头版");
    REQUIRE(page.content == "今天天气很好。\n\n**标题**\n正文");
    REQUIRE_FALSE(report.allStagesSucceeded());
    REQUIRE_FALSE(report.script_converter.has_value());

    const auto* conversion = findStage(report, "script_conversion");
    REQUIRE(conversion != nullptr);
    REQUIRE_FALSE(conversion->succeeded);
    REQUIRE(conversion->error == "table corrupted");
    utils::ErrorReporter::Clear();
}

TEST_CASE("PagePipeline - Rejected extraction", "[pipeline]")
{
    utils::ErrorReporter::Clear();

    json j = extraction();
    j["page_section_letter"] = "Z";

    PagePipeline pipeline;
    record::NewspaperPage page;
    std::string error;
    REQUIRE_FALSE(pipeline.process(j.dump(), page, error));
    REQUIRE(error.find("page_section_letter") != std::string::npos);

    auto last = utils::ErrorReporter::LastReport();
    REQUIRE(last.category == utils::ErrorCategory::Extraction);
    utils::ErrorReporter::Clear();
}

TEST_CASE("PagePipeline - Normalizing an already normalized page", "[pipeline]")
{
    PagePipeline pipeline;
    record::NewspaperPage page;
    std::string error;
    REQUIRE(pipeline.process(extraction().dump(), page, error));

    record::NewspaperPage again = page;
    auto report = pipeline.normalize(again);
    REQUIRE(report.date_parsed);
    REQUIRE(again.content == page.content);
    REQUIRE(std::get<CalendarDate>(again.published_date) == std::get<CalendarDate>(page.published_date));
}
