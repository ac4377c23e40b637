#include <catch2/catch_test_macros.hpp>
#include "record/Criteria.hpp"

#include <nlohmann/json.hpp>

using namespace record;
using json = nlohmann::json;

namespace
{

json perfectScores()
{
    json j = json::object();
    for (const auto& entry : scores(Criteria{}))
        j[entry.first] = kMaxScore;
    j["reasons"] = "";
    return j;
}

} // namespace

TEST_CASE("Criteria - Score table", "[criteria]")
{
    auto list = scores(Criteria{});
    REQUIRE(list.size() == 18);
    REQUIRE(list.front().first == "page_section_letter");
    REQUIRE(list.back().first == "images_no_extra");
}

TEST_CASE("Criteria - Parsing", "[criteria]")
{
    CriteriaParser parser;
    Criteria criteria;
    std::string error;

    SECTION("All scores present")
    {
        json j = perfectScores();
        j["text_content_flow"] = 3;
        j["reasons"] = "Sentences broken across lines";
        REQUIRE(parser.parse(j.dump(), criteria, error));
        REQUIRE(criteria.text_content_flow == 3);
        REQUIRE(criteria.images_no_extra == 10);
        REQUIRE(criteria.reasons == "Sentences broken across lines");
    }

    SECTION("Missing score")
    {
        json j = perfectScores();
        j.erase("tables_caption");
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
        REQUIRE(error.find("tables_caption") != std::string::npos);
    }

    SECTION("Out of range score")
    {
        json j = perfectScores();
        j["published_date"] = 11;
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
        j["published_date"] = -1;
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
    }

    SECTION("Non-integer score")
    {
        json j = perfectScores();
        j["published_date"] = "10";
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
        j["published_date"] = 9.5;
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
    }

    SECTION("Reasons must be a string")
    {
        json j = perfectScores();
        j.erase("reasons");
        REQUIRE_FALSE(parser.parseJson(j, criteria, error));
    }
}

TEST_CASE("Criteria - Field mapping", "[criteria]")
{
    REQUIRE(fieldsForCriterion("text_content_flow") == std::vector<std::string>{ "content" });
    REQUIRE(fieldsForCriterion("tables_csv_format") == std::vector<std::string>{ "tables" });
    REQUIRE(fieldsForCriterion("images_caption") == std::vector<std::string>{ "images" });
    REQUIRE(fieldsForCriterion("author") == std::vector<std::string>{ "author" });
    REQUIRE(fieldsForCriterion("unknown").empty());
}

TEST_CASE("Criteria - Flagged fields", "[criteria]")
{
    Criteria criteria;

    CriteriaParser parser;
    std::string error;
    json j = perfectScores();
    j["text_headers"] = 2;
    j["text_content_flow"] = 4;
    j["images_description"] = 5;
    j["published_date"] = 0;
    REQUIRE(parser.parseJson(j, criteria, error));

    auto flagged = flaggedFields(criteria, 5);
    REQUIRE(flagged == std::vector<std::string>{ "content", "published_date" });

    REQUIRE(flaggedFields(criteria, 6) == std::vector<std::string>{ "content", "images", "published_date" });
    REQUIRE(flaggedFields(criteria, 0).empty());
}
