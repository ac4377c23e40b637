#include "Criteria.hpp"

#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace record
{

namespace
{

// Binds each criterion name to its member so parsing and listing share one table
struct ScoreField
{
    const char* name;
    int Criteria::*member;
};

constexpr ScoreField kScoreFields[] = {
    { "page_section_letter", &Criteria::page_section_letter },
    { "page_section_number", &Criteria::page_section_number },
    { "page_section_title", &Criteria::page_section_title },
    { "published_date", &Criteria::published_date },
    { "text_headers", &Criteria::text_headers },
    { "text_content_completeness", &Criteria::text_content_completeness },
    { "text_content_accuracy", &Criteria::text_content_accuracy },
    { "text_content_flow", &Criteria::text_content_flow },
    { "text_formatting", &Criteria::text_formatting },
    { "tables_included", &Criteria::tables_included },
    { "tables_structure", &Criteria::tables_structure },
    { "tables_csv_format", &Criteria::tables_csv_format },
    { "tables_caption", &Criteria::tables_caption },
    { "tables_no_extra", &Criteria::tables_no_extra },
    { "images_included", &Criteria::images_included },
    { "images_caption", &Criteria::images_caption },
    { "images_description", &Criteria::images_description },
    { "images_no_extra", &Criteria::images_no_extra },
};

const std::map<std::string, std::vector<std::string>>& criterionFieldMap()
{
    static const std::map<std::string, std::vector<std::string>> map = {
        { "page_section_letter", { "page_section_letter" } },
        { "page_section_number", { "page_section_number" } },
        { "page_section_title", { "page_section_title" } },
        { "published_date", { "published_date" } },
        { "author", { "author" } },
        { "photographer", { "photographer" } },
        { "text_headers", { "content" } },
        { "text_content_completeness", { "content" } },
        { "text_content_accuracy", { "content" } },
        { "text_content_flow", { "content" } },
        { "text_formatting", { "content" } },
        { "tables_included", { "tables" } },
        { "tables_structure", { "tables" } },
        { "tables_csv_format", { "tables" } },
        { "tables_caption", { "tables" } },
        { "tables_no_extra", { "tables" } },
        { "images_included", { "images" } },
        { "images_caption", { "images" } },
        { "images_description", { "images" } },
        { "images_no_extra", { "images" } },
    };
    return map;
}

} // anonymous namespace

bool CriteriaParser::parse(const std::string& jsonContent, Criteria& outCriteria, std::string& outError)
{
    try
    {
        return parseJson(json::parse(jsonContent), outCriteria, outError);
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool CriteriaParser::parseFile(const std::string& filePath, Criteria& outCriteria, std::string& outError)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open criteria file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), outCriteria, outError);
}

bool CriteriaParser::parseJson(const json& criteriaJson, Criteria& outCriteria, std::string& outError)
{
    if (!criteriaJson.is_object())
    {
        outError = "Criteria must be a JSON object";
        return false;
    }

    Criteria criteria;
    for (const auto& field : kScoreFields)
    {
        auto it = criteriaJson.find(field.name);
        if (it == criteriaJson.end())
        {
            outError = std::string("Missing score '") + field.name + "'";
            return false;
        }
        if (!it->is_number_integer())
        {
            outError = std::string("Score '") + field.name + "' must be an integer";
            return false;
        }

        auto value = it->get<long long>();
        if (value < kMinScore || value > kMaxScore)
        {
            outError = std::string("Score '") + field.name + "' must be within 0..10 (got " + std::to_string(value) +
                       ")";
            return false;
        }
        criteria.*field.member = static_cast<int>(value);
    }

    auto reasons = criteriaJson.find("reasons");
    if (reasons == criteriaJson.end() || !reasons->is_string())
    {
        outError = "Field 'reasons' must be a string";
        return false;
    }
    criteria.reasons = reasons->get<std::string>();

    outCriteria = std::move(criteria);
    return true;
}

std::vector<std::pair<std::string, int>> scores(const Criteria& criteria)
{
    std::vector<std::pair<std::string, int>> result;
    result.reserve(std::size(kScoreFields));
    for (const auto& field : kScoreFields)
    {
        result.emplace_back(field.name, criteria.*field.member);
    }
    return result;
}

const std::vector<std::string>& fieldsForCriterion(const std::string& criterion)
{
    static const std::vector<std::string> kNone;
    const auto& map = criterionFieldMap();
    auto it = map.find(criterion);
    return it == map.end() ? kNone : it->second;
}

std::vector<std::string> flaggedFields(const Criteria& criteria, int threshold)
{
    std::set<std::string> fields;
    for (const auto& [name, score] : scores(criteria))
    {
        if (score >= threshold)
            continue;
        const auto& judged = fieldsForCriterion(name);
        fields.insert(judged.begin(), judged.end());
    }
    return { fields.begin(), fields.end() };
}

} // namespace record
