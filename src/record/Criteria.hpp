#pragma once

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace record
{

// Scores (0..10) a reviewer gives one extracted page, plus the reasons for
// any criterion that was not met.
struct Criteria
{
    // Page metadata
    int page_section_letter = 0;
    int page_section_number = 0;
    int page_section_title = 0;

    int published_date = 0;

    // Text content
    int text_headers = 0;
    int text_content_completeness = 0;
    int text_content_accuracy = 0;
    int text_content_flow = 0;
    int text_formatting = 0;

    // Tables
    int tables_included = 0;
    int tables_structure = 0;
    int tables_csv_format = 0;
    int tables_caption = 0;
    int tables_no_extra = 0;

    // Images
    int images_included = 0;
    int images_caption = 0;
    int images_description = 0;
    int images_no_extra = 0;

    std::string reasons;
};

constexpr int kMinScore = 0;
constexpr int kMaxScore = 10;

class CriteriaParser
{
public:
    bool parse(const std::string& jsonContent, Criteria& outCriteria, std::string& outError);
    bool parseFile(const std::string& filePath, Criteria& outCriteria, std::string& outError);
    bool parseJson(const nlohmann::json& criteriaJson, Criteria& outCriteria, std::string& outError);
};

// (criterion name, score) in declaration order
[[nodiscard]] std::vector<std::pair<std::string, int>> scores(const Criteria& criteria);

// Record fields judged by a criterion; empty for an unknown name.
// Also knows "author" and "photographer", which have no score in Criteria.
[[nodiscard]] const std::vector<std::string>& fieldsForCriterion(const std::string& criterion);

// Sorted, de-duplicated record fields judged by any criterion scoring below threshold
[[nodiscard]] std::vector<std::string> flaggedFields(const Criteria& criteria, int threshold);

} // namespace record
