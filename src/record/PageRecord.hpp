#pragma once

#include "../processing/DateNormalizer.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace record
{

struct TableContent
{
    std::string csv_string;              // table body in CSV form
    std::optional<std::string> caption;
};

struct ImageContent
{
    std::string description;             // description of a single image in page context
    std::optional<std::string> caption;
};

// One extracted newspaper page. Images are a plain member of the aggregate.
struct NewspaperPage
{
    // Page metadata, usually printed in the top left corner
    char page_section_letter = 'A';      // 'A'..'E'
    int page_section_number = 0;         // 0..100
    std::string page_section_title;
    processing::DateValue published_date{ std::string() };
    std::optional<std::string> author;
    std::optional<std::string> photographer;

    // Body text; headings are marked with "**", paragraphs separated by blank lines
    std::string content;
    std::vector<TableContent> tables;
    std::vector<ImageContent> images;
};

constexpr char kMinSectionLetter = 'A';
constexpr char kMaxSectionLetter = 'E';
constexpr int kMinSectionNumber = 0;
constexpr int kMaxSectionNumber = 100;

// Block of "=====METADATA=====", "=====CONTENT=====", "=====TABLES=====" and
// "=====IMAGES=====" sections read by downstream scoring.
[[nodiscard]] std::string toText(const NewspaperPage& page);

// Same field names as the extraction input, plus "published_date_parsed".
[[nodiscard]] nlohmann::json toJson(const NewspaperPage& page);

} // namespace record
