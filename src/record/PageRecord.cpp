#include "PageRecord.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace record
{

namespace
{

std::string orEmpty(const std::optional<std::string>& value)
{
    return value.value_or(std::string());
}

json optionalToJson(const std::optional<std::string>& value)
{
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

std::string toText(const NewspaperPage& page)
{
    std::ostringstream out;
    out << "=====METADATA=====\n"
        << "Page Section Letter: " << page.page_section_letter << '\n'
        << "Page Section Number: " << page.page_section_number << '\n'
        << "Page Section Title: " << page.page_section_title << '\n'
        << "Published Date: " << processing::toString(page.published_date) << '\n'
        << "Author: " << orEmpty(page.author) << '\n'
        << "Photographer: " << orEmpty(page.photographer) << '\n'
        << '\n'
        << "=====CONTENT=====\n"
        << "Content: " << page.content << '\n';

    out << '\n' << "=====TABLES=====";
    for (std::size_t i = 0; i < page.tables.size(); ++i)
    {
        const auto& table = page.tables[i];
        out << '\n' << "Table " << i + 1 << " Content:\n" << table.csv_string;
        out << '\n' << "Table " << i + 1 << " Caption: " << orEmpty(table.caption);
    }

    out << "\n\n" << "=====IMAGES=====";
    for (std::size_t i = 0; i < page.images.size(); ++i)
    {
        const auto& image = page.images[i];
        out << '\n' << "Image " << i + 1 << " Description: " << image.description;
        out << '\n' << "Image " << i + 1 << " Caption: " << orEmpty(image.caption);
    }

    return out.str();
}

json toJson(const NewspaperPage& page)
{
    json j;
    j["page_section_letter"] = std::string(1, page.page_section_letter);
    j["page_section_number"] = page.page_section_number;
    j["page_section_title"] = page.page_section_title;
    j["published_date"] = processing::toString(page.published_date);
    j["published_date_parsed"] = processing::isCalendarDate(page.published_date);
    j["author"] = optionalToJson(page.author);
    j["photographer"] = optionalToJson(page.photographer);
    j["content"] = page.content;

    j["tables"] = json::array();
    for (const auto& table : page.tables)
    {
        j["tables"].push_back({ { "csv_string", table.csv_string }, { "caption", optionalToJson(table.caption) } });
    }

    j["images"] = json::array();
    for (const auto& image : page.images)
    {
        j["images"].push_back(
            { { "description", image.description }, { "caption", optionalToJson(image.caption) } });
    }

    return j;
}

} // namespace record
