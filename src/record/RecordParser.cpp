#include "RecordParser.hpp"
#include "../processing/TextUtils.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace record
{

namespace
{

bool readRequiredString(const json& obj, const char* key, std::string& out, std::string& outError)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
    {
        outError = std::string("Missing required field '") + key + "'";
        return false;
    }
    if (!it->is_string())
    {
        outError = std::string("Field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Absent and null both mean "not given"
bool readOptionalString(const json& obj, const char* key, std::optional<std::string>& out, std::string& outError)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
    {
        out.reset();
        return true;
    }
    if (!it->is_string())
    {
        outError = std::string("Field '") + key + "' must be a string or null";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Integer, integral float, or a string holding an integer
std::optional<int> readLaxInteger(const json& value)
{
    if (value.is_number_unsigned())
    {
        auto v = value.get<unsigned long long>();
        if (v > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_integer())
    {
        auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_float())
    {
        double v = value.get<double>();
        if (!std::isfinite(v) || std::floor(v) != v || std::fabs(v) > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_string())
        return processing::parseInteger(value.get<std::string>());
    return std::nullopt;
}

template<typename Item, typename Fn>
bool readObjectArray(const json& obj, const char* key, std::vector<Item>& out, std::string& outError, Fn&& readItem)
{
    out.clear();
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return true;
    if (!it->is_array())
    {
        outError = std::string("Field '") + key + "' must be an array";
        return false;
    }

    std::size_t index = 0;
    for (const auto& entry : *it)
    {
        if (!entry.is_object())
        {
            outError = std::string(key) + "[" + std::to_string(index) + "] must be an object";
            return false;
        }
        Item item;
        std::string itemError;
        if (!readItem(entry, item, itemError))
        {
            outError = std::string(key) + "[" + std::to_string(index) + "]: " + itemError;
            return false;
        }
        out.push_back(std::move(item));
        ++index;
    }
    return true;
}

} // anonymous namespace

bool RecordParser::parse(const std::string& jsonContent, NewspaperPage& outPage, std::string& outError)
{
    try
    {
        json pageJson = json::parse(jsonContent);
        return parseJson(pageJson, outPage, outError);
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool RecordParser::parseFile(const std::string& filePath, NewspaperPage& outPage, std::string& outError)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open extraction file: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), outPage, outError);
}

bool RecordParser::parseJson(const json& pageJson, NewspaperPage& outPage, std::string& outError)
{
    if (!pageJson.is_object())
    {
        outError = "Extraction must be a JSON object";
        return false;
    }

    NewspaperPage page;

    std::string letter;
    if (!readRequiredString(pageJson, "page_section_letter", letter, outError))
        return false;
    if (letter.size() != 1)
    {
        outError = "Field 'page_section_letter' must be one of A, B, C, D, E (got '" + letter + "')";
        return false;
    }
    page.page_section_letter = letter[0];

    auto number_it = pageJson.find("page_section_number");
    if (number_it == pageJson.end() || number_it->is_null())
    {
        outError = "Missing required field 'page_section_number'";
        return false;
    }
    auto number = readLaxInteger(*number_it);
    if (!number)
    {
        outError = "Field 'page_section_number' must be an integer";
        return false;
    }
    page.page_section_number = *number;

    if (!readRequiredString(pageJson, "page_section_title", page.page_section_title, outError))
        return false;

    std::string published;
    if (!readRequiredString(pageJson, "published_date", published, outError))
        return false;
    page.published_date = published;

    if (!readOptionalString(pageJson, "author", page.author, outError))
        return false;
    if (!readOptionalString(pageJson, "photographer", page.photographer, outError))
        return false;
    if (!readRequiredString(pageJson, "content", page.content, outError))
        return false;

    bool ok = readObjectArray(pageJson, "tables", page.tables, outError,
                              [](const json& entry, TableContent& table, std::string& err)
                              {
                                  return readRequiredString(entry, "csv_string", table.csv_string, err) &&
                                         readOptionalString(entry, "caption", table.caption, err);
                              });
    if (!ok)
        return false;

    ok = readObjectArray(pageJson, "images", page.images, outError,
                         [](const json& entry, ImageContent& image, std::string& err)
                         {
                             return readRequiredString(entry, "description", image.description, err) &&
                                    readOptionalString(entry, "caption", image.caption, err);
                         });
    if (!ok)
        return false;

    if (!validate(page, outError))
        return false;

    outPage = std::move(page);
    PLOG_DEBUG << "Extraction parsed: section " << outPage.page_section_letter << outPage.page_section_number
               << ", " << outPage.tables.size() << " tables, " << outPage.images.size() << " images";
    return true;
}

bool RecordParser::validate(const NewspaperPage& page, std::string& outError)
{
    if (page.page_section_letter < kMinSectionLetter || page.page_section_letter > kMaxSectionLetter)
    {
        outError = std::string("Field 'page_section_letter' must be one of A, B, C, D, E (got '") +
                   page.page_section_letter + "')";
        return false;
    }

    if (page.page_section_number < kMinSectionNumber || page.page_section_number > kMaxSectionNumber)
    {
        outError = "Field 'page_section_number' must be within " + std::to_string(kMinSectionNumber) + ".." +
                   std::to_string(kMaxSectionNumber) + " (got " + std::to_string(page.page_section_number) + ")";
        return false;
    }

    return true;
}

} // namespace record
