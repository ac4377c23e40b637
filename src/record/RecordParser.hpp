#pragma once

#include "PageRecord.hpp"

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace record
{

// Builds a NewspaperPage from the extraction step's JSON output and checks the
// field types and ranges. The published date is kept as the raw string; the
// page pipeline normalizes it.
class RecordParser
{
public:
    RecordParser() = default;
    ~RecordParser() = default;

    bool parse(const std::string& jsonContent, NewspaperPage& outPage, std::string& outError);

    bool parseFile(const std::string& filePath, NewspaperPage& outPage, std::string& outError);

    bool parseJson(const nlohmann::json& pageJson, NewspaperPage& outPage, std::string& outError);

    // Range checks on an already-built page
    static bool validate(const NewspaperPage& page, std::string& outError);
};

} // namespace record
