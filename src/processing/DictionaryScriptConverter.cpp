#include "DictionaryScriptConverter.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace processing
{

bool DictionaryScriptConverter::loadFile(const std::string& file_path, std::string& outError)
{
    if (!fs::exists(file_path))
    {
        outError = "Conversion table not found: " + file_path;
        return false;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        outError = "Failed to open conversion table: " + file_path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return loadJson(buffer.str(), fs::path(file_path).stem().string(), outError);
}

bool DictionaryScriptConverter::loadJson(const std::string& json_text, const std::string& pass_name,
                                         std::string& outError)
{
    try
    {
        json j = json::parse(json_text);
        if (!j.is_object())
        {
            outError = "Invalid conversion table (expected object): " + pass_name;
            return false;
        }

        Pass pass;
        pass.name = pass_name;
        for (auto& [source, target] : j.items())
        {
            if (source.empty())
                continue;
            if (!target.is_string())
            {
                PLOG_WARNING_(Diagnostics::kLogInstance)
                    << "[DictionaryScriptConverter] Skipping non-string value for key: " << source;
                continue;
            }

            std::u32string key = utf8ToUtf32(source);
            pass.max_key_length = std::max(pass.max_key_length, key.size());
            pass.entries[std::move(key)] = utf8ToUtf32(target.get<std::string>());
        }

        PLOG_INFO_(Diagnostics::kLogInstance) << "[DictionaryScriptConverter] Loaded pass '" << pass.name
                                              << "': " << pass.entries.size() << " entries";
        passes_.push_back(std::move(pass));
        return true;
    }
    catch (const json::exception& e)
    {
        outError = "JSON parse error in " + pass_name + ": " + e.what();
        return false;
    }
}

std::string DictionaryScriptConverter::convert(const std::string& text) const
{
    if (text.empty() || passes_.empty())
        return text;

    std::u32string current = utf8ToUtf32(text);
    for (const auto& pass : passes_)
    {
        current = applyPass(pass, current);
    }
    return utf32ToUtf8(current);
}

std::u32string DictionaryScriptConverter::applyPass(const Pass& pass, const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t longest = std::min(pass.max_key_length, text.size() - pos);
        bool matched = false;
        for (std::size_t len = longest; len > 0; --len)
        {
            auto it = pass.entries.find(text.substr(pos, len));
            if (it != pass.entries.end())
            {
                out += it->second;
                pos += len;
                matched = true;
                break;
            }
        }

        if (!matched)
        {
            out.push_back(text[pos]);
            ++pos;
        }
    }

    return out;
}

std::string DictionaryScriptConverter::name() const
{
    if (passes_.empty())
        return "dictionary(empty)";

    std::string result = "dictionary(";
    for (std::size_t i = 0; i < passes_.size(); ++i)
    {
        if (i > 0)
            result += "+";
        result += passes_[i].name;
    }
    result += ")";
    return result;
}

std::size_t DictionaryScriptConverter::entryCount() const
{
    std::size_t total = 0;
    for (const auto& pass : passes_)
        total += pass.entries.size();
    return total;
}

} // namespace processing
