#pragma once

#include "IScriptConverter.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace processing
{

/**
 * @brief Longest-match converter driven by JSON mapping tables.
 *
 * Each table is one pass: a JSON object mapping source phrases (or single
 * characters) to their replacement. Within a pass the text is scanned left to
 * right and the longest key starting at the current position wins; text with
 * no match is copied one code point at a time. Passes run in load order, so a
 * chain like s2t.json then t2hk.json behaves like the combined conversion.
 *
 * Loading is not thread-safe; convert() is const and may run concurrently
 * once loading is done.
 */
class DictionaryScriptConverter : public IScriptConverter
{
public:
    DictionaryScriptConverter() = default;
    ~DictionaryScriptConverter() override = default;

    DictionaryScriptConverter(const DictionaryScriptConverter&) = delete;
    DictionaryScriptConverter& operator=(const DictionaryScriptConverter&) = delete;

    // Appends a pass read from file. On failure nothing is appended.
    bool loadFile(const std::string& file_path, std::string& outError);

    // Appends a pass parsed from a JSON string.
    bool loadJson(const std::string& json_text, const std::string& pass_name, std::string& outError);

    [[nodiscard]] std::string convert(const std::string& text) const override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::size_t passCount() const { return passes_.size(); }
    [[nodiscard]] std::size_t entryCount() const;

private:
    struct Pass
    {
        std::string name;
        std::unordered_map<std::u32string, std::u32string> entries;
        std::size_t max_key_length = 0;
    };

    static std::u32string applyPass(const Pass& pass, const std::u32string& text);

    std::vector<Pass> passes_;
};

} // namespace processing
