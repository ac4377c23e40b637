#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <toml++/toml.h>

class ConfigManager;

// Settings from the [pipeline], [conversion] and [criteria] tables
struct PipelineSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;

    bool conversion_enabled = true;
    std::vector<std::string> dictionaries;   // conversion tables, applied in order
    int flag_threshold = 5;                  // criteria scores below this flag their fields

    // Registers the three tables; values are written into this object on load()
    bool registerWith(ConfigManager& config);

    void loadPipelineTable(const toml::table& section);
    void loadConversionTable(const toml::table& section);
    void loadCriteriaTable(const toml::table& section);
};
