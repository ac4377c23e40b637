#include "PipelineSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

bool PipelineSettings::registerWith(ConfigManager& config)
{
    bool ok = config.registerTable("pipeline",
                                   { [this](const toml::table& section) { loadPipelineTable(section); } },
                                   { "verbose", "max_preview" });
    ok = config.registerTable("conversion",
                              { [this](const toml::table& section) { loadConversionTable(section); } },
                              { "enabled", "dictionaries" }) && ok;
    ok = config.registerTable("criteria",
                              { [this](const toml::table& section) { loadCriteriaTable(section); } },
                              { "flag_threshold" }) && ok;
    return ok;
}

void PipelineSettings::loadPipelineTable(const toml::table& section)
{
    verbose = section["verbose"].value_or(verbose);

    if (auto preview = section["max_preview"].value<int64_t>())
    {
        if (*preview > 0)
            max_preview = static_cast<std::size_t>(*preview);
        else
            PLOG_WARNING << "pipeline.max_preview must be positive, keeping " << max_preview;
    }
}

void PipelineSettings::loadConversionTable(const toml::table& section)
{
    conversion_enabled = section["enabled"].value_or(conversion_enabled);

    if (auto* list = section["dictionaries"].as_array())
    {
        dictionaries.clear();
        for (const auto& entry : *list)
        {
            if (auto path = entry.value<std::string>())
                dictionaries.push_back(*path);
            else
                PLOG_WARNING << "Ignoring non-string entry in conversion.dictionaries";
        }
    }
}

void PipelineSettings::loadCriteriaTable(const toml::table& section)
{
    if (auto threshold = section["flag_threshold"].value<int64_t>())
    {
        if (*threshold >= 0 && *threshold <= 11)
            flag_threshold = static_cast<int>(*threshold);
        else
            PLOG_WARNING << "criteria.flag_threshold out of range 0..11, keeping " << flag_threshold;
    }
}
