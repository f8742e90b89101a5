#include "SettingsSerializer.hpp"
#include "CleanupSettings.hpp"

#include "../utils/ErrorReporter.hpp"

#include <string>

namespace
{

void readBool(const toml::table& section, const char* key, bool& target)
{
    const auto* node = section.get(key);
    if (!node)
        return;
    if (auto v = node->value<bool>())
        target = *v;
    else
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Config key '") + key + "' must be a boolean",
                                            std::string("keeping ") + (target ? "true" : "false"));
}

} // namespace

toml::table SettingsSerializer::serializeCleanup(const CleanupSettings& settings)
{
    toml::array patterns;
    for (const auto& pattern : settings.remove_patterns)
        patterns.push_back(pattern);

    toml::table t;
    t.insert("enabled", settings.enabled);
    t.insert("remove_patterns", std::move(patterns));
    t.insert("auto_remove_domain_headings", settings.auto_remove_domain_headings);
    t.insert("combine_numbered_headings", settings.combine_numbered_headings);
    t.insert("reflow_paragraphs", settings.reflow_paragraphs);
    return t;
}

void SettingsSerializer::deserializeCleanup(const toml::table& section, CleanupSettings& settings)
{
    readBool(section, "enabled", settings.enabled);
    readBool(section, "auto_remove_domain_headings", settings.auto_remove_domain_headings);
    readBool(section, "combine_numbered_headings", settings.combine_numbered_headings);
    readBool(section, "reflow_paragraphs", settings.reflow_paragraphs);

    if (const auto* patterns = section["remove_patterns"].as_array())
    {
        settings.remove_patterns.clear();
        for (const auto& node : *patterns)
        {
            if (auto v = node.value<std::string>())
                settings.remove_patterns.push_back(*v);
            else
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                    "Ignoring non-string entry in markdown_cleanup.remove_patterns");
        }
    }
}

toml::table SettingsSerializer::serializeLogging(const LoggingSettings& settings)
{
    toml::table t;
    t.insert("level", settings.level);
    t.insert("file", settings.file);
    t.insert("append", settings.append);
    t.insert("verbose", settings.verbose);
    return t;
}

void SettingsSerializer::deserializeLogging(const toml::table& section, LoggingSettings& settings)
{
    if (auto v = section["level"].value<int64_t>())
    {
        if (*v >= 0 && *v <= 6)
            settings.level = static_cast<int>(*v);
        else
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "logging.level out of range (0-6)",
                                                std::to_string(*v));
    }
    if (auto v = section["file"].value<std::string>())
        settings.file = *v;
    readBool(section, "append", settings.append);
    readBool(section, "verbose", settings.verbose);
}
