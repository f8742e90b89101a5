#pragma once

#include <toml++/toml.h>

struct CleanupSettings;
struct LoggingSettings;

// TOML mapping for the settings tables. Missing keys keep their current value,
// keys of the wrong type are skipped with a warning.
class SettingsSerializer
{
public:
    static toml::table serializeCleanup(const CleanupSettings& settings);
    static void deserializeCleanup(const toml::table& section, CleanupSettings& settings);

    static toml::table serializeLogging(const LoggingSettings& settings);
    static void deserializeLogging(const toml::table& section, LoggingSettings& settings);
};
