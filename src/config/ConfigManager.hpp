#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns the TOML configuration file. Each subsystem registers the table it
// reads/writes; load() dispatches the parsed sections to the handlers and
// save() merges the handlers' tables back into the document.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file is not an error: every handler receives an empty table
    bool load();
    bool save();

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatchLoad();

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;

    void mergeHandlerTable(const HandlerEntry& handler, const toml::table& values, toml::table& target);
    bool writeAtomically(const toml::table& document);

    std::unique_ptr<toml::table> root_;
};
