#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace
{

// "a.b.c" -> {"a", "b", "c"}; nullopt when a segment is empty
std::optional<std::vector<std::string>> splitTablePath(const std::string& path)
{
    std::vector<std::string> segments;
    if (path.empty())
        return segments;

    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Empty segment in config table path '" << path << "'";
            return std::nullopt;
        }
        segments.push_back(segment);
    }
    if (path.back() == '.')
    {
        PLOG_WARNING << "Empty segment in config table path '" << path << "'";
        return std::nullopt;
    }
    return segments;
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        const auto& where = pe.source().begin;
        last_error_ = config_path_ + ":" + std::to_string(where.line) + ":" + std::to_string(where.column) + ": " +
                      std::string(pe.description());

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.", last_error_);
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return false;
    }

    dispatchLoad();
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

void ConfigManager::dispatchLoad()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(std::as_const(*root_), handler.path);
        handler.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::save()
{
    last_error_.clear();

    if (!root_)
        root_ = std::make_unique<toml::table>();

    // Keys no handler owns are written back as they were read; comments are not
    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
            target = &output;
        mergeHandlerTable(handler, handler.callbacks.save(), *target);
    }

    if (!writeAtomically(output))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        return false;
    }

    *root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

void ConfigManager::mergeHandlerTable(const HandlerEntry& handler, const toml::table& values, toml::table& target)
{
    for (const auto& key : handler.ownedKeys)
    {
        if (const toml::node* node = values.get(key))
            target.insert_or_assign(key, *node);
        else
            target.erase(key);
    }

    for (const auto& [key, value] : values)
    {
        (void)value;
        if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key.str()) == handler.ownedKeys.end())
            PLOG_WARNING << "[" << handler.path << "] handler produced unowned key '" << key.str() << "'; dropped";
    }
}

bool ConfigManager::writeAtomically(const toml::table& document)
{
    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "cannot create " + tmp;
            return false;
        }
        ofs << document << '\n';
        if (!ofs)
        {
            last_error_ = "cannot write " + tmp;
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "cannot replace " + config_path_ + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    const auto segments = splitTablePath(path);
    if (!segments)
        return nullptr;

    toml::table* current = &root;
    for (const auto& segment : *segments)
    {
        // insert() leaves an existing value in place
        auto it = current->insert(segment, toml::table{}).first;
        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Config key '" << segment << "' in '" << path << "' is not a table";
            return nullptr;
        }
    }
    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    const auto segments = splitTablePath(path);
    if (!segments)
        return nullptr;

    const toml::table* current = &root;
    for (const auto& segment : *segments)
    {
        const toml::node* node = current->get(segment);
        if (!node)
            return nullptr;
        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Config key '" << segment << "' in '" << path << "' is not a table";
            return nullptr;
        }
    }
    return current;
}
