#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            for (const auto& key : ownedKeys)
            {
                for (const auto& existingKey : handler.ownedKeys)
                {
                    if (key == existingKey)
                    {
                        last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                        PLOG_ERROR << last_error_;
                        return false;
                    }
                }
            }
        }
    }

    handlers_.push_back({path, std::move(cb), std::move(ownedKeys)});
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        root_ = toml::table{};
        dispatch();
        return true;
    }

    try
    {
        root_ = toml::parse(ifs, config_path_);
        dispatch();
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        return reportParseError(pe, config_path_);
    }
}

bool ConfigManager::loadFromString(std::string_view toml_text)
{
    last_error_.clear();
    try
    {
        root_ = toml::parse(toml_text);
        dispatch();
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        return reportParseError(pe, "<string>");
    }
}

const toml::table& ConfigManager::root() const { return root_; }

void ConfigManager::dispatch()
{
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(root_, handler.path);
        if (section)
        {
            for (const auto& [key, value] : *section)
            {
                bool owned = false;
                for (const auto& ownedKey : handler.ownedKeys)
                {
                    if (key.str() == ownedKey)
                    {
                        owned = true;
                        break;
                    }
                }
                if (!owned)
                {
                    PLOG_WARNING << "Unknown key '" << key.str() << "' in [" << handler.path << "], ignoring";
                }
            }
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }
}

bool ConfigManager::reportParseError(const toml::parse_error& pe, const std::string& source)
{
    last_error_ = std::string("config parse error: ") + std::string(pe.description());
    PLOG_WARNING << last_error_;

    std::string error_details;
    if (pe.source().begin.line > 0)
    {
        error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
    }
    else
    {
        error_details = std::string(pe.description());
    }

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Configuration file has errors. Using defaults.",
                                        error_details + "\nFile: " + source);

    root_ = toml::table{};
    dispatch();
    return false;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        auto it = current->find(segment);
        if (it == current->end())
            return nullptr;

        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }

    return current;
}
