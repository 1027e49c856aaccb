#pragma once

#include <string>
#include <functional>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

/**
 * @brief Loads config.toml and hands each registered table to its owner.
 *
 * Owners register a dotted table path ("logging", "redaction") and the keys
 * they read. A missing file counts as an empty one so every owner falls back
 * to its defaults.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool loadFromString(std::string_view toml_text);
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void dispatch();
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    bool reportParseError(const toml::parse_error& pe, const std::string& source);

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    toml::table root_;
};
