#pragma once

#include <cstddef>
#include <string>

#include <plog/Severity.h>

class ConfigManager;

// Values read from config.toml; every field has a usable default
struct AppSettings
{
    struct Logging
    {
        plog::Severity level = plog::info;
        bool append = true;
        bool console = false;
        std::string directory = "logs";
    } logging;

    struct Redaction
    {
        bool verbose = false;
        std::size_t max_preview = 160;
        std::string vault_path;
    } redaction;
};

/// Registers the [logging] and [redaction] tables so ConfigManager::load() fills `settings`.
bool bindAppSettings(ConfigManager& config, AppSettings& settings);
