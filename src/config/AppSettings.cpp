#include "AppSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>
#include <cstdint>

bool bindAppSettings(ConfigManager& config, AppSettings& settings)
{
    bool ok = config.registerTable(
        "logging",
        TableCallbacks{ [&settings](const toml::table& section) {
            AppSettings::Logging defaults;
            auto& logging = settings.logging;
            logging = defaults;

            if (auto level = section["level"].value<int64_t>())
            {
                if (auto severity = utils::LogManager::SeverityFromInt(*level))
                    logging.level = *severity;
                else
                    PLOG_WARNING << "[config] logging.level " << *level << " out of range (0-6), keeping default";
            }
            logging.append = section["append"].value_or(defaults.append);
            logging.console = section["console"].value_or(defaults.console);
            logging.directory = section["directory"].value_or(defaults.directory);
        } },
        { "level", "append", "console", "directory" });

    ok = config.registerTable(
             "redaction",
             TableCallbacks{ [&settings](const toml::table& section) {
                 AppSettings::Redaction defaults;
                 auto& redaction = settings.redaction;
                 redaction = defaults;

                 redaction.verbose = section["verbose"].value_or(defaults.verbose);
                 if (auto preview = section["max_preview"].value<int64_t>())
                 {
                     if (*preview > 0)
                         redaction.max_preview = static_cast<std::size_t>(*preview);
                     else
                         PLOG_WARNING << "[config] redaction.max_preview must be positive, keeping default";
                 }
                 redaction.vault_path = section["vault"].value_or(defaults.vault_path);
             } },
             { "verbose", "max_preview", "vault" }) &&
         ok;

    return ok;
}
