#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns every plog appender in the process. Instance 0 is the main log,
// redaction::Diagnostics::kLogInstance the engine log and
// profiling::kProfilingLogInstance the scope timers.
class LogManager
{
public:
    // Defaults for every logger, taken from the [logging] table
    struct Settings
    {
        plog::Severity level = plog::info;
        bool append = true;
        std::string directory = "logs";
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath; // a bare file name is placed in Settings::directory
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const Settings& settings);

    // Explicitly instantiated in LogManager.cpp for the ids listed above
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static const std::string& GetLogDirectory();

    /// 0 (none) to 6 (verbose) as plog numbers them; anything else is nullopt.
    static std::optional<plog::Severity> SeverityFromInt(long long level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();
    static std::string ResolveLogPath(const std::string& filepath);

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::string s_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
