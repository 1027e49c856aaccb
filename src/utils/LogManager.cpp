#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../redaction/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_default_level = settings.level;
    s_append_logs = settings.append;
    s_directory = settings.directory.empty() ? std::string("logs") : settings.directory;

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    // plog loggers live for the whole process; a later registration only adjusts the level
    if (auto* existing = plog::get<InstanceId>())
    {
        existing->setMaxSeverity(config.level_override.value_or(s_default_level));
        PLOG_DEBUG_(InstanceId) << "Logger '" << config.name << "' already registered, keeping its appenders";
        return true;
    }

    const std::string path = ResolveLogPath(config.filepath);
    try
    {
        if (!config.append_override.value_or(s_append_logs))
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
        auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_default_level), file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   path + ": " + ex.what());
        return false;
    }

    PLOG_DEBUG_(InstanceId) << "Logger '" << config.name << "' writing to " << path;
    return true;
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<redaction::Diagnostics::kLogInstance>(const LoggerConfig&);

#if PIIGUARD_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

// Appenders are kept: plog never destroys its loggers, which still point at them
void LogManager::Shutdown() { s_initialized = false; }

bool LogManager::IsInitialized() { return s_initialized; }

const std::string& LogManager::GetLogDirectory() { return s_directory; }

std::optional<plog::Severity> LogManager::SeverityFromInt(long long level)
{
    if (level < 0 || level > 6)
        return std::nullopt;
    return static_cast<plog::Severity>(level);
}

std::string LogManager::ResolveLogPath(const std::string& filepath)
{
    std::filesystem::path path(filepath);
    if (path.is_absolute() || path.has_parent_path())
        return filepath;
    return (std::filesystem::path(s_directory) / path).string();
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     s_directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
