#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "redaction/Diagnostics.hpp"
#include "redaction/RedactionPipeline.hpp"
#include "redaction/TextUtils.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"
#include "vault/PIIVault.hpp"

#include <plog/Log.h>

#include <cstring>
#include <iostream>

namespace app
{

namespace
{

constexpr const char* kBlockTerminator = ".";
constexpr std::size_t kLogFileSize = 10 * 1024 * 1024;

} // namespace

Application::Application(int argc, char** argv)
    : Application(argc, argv, std::cin, std::cout)
{
}

Application::Application(int argc, char** argv, std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
    , argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ArgsResult::ExitSuccess:
        return 0;
    case ArgsResult::ExitFailure:
        printUsage();
        return 2;
    case ArgsResult::Continue:
        break;
    }

    if (!initialize())
    {
        flushErrors();
        return 1;
    }

    mainLoop();
    flushErrors();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    running_ = false;
}

bool Application::initialize()
{
    PROFILE_SCOPE_FUNCTION();

    initializeConfig();

    if (!initializeLogging())
        return false;

    PLOG_INFO << "piiguard starting (config: " << config_->path() << ")";

    redaction::Diagnostics::SetVerbose(settings_.redaction.verbose || verbose_override_);
    redaction::Diagnostics::SetMaxPreview(settings_.redaction.max_preview);

    return loadEntries();
}

Application::ArgsResult Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        bool has_value = i + 1 < argc_;

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0)
        {
            printUsage();
            return ArgsResult::ExitSuccess;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            verbose_override_ = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && has_value)
        {
            config_path_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--vault") == 0 && has_value)
        {
            vault_path_override_ = argv_[++i];
        }
        else if (std::strcmp(arg, "--entry") == 0 && has_value)
        {
            const char* spec = argv_[++i];
            auto entry = vault::PIIVault::parseEntrySpec(spec);
            if (!entry)
            {
                std::cerr << "Invalid --entry '" << spec << "' (expected category:value)\n";
                return ArgsResult::ExitFailure;
            }
            cli_entries_.push_back(std::move(*entry));
        }
        else
        {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return ArgsResult::ExitFailure;
        }
    }
    return ArgsResult::Continue;
}

void Application::printUsage() const
{
    out_ << "Usage: piiguard [options]\n"
         << "  --config <path>         TOML configuration file (default: config.toml)\n"
         << "  --vault <path>          JSON file of PII entries\n"
         << "  --entry <category:value>\n"
         << "                          Add a PII entry; categories: name, email, phone, ssn, address, custom\n"
         << "  --verbose               Log redaction diagnostics\n"
         << "  --help                  Show this message\n"
         << "\nText blocks end with a line containing only '.'. An empty input block exits.\n";
}

void Application::initializeConfig()
{
    PROFILE_SCOPE_FUNCTION();

    config_ = std::make_unique<ConfigManager>(config_path_);
    bindAppSettings(*config_, settings_);

    // A failed load leaves every table at its defaults; the parse error is already reported
    if (!config_->load())
        std::cerr << "Config error: " << config_->lastError() << "\n";
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const auto& logging = settings_.logging;
    if (!utils::LogManager::Initialize({ .level = logging.level,
                                         .append = logging.append,
                                         .directory = logging.directory }))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            logging.directory);
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = "run.log",
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = kLogFileSize,
                                           .backup_count = 3,
                                           .add_console_appender = logging.console });

    utils::LogManager::RegisterLogger<redaction::Diagnostics::kLogInstance>(
        { .name = "redaction",
          .filepath = "redaction.log",
          .append_override = std::nullopt,
          .level_override = std::nullopt,
          .max_file_size = kLogFileSize,
          .backup_count = 3,
          .add_console_appender = false });

#if PIIGUARD_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                          .filepath = "profiling.log",
                                                                          .append_override = std::nullopt,
                                                                          .level_override = std::nullopt,
                                                                          .max_file_size = kLogFileSize,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });
#endif

    return true;
}

bool Application::loadEntries()
{
    PROFILE_SCOPE_FUNCTION();

    vault_ = std::make_unique<vault::PIIVault>();

    const std::string& vault_path =
        vault_path_override_.empty() ? settings_.redaction.vault_path : vault_path_override_;
    if (!vault_path.empty() && !vault_->loadFromFile(vault_path))
    {
        // A configured vault that cannot be read stops startup
        PLOG_ERROR << "Unable to load PII vault: " << vault_path;
        return false;
    }

    for (const auto& entry : cli_entries_)
        vault_->add(entry.category, entry.value);

    PLOG_INFO << "Loaded " << vault_->size() << " PII entries";
    for (std::size_t i = 0; i < redaction::kPIICategoryCount; ++i)
    {
        auto category = static_cast<redaction::PIICategory>(i);
        if (auto count = vault_->countByCategory(category))
            PLOG_DEBUG << "  " << redaction::categoryToString(category) << ": " << count;
    }

    pipeline_ = std::make_unique<redaction::RedactionPipeline>(vault_->entries());
    return true;
}

void Application::mainLoop()
{
    PROFILE_SCOPE_FUNCTION();

    std::string input;
    std::string response;

    while (running_)
    {
        out_ << "Enter text to redact (end with '.'):\n" << std::flush;
        if (!readBlock(input) || redaction::trim(input).empty())
        {
            requestExit();
            break;
        }

        auto redacted = pipeline_->redactInput(input);
        out_ << "--- redacted ---\n" << redacted.text << "\n" << std::flush;
        flushErrors();
        if (!redacted.ok())
            continue;

        out_ << "Enter response to restore (end with '.'):\n" << std::flush;
        if (!readBlock(response))
        {
            requestExit();
            break;
        }

        auto restored = pipeline_->restoreResponse(response);
        out_ << "--- restored ---\n" << restored.text << "\n" << std::flush;
        flushErrors();
    }
}

bool Application::readBlock(std::string& block)
{
    block.clear();

    std::string line;
    bool read_any = false;
    while (std::getline(in_, line))
    {
        read_any = true;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line == kBlockTerminator)
            return true;

        if (!block.empty())
            block.push_back('\n');
        block += line;
    }
    return read_any;
}

void Application::flushErrors()
{
    if (!utils::ErrorReporter::HasPendingErrors())
        return;

    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
}

void Application::cleanup()
{
    if (pipeline_)
        pipeline_->resetSession();

    if (utils::LogManager::IsInitialized())
    {
        PLOG_INFO << "piiguard shutting down";
        utils::LogManager::Shutdown();
    }
}

} // namespace app
