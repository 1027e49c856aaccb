#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "config/AppSettings.hpp"
#include "redaction/PIITypes.hpp"

class ConfigManager;

namespace redaction
{
class RedactionPipeline;
}

namespace vault
{
class PIIVault;
}

namespace app
{

/**
 * @brief Interactive redact/restore loop.
 *
 * Reads a block of text from `in`, prints the redacted form, then reads the
 * response to restore and prints it. Blocks end at a line holding a single
 * "." or at end of input. An empty input block ends the loop.
 */
class Application
{
public:
    Application(int argc, char** argv);
    Application(int argc, char** argv, std::istream& in, std::ostream& out);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();
    void requestExit();

private:
    enum class ArgsResult
    {
        Continue,
        ExitSuccess,
        ExitFailure
    };

    bool initialize();
    ArgsResult parseCommandLineArgs();
    void printUsage() const;
    void initializeConfig();
    bool initializeLogging();
    bool loadEntries();

    void mainLoop();
    bool readBlock(std::string& block);
    void flushErrors();
    void cleanup();

    std::istream& in_;
    std::ostream& out_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<vault::PIIVault> vault_;
    std::unique_ptr<redaction::RedactionPipeline> pipeline_;
    AppSettings settings_;

    std::string config_path_ = "config.toml";
    std::string vault_path_override_;
    std::vector<redaction::PIIEntry> cli_entries_;
    bool verbose_override_ = false;

    bool running_ = true;

    int argc_ = 0;
    char** argv_ = nullptr;
};

} // namespace app
