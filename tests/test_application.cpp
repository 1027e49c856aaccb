#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{

// Scratch directory holding a config.toml that keeps logs inside it
class TempWorkspace
{
public:
    explicit TempWorkspace(const std::string& name)
    {
        dir_ = fs::temp_directory_path() / ("piiguard_app_" + name);
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        std::ofstream config(configPath());
        config << "[logging]\n"
               << "directory = \"" << (dir_ / "logs").generic_string() << "\"\n"
               << "console = false\n";
    }

    ~TempWorkspace()
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string configPath() const { return (dir_ / "config.toml").string(); }
    std::string path(const std::string& file) const { return (dir_ / file).string(); }

private:
    fs::path dir_;
};

// argv storage for Application's (argc, argv) constructor
class Args
{
public:
    explicit Args(std::vector<std::string> args)
        : storage_(std::move(args))
    {
        storage_.insert(storage_.begin(), "piiguard");
        for (auto& arg : storage_)
            pointers_.push_back(arg.data());
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class CerrCapture
{
public:
    CerrCapture()
        : previous_(std::cerr.rdbuf(buffer_.rdbuf()))
    {
    }

    ~CerrCapture() { std::cerr.rdbuf(previous_); }

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

int runApp(Args& args, const std::string& input, std::string& output)
{
    std::istringstream in(input);
    std::ostringstream out;
    int code = app::Application(args.argc(), args.argv(), in, out).run();
    output = out.str();
    return code;
}

} // namespace

TEST_CASE("Application - redacts a block and restores the response", "[application]")
{
    utils::ErrorReporter::ClearErrors();
    TempWorkspace workspace("round_trip");
    Args args({ "--config", workspace.configPath(), "--entry", "name:John Smith", "--entry", "email:john@acme.com" });

    const std::string input = "John Smith wrote to john@acme.com.\r\n"
                              ".\r\n"
                              "Thanks Alice Anderson, I'll email alice0@example.com.\n"
                              ".\n";

    std::string output;
    REQUIRE(runApp(args, input, output) == 0);

    REQUIRE(output.find("--- redacted ---\nAlice Anderson wrote to alice0@example.com.\n") != std::string::npos);
    REQUIRE(output.find("--- restored ---\nThanks John Smith, I'll email john@acme.com.\n") != std::string::npos);

    auto redacted_section = output.substr(0, output.find("--- restored ---"));
    REQUIRE(redacted_section.find("John Smith wrote") == std::string::npos);
}

TEST_CASE("Application - an empty block ends the loop", "[application]")
{
    TempWorkspace workspace("empty_block");
    Args args({ "--config", workspace.configPath(), "--entry", "name:John" });

    std::string output;
    REQUIRE(runApp(args, "\n.\nJohn\n.\n", output) == 0);

    REQUIRE(output.find("--- redacted ---") == std::string::npos);
    REQUIRE(output.find("Enter response") == std::string::npos);
}

TEST_CASE("Application - without entries the warning is printed instead of the text", "[application]")
{
    TempWorkspace workspace("no_entries");
    Args args({ "--config", workspace.configPath() });

    CerrCapture err;
    std::string output;
    REQUIRE(runApp(args, "call John\n.\n", output) == 0);

    REQUIRE(output.find("--- redacted ---\n\xE2\x9A\xA0\xEF\xB8\x8F ERROR: No PII entries.") != std::string::npos);
    REQUIRE(output.find("call John") == std::string::npos);
    REQUIRE(output.find("Enter response") == std::string::npos);
}

TEST_CASE("Application - bad arguments print usage and exit with 2", "[application]")
{
    std::string output;

    SECTION("unknown option")
    {
        Args args({ "--frobnicate" });
        CerrCapture err;
        REQUIRE(runApp(args, "", output) == 2);
        REQUIRE(err.str().find("--frobnicate") != std::string::npos);
    }

    SECTION("entry without a category")
    {
        Args args({ "--entry", "John" });
        CerrCapture err;
        REQUIRE(runApp(args, "", output) == 2);
        REQUIRE(err.str().find("Invalid --entry 'John'") != std::string::npos);
    }

    SECTION("option missing its value")
    {
        Args args({ "--vault" });
        CerrCapture err;
        REQUIRE(runApp(args, "", output) == 2);
    }

    REQUIRE(output.find("Usage: piiguard") != std::string::npos);
}

TEST_CASE("Application - help exits with 0", "[application]")
{
    Args args({ "--help" });
    std::string output;
    REQUIRE(runApp(args, "", output) == 0);
    REQUIRE(output.find("Usage: piiguard") != std::string::npos);
}

TEST_CASE("Application - an unreadable vault stops startup with 1", "[application]")
{
    utils::ErrorReporter::ClearErrors();
    TempWorkspace workspace("missing_vault");
    Args args({ "--config", workspace.configPath(), "--vault", workspace.path("absent.json"), "--entry",
                "name:John" });

    CerrCapture err;
    std::string output;
    REQUIRE(runApp(args, "John\n.\n", output) == 1);

    REQUIRE(output.find("--- redacted ---") == std::string::npos);
    REQUIRE(err.str().find("[Error] Vault: PII vault file not found") != std::string::npos);
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("Application - entries load from a vault file", "[application]")
{
    TempWorkspace workspace("vault_file");
    {
        std::ofstream vault(workspace.path("vault.json"));
        vault << R"([{ "category": "phone", "value": "555-123-4567" }])";
    }
    Args args({ "--config", workspace.configPath(), "--vault", workspace.path("vault.json") });

    std::string output;
    REQUIRE(runApp(args, "ring 555 123 4567\n.\nok\n.\n", output) == 0);
    REQUIRE(output.find("--- redacted ---\nring 555-0100\n") != std::string::npos);
}
