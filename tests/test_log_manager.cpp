#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <string>

using namespace utils;

namespace fs = std::filesystem;

TEST_CASE("LogManager - severity levels from config integers", "[log_manager]")
{
    REQUIRE(LogManager::SeverityFromInt(0) == plog::none);
    REQUIRE(LogManager::SeverityFromInt(2) == plog::error);
    REQUIRE(LogManager::SeverityFromInt(6) == plog::verbose);

    REQUIRE_FALSE(LogManager::SeverityFromInt(-1).has_value());
    REQUIRE_FALSE(LogManager::SeverityFromInt(7).has_value());
}

TEST_CASE("LogManager - initialize creates the log directory", "[log_manager]")
{
    LogManager::Shutdown();

    const fs::path dir = fs::temp_directory_path() / "piiguard_test_logs" / "nested";
    fs::remove_all(dir.parent_path());

    REQUIRE(LogManager::Initialize({ .level = plog::debug, .append = false, .directory = dir.string() }));
    REQUIRE(LogManager::IsInitialized());
    REQUIRE(LogManager::GetLogDirectory() == dir.string());
    REQUIRE(fs::is_directory(dir));

    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());
    fs::remove_all(dir.parent_path());
}

TEST_CASE("LogManager - empty directory falls back to logs", "[log_manager]")
{
    LogManager::Shutdown();

    const fs::path previous = fs::current_path();
    const fs::path scratch = fs::temp_directory_path() / "piiguard_test_cwd";
    fs::create_directories(scratch);
    fs::current_path(scratch);

    REQUIRE(LogManager::Initialize({ .level = plog::info, .append = true, .directory = "" }));
    REQUIRE(LogManager::GetLogDirectory() == "logs");
    REQUIRE(fs::is_directory(scratch / "logs"));

    LogManager::Shutdown();
    fs::current_path(previous);
    fs::remove_all(scratch);
}

TEST_CASE("LogManager - registering before initialize is refused", "[log_manager]")
{
    LogManager::Shutdown();
    ErrorReporter::ClearErrors();

    REQUIRE_FALSE(LogManager::RegisterLogger<0>({ .name = "main", .filepath = "run.log" }));

    auto last = ErrorReporter::GetLastError();
    REQUIRE(last.category == ErrorCategory::Initialization);
    REQUIRE(last.technical_details == "main");
    ErrorReporter::ClearErrors();
}
