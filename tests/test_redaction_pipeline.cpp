#include <catch2/catch_test_macros.hpp>
#include "redaction/RedactionPipeline.hpp"
#include "redaction/RedactionSession.hpp"
#include "utils/ErrorReporter.hpp"
#include <string>
#include <vector>

using namespace redaction;

TEST_CASE("RedactionPipeline - refuses to redact without entries", "[pipeline]")
{
    RedactionPipeline pipeline;

    auto outcome = pipeline.redactInput("My name is John");
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.error == RedactionError::Unconfigured);
    REQUIRE(outcome.text == std::string(kNoEntriesWarning));
    REQUIRE_FALSE(pipeline.hasActiveSession());

    SECTION("empty input is not an error")
    {
        auto empty = pipeline.redactInput("");
        REQUIRE(empty.ok());
        REQUIRE(empty.text.empty());
    }

    SECTION("entries that prepare to nothing still count as unconfigured")
    {
        pipeline.setEntries({ { PIICategory::Name, "J" } });
        REQUIRE(pipeline.redactInput("J").error == RedactionError::Unconfigured);
    }
}

TEST_CASE("RedactionPipeline - refuses to restore without a session", "[pipeline]")
{
    RedactionPipeline pipeline(std::vector<PIIEntry>{ { PIICategory::Name, "John" } });

    auto outcome = pipeline.restoreResponse("Alice Anderson says hi");
    REQUIRE(outcome.error == RedactionError::NoActiveSession);
    REQUIRE(outcome.text == std::string(kNoSessionWarning));

    auto blank = pipeline.restoreResponse("  \n ");
    REQUIRE(blank.ok());
    REQUIRE(blank.text.empty());
}

TEST_CASE("RedactionPipeline - full round trip", "[pipeline]")
{
    RedactionPipeline pipeline(
        std::vector<PIIEntry>{ { PIICategory::Name, "John Smith" }, { PIICategory::Phone, "555-123-4567" } });
    pipeline.setSessionSeed(42);

    auto redacted = pipeline.redactInput("Call John Smith at 555-123-4567.");
    REQUIRE(redacted.ok());
    REQUIRE(redacted.text == "Call Alice Anderson at 555-0100.");
    REQUIRE(pipeline.hasActiveSession());
    REQUIRE(pipeline.session()->size() == 2);

    auto restored = pipeline.restoreResponse("I called Alice Anderson on 555-0100 yesterday.");
    REQUIRE(restored.ok());
    REQUIRE(restored.text == "I called John Smith on 555-123-4567 yesterday.");

    SECTION("restoring does not consume the session")
    {
        REQUIRE(pipeline.restoreResponse("Alice Anderson").text == "John Smith");
        REQUIRE(pipeline.hasActiveSession());
    }
}

TEST_CASE("RedactionPipeline - each input starts a fresh session", "[pipeline]")
{
    RedactionPipeline pipeline(std::vector<PIIEntry>{ { PIICategory::Name, "John" }, { PIICategory::Name, "Mary" } });
    pipeline.setSessionSeed(42);

    REQUIRE(pipeline.redactInput("John").text == "Alice Anderson");
    REQUIRE(pipeline.redactInput("Mary").text == "Alice Anderson");
    REQUIRE(pipeline.restoreResponse("Alice Anderson").text == "Mary");

    SECTION("text without PII leaves an empty session")
    {
        REQUIRE(pipeline.redactInput("no names here").text == "no names here");
        REQUIRE(pipeline.hasActiveSession());
        REQUIRE(pipeline.session()->empty());
        REQUIRE(pipeline.restoreResponse("Alice Anderson").text == "Alice Anderson");
    }

    SECTION("blank input drops the previous session")
    {
        auto blank = pipeline.redactInput("   ");
        REQUIRE(blank.ok());
        REQUIRE(blank.text.empty());
        REQUIRE_FALSE(pipeline.hasActiveSession());
        REQUIRE(pipeline.restoreResponse("Alice Anderson").error == RedactionError::NoActiveSession);
    }
}

TEST_CASE("RedactionPipeline - changing entries drops the session", "[pipeline]")
{
    RedactionPipeline pipeline(std::vector<PIIEntry>{ { PIICategory::Name, "John" } });
    REQUIRE(pipeline.redactInput("John").ok());
    REQUIRE(pipeline.hasActiveSession());

    pipeline.setEntries({ { PIICategory::Email, "jane.doe@acme.com" } });
    REQUIRE_FALSE(pipeline.hasActiveSession());
    REQUIRE(pipeline.entries().size() == 1);
    REQUIRE(pipeline.preparedEntries().size() == 3);

    pipeline.resetSession();
    REQUIRE(pipeline.session() == nullptr);
}

TEST_CASE("RedactionPipeline - warnings never carry input text", "[pipeline]")
{
    utils::ErrorReporter::ClearErrors();
    RedactionPipeline pipeline;

    auto outcome = pipeline.redactInput("SSN 123-45-6789");
    REQUIRE(outcome.text.find("123-45-6789") == std::string::npos);
    REQUIRE(outcome.text.rfind("⚠️ ERROR:", 0) == 0);
}

TEST_CASE("RedactionOutcome - error names", "[pipeline]")
{
    REQUIRE(errorToString(RedactionError::Unconfigured) == "Unconfigured");
    REQUIRE(errorToString(RedactionError::NoActiveSession) == "NoActiveSession");
    REQUIRE(errorToString(RedactionError::StageFailed) == "StageFailed");
}
