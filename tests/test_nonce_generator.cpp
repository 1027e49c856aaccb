#include <catch2/catch_test_macros.hpp>
#include "redaction/NonceGenerator.hpp"
#include "redaction/RedactionSession.hpp"
#include <regex>
#include <set>
#include <string>

using namespace redaction;

TEST_CASE("NonceGenerator - names pair a first and last name from the pools", "[nonce_generator]")
{
    RedactionSession session(42);

    REQUIRE(generateNonce(PIICategory::Name, session) == "Alice Anderson");
    REQUIRE(generateNonce(PIICategory::Name, session) == "Bob Anderson");

    for (int i = 2; i < 10; ++i)
        (void)generateNonce(PIICategory::Name, session);

    REQUIRE(generateNonce(PIICategory::Name, session) == "Alice Brown");
}

TEST_CASE("NonceGenerator - emails use reserved example domains", "[nonce_generator]")
{
    RedactionSession session(42);

    REQUIRE(generateNonce(PIICategory::Email, session) == "alice0@example.com");
    REQUIRE(generateNonce(PIICategory::Email, session) == "bob1@test.org");
    REQUIRE(generateNonce(PIICategory::Email, session) == "carol2@sample.net");
    REQUIRE(generateNonce(PIICategory::Email, session) == "david3@demo.io");
}

TEST_CASE("NonceGenerator - phones stay in the fictional 555-01xx range", "[nonce_generator]")
{
    RedactionSession session(42);
    const std::regex pattern(R"(555-01\d\d)");

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i)
    {
        std::string nonce = generateNonce(PIICategory::Phone, session);
        REQUIRE(std::regex_match(nonce, pattern));
        REQUIRE(seen.insert(nonce).second);
    }

    SECTION("wrap-around collides and gets a suffix")
    {
        std::string nonce = generateNonce(PIICategory::Phone, session);
        REQUIRE(std::regex_match(nonce, std::regex(R"(555-0100_[0-9a-z]{4})")));
    }
}

TEST_CASE("NonceGenerator - SSNs use the never-issued 900 area", "[nonce_generator]")
{
    RedactionSession session(42);
    const std::regex pattern(R"(900-\d{2}-\d{4})");

    REQUIRE(generateNonce(PIICategory::Ssn, session) == "900-00-0000");
    for (int i = 1; i < 7; ++i)
        REQUIRE(std::regex_match(generateNonce(PIICategory::Ssn, session), pattern));
    REQUIRE(generateNonce(PIICategory::Ssn, session) == "900-02-0007");
}

TEST_CASE("NonceGenerator - addresses and custom values", "[nonce_generator]")
{
    RedactionSession session(42);

    REQUIRE(generateNonce(PIICategory::Address, session) == "100 Example St, Anytown");
    REQUIRE(generateNonce(PIICategory::Address, session) == "101 Test Ave, Anytown");

    REQUIRE(generateNonce(PIICategory::Custom, session) == "[REDACTED-001]");
    REQUIRE(generateNonce(PIICategory::Custom, session) == "[REDACTED-002]");
}

TEST_CASE("NonceGenerator - counters are per category", "[nonce_generator]")
{
    RedactionSession session(42);

    (void)generateNonce(PIICategory::Name, session);
    (void)generateNonce(PIICategory::Name, session);

    REQUIRE(session.counter(PIICategory::Name) == 2);
    REQUIRE(session.counter(PIICategory::Phone) == 0);
    REQUIRE(generateNonce(PIICategory::Phone, session) == "555-0100");
}

TEST_CASE("NonceGenerator - every nonce is unique within a session", "[nonce_generator]")
{
    RedactionSession session(7);

    SECTION("a used nonce is never handed out again")
    {
        session.markNonceUsed("Alice Anderson");

        std::string nonce = generateNonce(PIICategory::Name, session);
        REQUIRE(nonce != "Alice Anderson");
        REQUIRE(std::regex_match(nonce, std::regex(R"(Alice Anderson_[0-9a-z]{4})")));
        REQUIRE(session.isNonceUsed(nonce));
    }

    SECTION("generated nonces are marked used")
    {
        std::string nonce = generateNonce(PIICategory::Custom, session);
        REQUIRE(session.isNonceUsed(nonce));
        REQUIRE(session.usedNonces().size() == 1);
    }
}

TEST_CASE("NonceGenerator - collision suffixes are reproducible with a seed", "[nonce_generator]")
{
    RedactionSession first(1234);
    RedactionSession second(1234);
    first.markNonceUsed("[REDACTED-001]");
    second.markNonceUsed("[REDACTED-001]");

    REQUIRE(generateNonce(PIICategory::Custom, first) == generateNonce(PIICategory::Custom, second));
}
