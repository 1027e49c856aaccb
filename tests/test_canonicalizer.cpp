#include <catch2/catch_test_macros.hpp>
#include "redaction/Canonicalizer.hpp"
#include "redaction/Confusables.hpp"
#include "redaction/TextUtils.hpp"
#include <string>
#include <vector>

using namespace redaction;

TEST_CASE("Canonicalizer - lowercases and drops whitespace and punctuation", "[canonicalizer]")
{
    REQUIRE(canonicalForm("John Smith") == U"johnsmith");
    REQUIRE(canonicalForm("555-123-4567") == U"5551234567");
    REQUIRE(canonicalForm("(555) 123.4567") == U"5551234567");
    REQUIRE(canonicalForm("john.doe@acme.com") == U"johndoeacmecom");
    REQUIRE(canonicalForm("  \t\n").empty());
    REQUIRE(canonicalForm("").empty());
}

TEST_CASE("Canonicalizer - folds fullwidth and compatibility forms", "[canonicalizer]")
{
    REQUIRE(canonicalForm("ＪＯＨＮ") == U"john");
    REQUIRE(canonicalForm("５５５－０１２３") == U"5550123");
    REQUIRE(canonicalForm("ﬁle") == U"file");
}

TEST_CASE("Canonicalizer - maps look-alike letters to ASCII", "[canonicalizer]")
{
    // Cyrillic o and a
    REQUIRE(canonicalForm("J\u043Ehn") == U"john");
    REQUIRE(canonicalForm("\u0430lice") == U"alice");
    // Greek capital alpha and omicron
    REQUIRE(canonicalForm("\u0391NNA") == U"anna");
    REQUIRE(canonicalForm("B\u039FB") == U"bob");

    REQUIRE(mapConfusable(U'\u0441') == U'c');
    REQUIRE_FALSE(mapConfusable(U'x').has_value());
    REQUIRE_FALSE(mapConfusable(U'\u0436').has_value());
}

TEST_CASE("Canonicalizer - removes zero-width characters", "[canonicalizer]")
{
    REQUIRE(canonicalForm("Jo\u200Bhn") == U"john");
    REQUIRE(canonicalForm("J\u200Co\u200Dh\uFEFFn") == U"john");
    REQUIRE(canonicalForm("Jo\u00ADhn") == U"john");
}

TEST_CASE("Canonicalizer - canonical form is idempotent", "[canonicalizer]")
{
    const std::vector<std::string> samples = {
        "John Smith", "ＪＯＨＮ", "J\u043Ehn", "Jo\u200Bhn", "ﬁle", "Ｍüller-Lüdenscheidt", "日本 太郎", "école",
    };

    for (const auto& sample : samples)
    {
        std::u32string once = canonicalForm(sample);
        std::u32string twice = canonicalForm(utf32ToUtf8(once));
        REQUIRE(once == twice);
    }
}

TEST_CASE("Canonicalizer - position map points back into the original bytes", "[canonicalizer]")
{
    SECTION("skipped characters leave gaps")
    {
        auto canon = canonicalize("a b");
        REQUIRE(canon.canonical == U"ab");
        REQUIRE(canon.position_map == std::vector<std::size_t>{ 0, 2 });
        REQUIRE(canon.position_end == std::vector<std::size_t>{ 1, 3 });
    }

    SECTION("one cluster expanding to several code points shares a span")
    {
        std::string text = "xﬁ";
        auto canon = canonicalize(text);
        REQUIRE(canon.canonical == U"xfi");
        REQUIRE(canon.position_map[1] == 1);
        REQUIRE(canon.position_map[2] == 1);
        REQUIRE(canon.position_end[1] == text.size());
        REQUIRE(canon.position_end[2] == text.size());
    }

    SECTION("combining marks stay with their base character")
    {
        std::string text = "e\u0301t";
        auto canon = canonicalize(text);
        REQUIRE(canon.canonical.size() == 2);
        REQUIRE(canon.position_map[0] == 0);
        REQUIRE(canon.position_end[0] == 3);
        REQUIRE(canon.position_map[1] == 3);
    }

    SECTION("every canonical index has a span")
    {
        auto canon = canonicalize("Ｈｅｌｌｏ, J\u043Ehn!");
        REQUIRE(canon.position_map.size() == canon.canonical.size());
        REQUIRE(canon.position_end.size() == canon.canonical.size());
        for (std::size_t i = 0; i < canon.canonical.size(); ++i)
            REQUIRE(canon.position_map[i] < canon.position_end[i]);
    }
}

TEST_CASE("Canonicalizer - coversOffset", "[canonicalizer]")
{
    auto canon = canonicalize("a b\u200Bc");
    REQUIRE(canon.coversOffset(0));
    REQUIRE_FALSE(canon.coversOffset(1));
    REQUIRE(canon.coversOffset(2));
    // zero-width space occupies bytes 3..5
    REQUIRE_FALSE(canon.coversOffset(3));
    REQUIRE_FALSE(canon.coversOffset(5));
    REQUIRE(canon.coversOffset(6));
    REQUIRE_FALSE(canon.coversOffset(7));
}

TEST_CASE("Canonicalizer - isWordBoundary", "[canonicalizer]")
{
    std::string text = "Hi, Bob";
    REQUIRE(isWordBoundary(text, -1));
    REQUIRE(isWordBoundary(text, static_cast<std::ptrdiff_t>(text.size())));
    REQUIRE_FALSE(isWordBoundary(text, 0));
    REQUIRE(isWordBoundary(text, 2));
    REQUIRE(isWordBoundary(text, 3));
    REQUIRE_FALSE(isWordBoundary(text, 4));
}
