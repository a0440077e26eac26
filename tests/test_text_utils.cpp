#include <catch2/catch_test_macros.hpp>
#include "verification/TextUtils.hpp"

using namespace verification;

TEST_CASE("TextUtils - UTF-8 decoding", "[text][utf8]")
{
    SECTION("ASCII decodes one codepoint per byte")
    {
        REQUIRE(utf8ToUtf32("Pune") == U"Pune");
    }

    SECTION("Multi-byte sequences decode to single codepoints")
    {
        std::u32string decoded = utf8ToUtf32("Jos\xC3\xA9");
        REQUIRE(decoded.size() == 4);
        REQUIRE(decoded[3] == U'\u00E9');
    }

    SECTION("Invalid bytes become replacement characters")
    {
        std::u32string decoded = utf8ToUtf32("a\xFF" "b");
        REQUIRE(decoded.size() == 3);
        REQUIRE(decoded[1] == REPLACEMENT_CHAR);
    }

    SECTION("Round trip through UTF-32")
    {
        std::string text = "M\xC3\xBCnchen";
        REQUIRE(utf32ToUtf8(utf8ToUtf32(text)) == text);
    }
}

TEST_CASE("TextUtils - Trim", "[text]")
{
    REQUIRE(trim("  Jon Smith \t\n") == "Jon Smith");
    REQUIRE(trim("   ").empty());
    REQUIRE(trim("").empty());
    REQUIRE(trim("a b") == "a b");

    SECTION("Unicode spaces are stripped")
    {
        REQUIRE(trim("\xC2\xA0").empty());
        REQUIRE(trim("\xE3\x80\x80").empty());
        REQUIRE(trim("Pune\xC2\xA0") == "Pune");
        REQUIRE(trim("\xE2\x80\xA8Jon\xE2\x80\x83") == "Jon");
    }

    SECTION("Inner Unicode spaces are kept")
    {
        REQUIRE(trim("Jon\xC2\xA0Smith") == "Jon\xC2\xA0Smith");
    }

    SECTION("Invalid bytes are content")
    {
        REQUIRE(trim(" \xFF ") == "\xFF");
    }
}

TEST_CASE("TextUtils - Whitespace classification", "[text][unicode]")
{
    REQUIRE(isWhitespace(U' '));
    REQUIRE(isWhitespace(U'\t'));
    REQUIRE(isWhitespace(U'\u00A0'));
    REQUIRE(isWhitespace(U'\u2028'));
    REQUIRE(isWhitespace(U'\u3000'));
    REQUIRE_FALSE(isWhitespace(U'a'));
    REQUIRE_FALSE(isWhitespace(U'\u00E9'));
    REQUIRE_FALSE(isWhitespace(U'\u200B'));
}

TEST_CASE("TextUtils - Comparison form", "[text]")
{
    SECTION("Lower-cases ASCII and non-ASCII letters")
    {
        REQUIRE(comparisonForm("PUNE") == U"pune");
        REQUIRE(comparisonForm("\xC3\x89" "COLE") == U"\u00E9cole");
    }

    SECTION("Trims before comparing")
    {
        REQUIRE(comparisonForm("  Pune ") == comparisonForm("pune"));
    }
}

TEST_CASE("TextUtils - Suffix check", "[text]")
{
    REQUIRE(endsWith("name_confidence", "_confidence"));
    REQUIRE_FALSE(endsWith("confidence", "_confidence"));
    REQUIRE(endsWith("_confidence", "_confidence"));
}
