#include <catch2/catch_test_macros.hpp>
#include "payments/TextUtils.hpp"

#include <string>

using namespace payments;

TEST_CASE("TextUtils - isNumeric accepts ASCII digits only", "[text_utils]")
{
    REQUIRE(isNumeric("0123456789"));
    REQUIRE(isNumeric(""));
    REQUIRE_FALSE(isNumeric("12 3"));
    REQUIRE_FALSE(isNumeric("12a"));
    REQUIRE_FALSE(isNumeric("\uFF11\uFF12"));
}

TEST_CASE("TextUtils - isAlphaNumeric accepts ASCII letters and digits only", "[text_utils]")
{
    REQUIRE(isAlphaNumeric("AZaz09"));
    REQUIRE(isAlphaNumeric(""));
    REQUIRE_FALSE(isAlphaNumeric("RF18 5390"));
    REQUIRE_FALSE(isAlphaNumeric("Müller"));
    REQUIRE_FALSE(isAlphaNumeric("A-B"));
}

TEST_CASE("TextUtils - removeWhitespace strips ASCII whitespace everywhere", "[text_utils]")
{
    REQUIRE(removeWhitespace(" CH93 0076\t2011\r\n6238 ") == "CH93007620116238");
    REQUIRE(removeWhitespace("") == "");
    REQUIRE(removeWhitespace(" \t\n\v\f\r") == "");
    REQUIRE(removeWhitespace("ABC") == "ABC");
}

TEST_CASE("TextUtils - trimSpaces removes only ASCII spaces at the edges", "[text_utils]")
{
    REQUIRE(trimSpaces("  a b  ") == "a b");
    REQUIRE(trimSpaces("     ").empty());
    REQUIRE(trimSpaces("").empty());
    REQUIRE(trimSpaces("\tx\t") == "\tx\t");
}

TEST_CASE("TextUtils - decodeUtf8At reads well-formed scalars", "[text_utils]")
{
    const std::string text = "aé\u20AC\U0001F600";

    Utf8Scalar a = decodeUtf8At(text, 0);
    REQUIRE(a.well_formed);
    REQUIRE(a.codepoint == U'a');
    REQUIRE(a.length == 1);

    Utf8Scalar e = decodeUtf8At(text, 1);
    REQUIRE(e.well_formed);
    REQUIRE(e.codepoint == 0xe9);
    REQUIRE(e.length == 2);

    Utf8Scalar euro = decodeUtf8At(text, 3);
    REQUIRE(euro.well_formed);
    REQUIRE(euro.codepoint == 0x20ac);
    REQUIRE(euro.length == 3);

    Utf8Scalar emoji = decodeUtf8At(text, 6);
    REQUIRE(emoji.well_formed);
    REQUIRE(emoji.codepoint == 0x1f600);
    REQUIRE(emoji.length == 4);
}

TEST_CASE("TextUtils - decodeUtf8At groups ill-formed sequences", "[text_utils]")
{
    Utf8Scalar lone = decodeUtf8At("\xff", 0);
    REQUIRE_FALSE(lone.well_formed);
    REQUIRE(lone.length == 1);

    Utf8Scalar surrogate = decodeUtf8At("\xed\xa0\x80" "A", 0);
    REQUIRE_FALSE(surrogate.well_formed);
    REQUIRE(surrogate.length == 3);

    Utf8Scalar truncated = decodeUtf8At("\xf0\x9f" "A", 0);
    REQUIRE_FALSE(truncated.well_formed);
    REQUIRE(truncated.length == 2);

    Utf8Scalar never_lead = decodeUtf8At("\xf8\x80\x80\x80", 0);
    REQUIRE_FALSE(never_lead.well_formed);
    REQUIRE(never_lead.length == 1);

    Utf8Scalar overlong_lead = decodeUtf8At("\xc0\x80", 0);
    REQUIRE_FALSE(overlong_lead.well_formed);
    REQUIRE(overlong_lead.length == 1);

    Utf8Scalar out_of_range = decodeUtf8At("\xf5\x80\x80\x80", 0);
    REQUIRE_FALSE(out_of_range.well_formed);
    REQUIRE(out_of_range.length == 1);

    Utf8Scalar nul = decodeUtf8At(std::string("\0", 1), 0);
    REQUIRE(nul.well_formed);
    REQUIRE(nul.codepoint == 0);
    REQUIRE(nul.length == 1);

    Utf8Scalar past_end = decodeUtf8At("ab", 2);
    REQUIRE(past_end.length == 0);
}
