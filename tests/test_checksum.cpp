#include <catch2/catch_test_macros.hpp>
#include "payments/Checksum.hpp"
#include "payments/PaymentErrors.hpp"

#include <stdexcept>
#include <string>

using payments::calculateMod10Carry;
using payments::calculateMod97;
using payments::hasValidMod97CheckDigits;
using payments::InvalidCharacterError;

TEST_CASE("Checksum - modulo 97 of valid references is 1", "[checksum]")
{
    REQUIRE(calculateMod97("RF18539007547034") == 1);
    REQUIRE(calculateMod97("CH9300762011623852957") == 1);
    REQUIRE(calculateMod97("DE89370400440532013000") == 1);
    REQUIRE(calculateMod97("GB82WEST12345698765432") == 1);
}

TEST_CASE("Checksum - modulo 97 of a broken reference", "[checksum]")
{
    REQUIRE(calculateMod97("RF18539007547035") == 28);
    REQUIRE(calculateMod97("CH9300762011623852958") == 28);
}

TEST_CASE("Checksum - modulo 97 ignores letter case", "[checksum]")
{
    REQUIRE(calculateMod97("ch9300762011623852957") == calculateMod97("CH9300762011623852957"));
    REQUIRE(calculateMod97("gb82west12345698765432") == 1);
}

TEST_CASE("Checksum - modulo 97 of creditor reference placeholders", "[checksum]")
{
    REQUIRE(calculateMod97("RF00539007547034") == 80);
    REQUIRE(calculateMod97("RF00TEST") == 43);
}

TEST_CASE("Checksum - modulo 97 handles long references without overflow", "[checksum]")
{
    std::string reference = "RF00";
    reference.append(200, 'Z');
    const int result = calculateMod97(reference);
    REQUIRE(result >= 0);
    REQUIRE(result < 97);

    std::string digits = "0000";
    digits.append(300, '9');
    REQUIRE(calculateMod97(digits) < 97);
}

TEST_CASE("Checksum - modulo 97 rejects characters outside A-Z and 0-9", "[checksum]")
{
    REQUIRE_THROWS_AS(calculateMod97("CH93 0076 2011"), InvalidCharacterError);
    REQUIRE_THROWS_AS(calculateMod97("RF18-5390"), InvalidCharacterError);
    REQUIRE_THROWS_AS(calculateMod97("RF18Ä123"), InvalidCharacterError);

    try
    {
        (void)calculateMod97("AB12#45");
        FAIL("expected InvalidCharacterError");
    }
    catch (const InvalidCharacterError& ex)
    {
        REQUIRE(ex.position() == 4);
        REQUIRE(ex.character() == '#');
    }
}

TEST_CASE("Checksum - modulo 97 needs four characters", "[checksum]")
{
    REQUIRE_THROWS_AS(calculateMod97(""), std::length_error);
    REQUIRE_THROWS_AS(calculateMod97("RF1"), std::length_error);
    REQUIRE_NOTHROW((void)calculateMod97("RF18"));
}

TEST_CASE("Checksum - check digit helper never throws", "[checksum]")
{
    REQUIRE(hasValidMod97CheckDigits("RF18539007547034"));
    REQUIRE_FALSE(hasValidMod97CheckDigits("RF18539007547035"));
    REQUIRE_FALSE(hasValidMod97CheckDigits("RF18 5390 0754 7034"));

    REQUIRE_NOTHROW((void)hasValidMod97CheckDigits(""));
    REQUIRE_FALSE(hasValidMod97CheckDigits(""));
    REQUIRE_FALSE(hasValidMod97CheckDigits("RF1"));
}

TEST_CASE("Checksum - modulo 10 carry", "[checksum]")
{
    REQUIRE(calculateMod10Carry("") == 0);
    REQUIRE(calculateMod10Carry("0") == 0);
    REQUIRE(calculateMod10Carry("1") == 9);
    REQUIRE(calculateMod10Carry("000000000000000000000000000") == 0);
    REQUIRE(calculateMod10Carry("210000000003139471430009017") == 0);
    REQUIRE(calculateMod10Carry("210000000003139471430009016") == 5);
    REQUIRE(calculateMod10Carry("00000000000000000000001234") == 3);
}

TEST_CASE("Checksum - modulo 10 rejects non-digits", "[checksum]")
{
    REQUIRE_THROWS_AS(calculateMod10Carry("12a4"), InvalidCharacterError);
    REQUIRE_THROWS_AS(calculateMod10Carry("12 4"), InvalidCharacterError);
}
