#include <catch2/catch_test_macros.hpp>
#include "payments/NFCTextNormalizer.hpp"

#include <string>

TEST_CASE("NFCTextNormalizer - composes base letter and accent", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    auto result = normalizer.normalize("Cafe\u0301");
    REQUIRE(result.has_value());
    REQUIRE(*result == "Café");
}

TEST_CASE("NFCTextNormalizer - composes umlauts", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    auto result = normalizer.normalize("Mu\u0308ller Zu\u0308rich");
    REQUIRE(result.has_value());
    REQUIRE(*result == "Müller Zürich");
}

TEST_CASE("NFCTextNormalizer - replaces canonical singletons", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    // ANGSTROM SIGN -> LATIN CAPITAL LETTER A WITH RING ABOVE
    auto result = normalizer.normalize("\u212B");
    REQUIRE(result.has_value());
    REQUIRE(*result == "Å");
}

TEST_CASE("NFCTextNormalizer - leaves compatibility characters alone", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    auto result = normalizer.normalize("\uFF21\uFF22\uFF23\u2460");
    REQUIRE(result.has_value());
    REQUIRE(*result == "\uFF21\uFF22\uFF23\u2460");
}

TEST_CASE("NFCTextNormalizer - keeps embedded NUL bytes", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    const std::string input("e\0e\u0301", 5);
    auto result = normalizer.normalize(input);
    REQUIRE(result.has_value());
    REQUIRE(*result == std::string("e\0é", 4));
}

TEST_CASE("NFCTextNormalizer - handles empty string", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    auto result = normalizer.normalize("");
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
    REQUIRE(normalizer.isNormalized(""));
}

TEST_CASE("NFCTextNormalizer - composes around ill-formed UTF-8", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;

    auto result = normalizer.normalize("e\u0301\xff" "e\u0301");
    REQUIRE(result.has_value());
    REQUIRE(*result == "\u00E9\xff" "\u00E9");

    // a combining mark never composes across a broken sequence
    auto split = normalizer.normalize("e\xed\xa0\x80\u0301");
    REQUIRE(split.has_value());
    REQUIRE(*split == "e\xed\xa0\x80\u0301");

    REQUIRE(normalizer.isNormalized("A\xff" "B"));
    REQUIRE_FALSE(normalizer.isNormalized("Cafe\u0301 M\xff"));
}

TEST_CASE("NFCTextNormalizer - isNormalized", "[nfc_normalizer]")
{
    payments::NFCTextNormalizer normalizer;
    REQUIRE(normalizer.isNormalized("Café"));
    REQUIRE(normalizer.isNormalized("北京 \U0001F600"));
    REQUIRE_FALSE(normalizer.isNormalized("Cafe\u0301"));
    REQUIRE_FALSE(normalizer.isNormalized("\u212B"));
}
