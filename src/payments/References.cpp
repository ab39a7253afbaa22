#include "References.hpp"
#include "Checksum.hpp"
#include "TextUtils.hpp"

#include <cstdio>
#include <stdexcept>

namespace payments
{

namespace
{

constexpr std::size_t kQrReferenceLength = 27;
constexpr std::size_t kCreditorReferenceMinLength = 5;
constexpr std::size_t kCreditorReferenceMaxLength = 25;

bool isAsciiLetter(char ch) { return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z'); }

bool isAsciiDigit(char ch) { return ch >= '0' && ch <= '9'; }

std::string insertSpaces(std::string_view value, std::size_t first_group, std::size_t group)
{
    std::string out;
    out.reserve(value.size() + value.size() / group + 1);

    std::size_t pos = 0;
    std::size_t next = first_group;
    while (pos < value.size())
    {
        if (next > value.size())
            next = value.size();
        if (pos != 0)
            out.push_back(' ');
        out.append(value.substr(pos, next - pos));
        pos = next;
        next += group;
    }
    return out;
}

} // namespace

bool isValidIban(std::string_view iban)
{
    if (iban.size() < 5)
        return false;
    if (!isAlphaNumeric(iban))
        return false;
    if (!isAsciiLetter(iban[0]) || !isAsciiLetter(iban[1]) || !isAsciiDigit(iban[2]) || !isAsciiDigit(iban[3]))
        return false;

    return hasValidMod97CheckDigits(iban);
}

bool isValidIso11649Reference(std::string_view reference)
{
    if (reference.size() < kCreditorReferenceMinLength || reference.size() > kCreditorReferenceMaxLength)
        return false;
    if (!isAlphaNumeric(reference))
        return false;
    if (!isAsciiDigit(reference[2]) || !isAsciiDigit(reference[3]))
        return false;

    return hasValidMod97CheckDigits(reference);
}

bool isValidQrReference(std::string_view reference)
{
    if (reference.size() != kQrReferenceLength || !isNumeric(reference))
        return false;

    return calculateMod10Carry(reference) == 0;
}

bool isValidReference(ReferenceType type, std::string_view reference)
{
    switch (type)
    {
    case ReferenceType::Iban:
        return isValidIban(reference);
    case ReferenceType::CreditorReference:
        return isValidIso11649Reference(reference);
    case ReferenceType::QrReference:
        return isValidQrReference(reference);
    }
    return false;
}

std::string createIso11649Reference(std::string_view raw_reference)
{
    const std::string payload = removeWhitespace(raw_reference);
    const int modulo = calculateMod97("RF00" + payload);

    char check_digits[3];
    std::snprintf(check_digits, sizeof(check_digits), "%02d", 98 - modulo);

    return std::string("RF") + check_digits + payload;
}

std::string createQrReference(std::string_view raw_reference)
{
    const std::string digits = removeWhitespace(raw_reference);
    if (digits.empty() || digits.size() >= kQrReferenceLength)
        throw std::length_error("QR reference needs 1 to 26 digits, got " + std::to_string(digits.size()));

    std::string reference(kQrReferenceLength - 1 - digits.size(), '0');
    reference += digits;

    // throws InvalidCharacterError for non-digits; positions refer to the padded string
    const int carry = calculateMod10Carry(reference);
    reference.push_back(static_cast<char>('0' + (10 - carry) % 10));
    return reference;
}

std::string formatIban(std::string_view iban)
{
    return insertSpaces(iban, 4, 4);
}

std::string formatIso11649Reference(std::string_view reference)
{
    return formatIban(reference);
}

std::string formatQrReference(std::string_view reference)
{
    if (reference.empty())
        return std::string();
    return insertSpaces(reference, (reference.size() - 1) % 5 + 1, 5);
}

std::string formatReference(ReferenceType type, std::string_view reference)
{
    switch (type)
    {
    case ReferenceType::Iban:
        return formatIban(reference);
    case ReferenceType::CreditorReference:
        return formatIso11649Reference(reference);
    case ReferenceType::QrReference:
        return formatQrReference(reference);
    }
    return std::string(reference);
}

} // namespace payments
