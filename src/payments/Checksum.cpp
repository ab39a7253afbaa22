#include "Checksum.hpp"
#include "PaymentErrors.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>

namespace payments
{

namespace
{

constexpr std::array<int, 10> kMod10Table = { 0, 9, 4, 6, 8, 2, 7, 1, 3, 5 };

// Keeps the running value below 10^7 before it grows by at most two digits.
constexpr std::uint32_t kMod97ReduceThreshold = 9999999;

} // namespace

int calculateMod97(std::string_view reference)
{
    if (reference.size() < 4)
        throw std::length_error("Reference for modulo 97 needs at least 4 characters");

    const std::size_t len = reference.size();
    std::uint32_t sum = 0;

    for (std::size_t i = 0; i < len; ++i)
    {
        // rearranged order: reference[4:] followed by reference[0:4]
        const std::size_t pos = (i + 4) % len;
        const char ch = reference[pos];

        if (ch >= '0' && ch <= '9')
            sum = sum * 10 + static_cast<std::uint32_t>(ch - '0');
        else if (ch >= 'A' && ch <= 'Z')
            sum = sum * 100 + static_cast<std::uint32_t>(ch - 'A' + 10);
        else if (ch >= 'a' && ch <= 'z')
            sum = sum * 100 + static_cast<std::uint32_t>(ch - 'a' + 10);
        else
            throw InvalidCharacterError(pos, ch);

        if (sum > kMod97ReduceThreshold)
            sum %= 97;
    }

    return static_cast<int>(sum % 97);
}

bool hasValidMod97CheckDigits(std::string_view reference)
{
    if (reference.size() < 4)
        return false;

    try
    {
        return calculateMod97(reference) == 1;
    }
    catch (const InvalidCharacterError&)
    {
        return false;
    }
}

int calculateMod10Carry(std::string_view digits)
{
    int carry = 0;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        const char ch = digits[i];
        if (ch < '0' || ch > '9')
            throw InvalidCharacterError(i, ch);
        carry = kMod10Table[static_cast<std::size_t>((carry + (ch - '0')) % 10)];
    }
    return carry;
}

} // namespace payments
