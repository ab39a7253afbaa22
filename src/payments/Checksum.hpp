#pragma once

#include <string_view>

namespace payments
{

/**
 * @brief Modulo 97 checksum as used by IBAN and ISO 11649 references
 *
 * The first four characters are moved to the end, letters count as two
 * digits (A=10 ... Z=35, case-insensitive) and the remainder of the resulting
 * number by 97 is returned. A valid IBAN or creditor reference yields 1.
 *
 * @param reference at least 4 ASCII letters/digits
 * @return checksum in the range 0 to 96
 * @throws InvalidCharacterError on any other character
 * @throws std::length_error if the reference is shorter than 4 characters
 */
[[nodiscard]] int calculateMod97(std::string_view reference);

/// calculateMod97() == 1. Invalid characters and references shorter than
/// 4 characters count as a mismatch.
[[nodiscard]] bool hasValidMod97CheckDigits(std::string_view reference);

/**
 * @brief Recursive modulo 10 carry over a digit string
 *
 * carry = TABLE[(carry + digit) % 10] with TABLE = {0,9,4,6,8,2,7,1,3,5}.
 * A reference is valid if the carry over all of its digits is 0.
 *
 * @throws InvalidCharacterError on a character other than '0'-'9'
 */
[[nodiscard]] int calculateMod10Carry(std::string_view digits);

} // namespace payments
