#pragma once

#include <string>
#include <string_view>

namespace payments
{

enum class ReferenceType
{
    Iban,              // account number, modulo 97
    CreditorReference, // ISO 11649 "RF" reference, modulo 97
    QrReference        // 27 digits, recursive modulo 10
};

// All functions below expect input without whitespace unless stated otherwise.

/// Letters at 0-1, digits at 2-3, at least 5 alphanumerics and a matching checksum.
/// Country-specific lengths are not checked.
[[nodiscard]] bool isValidIban(std::string_view iban);

/// 5 to 25 alphanumerics, digits at 2-3 and a matching checksum
[[nodiscard]] bool isValidIso11649Reference(std::string_view reference);

/// Exactly 27 digits with a zero modulo 10 carry
[[nodiscard]] bool isValidQrReference(std::string_view reference);

[[nodiscard]] bool isValidReference(ReferenceType type, std::string_view reference);

/**
 * @brief Creates an ISO 11649 creditor reference ("RF" + check digits + payload)
 * @param raw_reference payload; whitespace is removed first
 * @throws InvalidCharacterError if the payload contains anything but letters and digits
 */
[[nodiscard]] std::string createIso11649Reference(std::string_view raw_reference);

/**
 * @brief Creates a 27-digit QR reference from up to 26 digits
 *
 * Whitespace is removed, the digits are left-padded with zeros to 26 and
 * the modulo 10 check digit is appended.
 *
 * @throws InvalidCharacterError on a non-digit
 * @throws std::length_error if there are no digits or more than 26
 */
[[nodiscard]] std::string createQrReference(std::string_view raw_reference);

/// Groups of 4 from the left, the last group may be shorter
[[nodiscard]] std::string formatIban(std::string_view iban);

/// Same grouping as an IBAN
[[nodiscard]] std::string formatIso11649Reference(std::string_view reference);

/// Groups of 5 aligned to the right, the first group may be shorter
[[nodiscard]] std::string formatQrReference(std::string_view reference);

[[nodiscard]] std::string formatReference(ReferenceType type, std::string_view reference);

} // namespace payments
