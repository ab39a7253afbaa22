#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace payments
{

/// One decoded step of a UTF-8 scan.
struct Utf8Scalar
{
    char32_t codepoint = 0;
    std::size_t length = 0;   // bytes consumed, always >= 1 for non-empty input
    bool well_formed = false; // false for an ill-formed subsequence
};

/// Decodes the scalar starting at `pos`. An ill-formed subsequence (a lead
/// byte plus at most the continuation bytes it announces) is returned as a
/// single step with `well_formed == false`.
[[nodiscard]] Utf8Scalar decodeUtf8At(std::string_view text, std::size_t pos);

/// ASCII digits only (an empty string is numeric)
[[nodiscard]] bool isNumeric(std::string_view value) noexcept;

/// ASCII letters and digits only (an empty string is alphanumeric)
[[nodiscard]] bool isAlphaNumeric(std::string_view value) noexcept;

/// Removes ASCII whitespace anywhere in the string
[[nodiscard]] std::string removeWhitespace(std::string_view value);

/// Removes leading and trailing ASCII spaces
[[nodiscard]] std::string_view trimSpaces(std::string_view value) noexcept;

} // namespace payments
