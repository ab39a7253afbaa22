#pragma once

namespace payments
{

/// Character repertoire of the Swiss Payment Standards (ch. 2.4.1, appendix D):
/// printable ASCII without '^', the pound sign, the acute accent and most of
/// the Latin-1 letters.
[[nodiscard]] bool isValidQrBillCharacter(char32_t cp) noexcept;

/// Whitespace that is not itself valid and is therefore replaced by a space.
/// Tab, line breaks, U+001C-U+001F and the Unicode space/line/paragraph
/// separators, except the no-break spaces (U+00A0, U+2007, U+202F).
[[nodiscard]] bool isReplaceableWhitespace(char32_t cp) noexcept;

/// General category Mc.
[[nodiscard]] bool isCombiningSpacingMark(char32_t cp) noexcept;

} // namespace payments
