#include "CharacterSet.hpp"

#include <array>
#include <cstddef>

#include <utf8proc.h>

namespace payments
{

namespace
{

constexpr std::array<bool, 256> buildLatin1Table()
{
    std::array<bool, 256> table{};

    for (std::size_t cp = 0x20; cp <= 0x7e; ++cp)
        table[cp] = true;
    table[0x5e] = false;

    table[0xa3] = true;
    table[0xb4] = true;

    for (std::size_t cp = 0xc0; cp <= 0xfd; ++cp)
        table[cp] = true;

    constexpr std::array<std::size_t, 15> excluded = {
        0xc3, 0xc5, 0xc6, 0xd0, 0xd5, 0xd7, 0xd8, 0xdd,
        0xde, 0xe3, 0xe5, 0xe6, 0xf0, 0xf5, 0xf8,
    };
    for (std::size_t cp : excluded)
        table[cp] = false;

    return table;
}

constexpr std::array<bool, 256> kValidLatin1 = buildLatin1Table();

static_assert(kValidLatin1[' '] && kValidLatin1['~'] && !kValidLatin1['^']);
static_assert(kValidLatin1[0xa3] && kValidLatin1[0xb4] && !kValidLatin1[0xa0]);
static_assert(kValidLatin1[0xc4] && !kValidLatin1[0xc3] && !kValidLatin1[0xfe]);

} // namespace

bool isValidQrBillCharacter(char32_t cp) noexcept
{
    return cp < kValidLatin1.size() && kValidLatin1[cp];
}

bool isReplaceableWhitespace(char32_t cp) noexcept
{
    if ((cp >= 0x09 && cp <= 0x0d) || (cp >= 0x1c && cp <= 0x1f))
        return true;

    if (cp == 0xa0 || cp == 0x2007 || cp == 0x202f)
        return false;

    if (!utf8proc_codepoint_valid(static_cast<utf8proc_int32_t>(cp)))
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isCombiningSpacingMark(char32_t cp) noexcept
{
    if (!utf8proc_codepoint_valid(static_cast<utf8proc_int32_t>(cp)))
        return false;
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_MC;
}

} // namespace payments
