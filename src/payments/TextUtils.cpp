#include "TextUtils.hpp"

#include <utf8proc.h>

namespace payments
{

namespace
{

// 0xC0, 0xC1 and 0xF5-0xFF never start a sequence
std::size_t expectedSequenceLength(unsigned char lead)
{
    if (lead >= 0xf5)
        return 1;
    if (lead >= 0xf0)
        return 4;
    if (lead >= 0xe0)
        return 3;
    if (lead >= 0xc2)
        return 2;
    return 1;
}

bool isContinuationByte(unsigned char c) { return (c & 0xc0) == 0x80; }

} // namespace

Utf8Scalar decodeUtf8At(std::string_view text, std::size_t pos)
{
    Utf8Scalar scalar;
    if (pos >= text.size())
        return scalar;

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + pos);
    const auto remaining = static_cast<utf8proc_ssize_t>(text.size() - pos);

    utf8proc_int32_t codepoint = -1;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, remaining, &codepoint);
    if (bytes > 0 && codepoint >= 0)
    {
        scalar.codepoint = static_cast<char32_t>(codepoint);
        scalar.length = static_cast<std::size_t>(bytes);
        scalar.well_formed = true;
        return scalar;
    }

    // Swallow the continuation bytes the lead byte announced so that a
    // broken sequence (e.g. an encoded surrogate) counts as one character.
    std::size_t expected = expectedSequenceLength(static_cast<unsigned char>(text[pos]));
    std::size_t length = 1;
    while (length < expected && pos + length < text.size() &&
           isContinuationByte(static_cast<unsigned char>(text[pos + length])))
    {
        ++length;
    }

    scalar.codepoint = U'\uFFFD';
    scalar.length = length;
    scalar.well_formed = false;
    return scalar;
}

bool isNumeric(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch < '0' || ch > '9')
            return false;
    }
    return true;
}

bool isAlphaNumeric(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch >= '0' && ch <= '9')
            continue;
        if (ch >= 'A' && ch <= 'Z')
            continue;
        if (ch >= 'a' && ch <= 'z')
            continue;
        return false;
    }
    return true;
}

std::string removeWhitespace(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (char ch : value)
    {
        switch (ch)
        {
        case ' ':
        case '\t':
        case '\n':
        case '\v':
        case '\f':
        case '\r':
            break;
        default:
            out.push_back(ch);
            break;
        }
    }
    return out;
}

std::string_view trimSpaces(std::string_view value) noexcept
{
    std::size_t begin = value.find_first_not_of(' ');
    if (begin == std::string_view::npos)
        return {};
    std::size_t end = value.find_last_not_of(' ');
    return value.substr(begin, end - begin + 1);
}

} // namespace payments
