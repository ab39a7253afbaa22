#include "NFCTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <cstdlib>

#include <utf8proc.h>
#include <plog/Log.h>

namespace payments
{

namespace
{

bool appendComposed(std::string& out, std::string_view run)
{
    if (run.empty())
        return true;

    // utf8proc_NFC() stops at the first NUL; map with an explicit length instead
    utf8proc_uint8_t* normalized = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(run.data()),
                                        static_cast<utf8proc_ssize_t>(run.size()), &normalized,
                                        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE));

    if (len < 0 || !normalized)
    {
        PLOG_WARNING << "NFC normalization failed: " << utf8proc_errmsg(len);
        std::free(normalized);
        return false;
    }

    out.append(reinterpret_cast<const char*>(normalized), static_cast<std::size_t>(len));
    std::free(normalized);
    return true;
}

} // namespace

std::optional<std::string> NFCTextNormalizer::normalize(std::string_view text) const
{
    std::string result;
    result.reserve(text.size());

    // Ill-formed subsequences are copied as they are; the well-formed runs
    // between them are composed separately.
    std::size_t run_start = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const Utf8Scalar scalar = decodeUtf8At(text, pos);
        if (!scalar.well_formed)
        {
            if (!appendComposed(result, text.substr(run_start, pos - run_start)))
                return std::nullopt;
            result.append(text.substr(pos, scalar.length));
            run_start = pos + scalar.length;
        }
        pos += scalar.length;
    }

    if (!appendComposed(result, text.substr(run_start)))
        return std::nullopt;

    return result;
}

bool NFCTextNormalizer::isNormalized(std::string_view text) const
{
    auto normalized = normalize(text);
    return normalized && *normalized == text;
}

} // namespace payments
