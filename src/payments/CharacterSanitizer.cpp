#include "CharacterSanitizer.hpp"
#include "CharacterSet.hpp"
#include "Diagnostics.hpp"
#include "NFCTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <utility>

#include <plog/Log.h>

namespace payments
{

struct CharacterSanitizer::ScanOutcome
{
    std::optional<std::string> normalized; // set if the scan has to start over on this text
    std::string cleaned;
    bool substituted = false;
};

CharacterSanitizer::CharacterSanitizer()
    : normalizer_(std::make_unique<NFCTextNormalizer>())
{
}

CharacterSanitizer::CharacterSanitizer(std::unique_ptr<IUnicodeNormalizer> normalizer)
    : normalizer_(normalizer ? std::move(normalizer) : std::make_unique<NFCTextNormalizer>())
{
}

CharacterSanitizer::~CharacterSanitizer() = default;

CleaningResult CharacterSanitizer::clean(std::optional<std::string_view> value) const
{
    CleaningResult result;
    if (!value || value->empty())
        return result;

    ScanOutcome outcome = scan(*value, true);

    // The second pass runs on composed text and never normalizes again.
    std::string normalized;
    if (outcome.normalized)
    {
        normalized = std::move(*outcome.normalized);
        outcome = scan(normalized, false);
    }

    if (outcome.cleaned.empty())
        return result;

    result.cleaned_value = std::move(outcome.cleaned);
    result.replaced_unsupported_chars = outcome.substituted;

    if (result.replaced_unsupported_chars && Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "Replaced unsupported characters in '"
                                              << Diagnostics::Preview(*value) << "' -> '"
                                              << Diagnostics::Preview(*result.cleaned_value) << "'";
    }

    return result;
}

CharacterSanitizer::ScanOutcome CharacterSanitizer::scan(std::string_view text, bool may_normalize) const
{
    ScanOutcome outcome;
    std::string& out = outcome.cleaned;

    bool building = false;              // nothing is copied until the first substitution
    bool just_processed_space = false;
    std::size_t last_copied = 0;        // end of the prefix already appended to out
    std::size_t pos = 0;

    while (pos < text.size())
    {
        const Utf8Scalar scalar = decodeUtf8At(text, pos);
        const char32_t cp = scalar.codepoint;

        if (scalar.well_formed && isValidQrBillCharacter(cp))
        {
            just_processed_space = cp == U' ';
            pos += scalar.length;
            continue;
        }

        if (may_normalize && scalar.well_formed && cp > 0xff)
        {
            may_normalize = false;
            if (!normalizer_->isNormalized(text))
            {
                auto normalized = normalizer_->normalize(text);
                if (!normalized)
                {
                    PLOG_WARNING << "Text could not be normalized, cleaning it as is: "
                                 << Diagnostics::Preview(text);
                }
                else if (*normalized != text)
                {
                    outcome.normalized = std::move(*normalized);
                    return outcome;
                }
            }
        }

        if (!building)
        {
            out.reserve(text.size());
            building = true;
        }

        out.append(text.substr(last_copied, pos - last_copied));

        if (!scalar.well_formed)
        {
            out.push_back('.');
            just_processed_space = false;
        }
        else if (cp > 0xffff)
        {
            // one dot per scalar; spacing marks vanish
            if (!isCombiningSpacingMark(cp))
                out.push_back('.');
            just_processed_space = false;
        }
        else if (isReplaceableWhitespace(cp))
        {
            if (!just_processed_space)
                out.push_back(' ');
            just_processed_space = true;
        }
        else
        {
            out.push_back('.');
            just_processed_space = false;
        }

        pos += scalar.length;
        last_copied = pos;
    }

    if (!building)
    {
        out.assign(trimSpaces(text));
        return outcome;
    }

    out.append(text.substr(last_copied));
    std::string trimmed(trimSpaces(out));
    out = std::move(trimmed);
    outcome.substituted = true;
    return outcome;
}

CleaningResult clean(std::optional<std::string_view> value)
{
    static const CharacterSanitizer sanitizer;
    return sanitizer.clean(value);
}

} // namespace payments
