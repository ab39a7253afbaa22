#pragma once

#include "IUnicodeNormalizer.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace payments
{

struct CleaningResult
{
    std::optional<std::string> cleaned_value;  // nullopt if nothing visible is left
    bool replaced_unsupported_chars = false;   // at least one character was substituted
};

/**
 * @brief Reduces free text to the QR-bill character set
 *
 * Unsupported whitespace becomes a single space (runs collapse), other
 * unsupported characters become '.', supplementary combining spacing marks
 * are dropped. Leading and trailing spaces are removed.
 *
 * If a character beyond U+00FF is found and the text is not in NFC, the text
 * is normalized once and scanned again, so that decomposed accented letters
 * can turn into valid precomposed ones.
 *
 * Input is UTF-8. Ill-formed sequences are treated as one unsupported
 * character each. Never throws on any input.
 */
class CharacterSanitizer
{
public:
    CharacterSanitizer();
    explicit CharacterSanitizer(std::unique_ptr<IUnicodeNormalizer> normalizer);
    ~CharacterSanitizer();

    CharacterSanitizer(const CharacterSanitizer&) = delete;
    CharacterSanitizer& operator=(const CharacterSanitizer&) = delete;

    [[nodiscard]] CleaningResult clean(std::optional<std::string_view> value) const;

private:
    struct ScanOutcome;

    ScanOutcome scan(std::string_view text, bool may_normalize) const;

    std::unique_ptr<IUnicodeNormalizer> normalizer_;
};

/// Cleans with a process-wide NFC sanitizer
[[nodiscard]] CleaningResult clean(std::optional<std::string_view> value);

} // namespace payments
