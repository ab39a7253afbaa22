#pragma once

#include "IUnicodeNormalizer.hpp"

namespace payments
{

// Canonical composition (NFC) backed by utf8proc
class NFCTextNormalizer : public IUnicodeNormalizer
{
public:
    NFCTextNormalizer() = default;
    ~NFCTextNormalizer() override = default;

    NFCTextNormalizer(const NFCTextNormalizer&) = delete;
    NFCTextNormalizer& operator=(const NFCTextNormalizer&) = delete;

    [[nodiscard]] std::optional<std::string> normalize(std::string_view text) const override;
    [[nodiscard]] bool isNormalized(std::string_view text) const override;
};

} // namespace payments
