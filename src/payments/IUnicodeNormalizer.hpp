#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace payments
{

class IUnicodeNormalizer
{
public:
    virtual ~IUnicodeNormalizer() = default;

    // Composed form of the text, or nullopt if it cannot be normalized.
    // Ill-formed UTF-8 bytes are kept as they are.
    [[nodiscard]] virtual std::optional<std::string> normalize(std::string_view text) const = 0;

    [[nodiscard]] virtual bool isNormalized(std::string_view text) const = 0;
};

} // namespace payments
