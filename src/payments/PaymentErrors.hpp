#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace payments
{

// Thrown by checksum and reference generation when the input contains a
// character outside the allowed alphabet (ASCII letters/digits).
class InvalidCharacterError : public std::invalid_argument
{
public:
    InvalidCharacterError(std::size_t position, char character);

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] char character() const noexcept { return character_; }

private:
    std::size_t position_;
    char character_;
};

} // namespace payments
