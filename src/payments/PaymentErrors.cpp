#include "PaymentErrors.hpp"

namespace payments
{

InvalidCharacterError::InvalidCharacterError(std::size_t position, char character)
    : std::invalid_argument("Invalid character in reference at position " + std::to_string(position) + ": '" +
                            std::string(1, character) + "'")
    , position_(position)
    , character_(character)
{
}

} // namespace payments
