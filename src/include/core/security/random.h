#pragma once

#include <cstddef>
#include <string>

namespace deckhand::core {

namespace random {

// Decimal digits drawn from the OpenSSL CSPRNG
std::string NumericCode(std::size_t length);

// `bytes` random bytes, URL-safe base64 without padding
std::string Token(std::size_t bytes);

} // namespace random

} // namespace deckhand::core
