#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace otp {

// RFC 4648 Base32, the encoding authenticator apps use to exchange secrets.
// Decoding is case-insensitive, skips whitespace and stops at the first '='.
// Throws std::runtime_error on any other character outside the alphabet.
std::vector<std::uint8_t> base32_decode(std::string_view input);

// Upper-case, '='-padded encoding of |bytes|.
std::string base32_encode(std::span<const std::uint8_t> bytes);

}  // namespace otp
