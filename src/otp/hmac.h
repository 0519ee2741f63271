#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "otp/types.h"

namespace otp {

// Fixed-capacity digest buffer; only the first |size| bytes are meaningful.
struct HmacDigest {
    std::array<std::uint8_t, kMaxDigestLength> bytes{};
    std::size_t size = 0;

    std::span<const std::uint8_t> view() const { return std::span<const std::uint8_t>(bytes.data(), size); }
};

// OpenSSL's one-shot HMAC takes the key length as an int. Throws
// std::runtime_error when |size| does not fit.
int key_length_for_openssl(std::size_t size);

// Computes HMAC(|algorithm|, key, message) through OpenSSL. Throws
// std::runtime_error if OpenSSL fails or returns an unexpected digest size.
HmacDigest compute_hmac(Algorithm algorithm, std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> message);

}  // namespace otp
