#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "otp/result.h"
#include "otp/types.h"

namespace otp {

// Range accepted as a sensible OTP configuration.
constexpr int kMinimumValidDigits = 6;
constexpr int kMaximumValidDigits = 8;

// Longest timer period accepted as a sensible configuration, in seconds.
constexpr double kMaximumValidPeriod = 300.0;

// Hard limits for generate_password(). Ten digits would overflow the 31-bit
// truncated hash, zero digits make no sense.
constexpr int kMinimumDigits = 1;
constexpr int kMaximumDigits = 9;

// Advisory check for a generator configuration: 6 to 8 digits and, for timer
// factors, a period in (0, 300] seconds. The secret and algorithm are not
// inspected.
bool validate_generator(const Factor &factor, std::span<const std::uint8_t> secret, Algorithm algorithm,
                        int digits);

// Counter to feed the HMAC for |factor|. Timer factors yield
// floor(at_time / period); |at_time| is ignored for counter factors.
Result<std::uint64_t> resolve_counter(const Factor &factor, double at_time);

// RFC 4226 HOTP value for |counter|, zero-padded to exactly |digits|
// characters. Only fails with InvalidDigits, when |digits| is outside [1, 9].
Result<std::string> generate_password(Algorithm algorithm, int digits, std::span<const std::uint8_t> secret,
                                      std::uint64_t counter);

// Left-pads |value| with '0' up to |length| characters. Never truncates.
std::string pad_with_zeros(std::string value, std::size_t length);

}  // namespace otp
