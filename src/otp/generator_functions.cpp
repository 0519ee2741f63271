#include "otp/generator_functions.h"

#include <array>
#include <cmath>
#include <stdexcept>

#include "otp/hmac.h"

namespace otp {
namespace {

// 2^64 as a double; quotients at or above this do not fit a uint64.
constexpr double kCounterLimit = 18446744073709551616.0;

constexpr std::array<std::uint32_t, kMaximumDigits + 1> kPowersOfTen = {
    1u, 10u, 100u, 1000u, 10000u, 100000u, 1000000u, 10000000u, 100000000u, 1000000000u,
};

std::array<std::uint8_t, sizeof(std::uint64_t)> encode_big_endian(std::uint64_t value) {
    std::array<std::uint8_t, sizeof(std::uint64_t)> bytes{};
    for (int i = static_cast<int>(bytes.size()) - 1; i >= 0; --i) {
        bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return bytes;
}

std::uint32_t read_big_endian_u32(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 4) {
        throw std::out_of_range("Truncation window shorter than four bytes");
    }
    return (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
}

bool valid_digits(int digits) {
    return kMinimumValidDigits <= digits && digits <= kMaximumValidDigits;
}

bool valid_period(double period) {
    return 0.0 < period && period <= kMaximumValidPeriod;
}

}  // namespace

const char *to_string(GenerationError error) {
    switch (error) {
        case GenerationError::InvalidTime:
            return "invalid time";
        case GenerationError::InvalidPeriod:
            return "invalid period";
        case GenerationError::InvalidDigits:
            return "invalid digits";
    }
    return "unknown error";
}

bool validate_generator(const Factor &factor, std::span<const std::uint8_t> /*secret*/, Algorithm /*algorithm*/,
                        int digits) {
    return std::visit(Overloaded{
                          [digits](const CounterFactor &) { return valid_digits(digits); },
                          [digits](const TimerFactor &timer) {
                              return valid_digits(digits) && valid_period(timer.period);
                          },
                      },
                      factor);
}

Result<std::uint64_t> resolve_counter(const Factor &factor, double at_time) {
    return std::visit(Overloaded{
                          [](const CounterFactor &counter) -> Result<std::uint64_t> { return counter.value; },
                          [at_time](const TimerFactor &timer) -> Result<std::uint64_t> {
                              // Written as negations so NaN fails the checks.
                              if (!(at_time >= 0.0)) {
                                  return GenerationError::InvalidTime;
                              }
                              if (!(timer.period > 0.0)) {
                                  return GenerationError::InvalidPeriod;
                              }
                              const double steps = std::floor(at_time / timer.period);
                              if (!(steps < kCounterLimit)) {
                                  return GenerationError::InvalidTime;
                              }
                              return static_cast<std::uint64_t>(steps);
                          },
                      },
                      factor);
}

Result<std::string> generate_password(Algorithm algorithm, int digits, std::span<const std::uint8_t> secret,
                                      std::uint64_t counter) {
    if (digits < kMinimumDigits || digits > kMaximumDigits) {
        return GenerationError::InvalidDigits;
    }

    const auto message = encode_big_endian(counter);
    const HmacDigest hash = compute_hmac(algorithm, secret, message);
    const auto bytes = hash.view();

    // Dynamic truncation (RFC 4226 section 5.3). Every supported digest is at
    // least 20 bytes, so offset + 4 never exceeds the buffer.
    const std::size_t offset = bytes.back() & 0x0F;
    if (offset + 4 > bytes.size()) {
        throw std::out_of_range("Truncation offset beyond HMAC digest");
    }
    std::uint32_t truncated = read_big_endian_u32(bytes.subspan(offset, 4));
    truncated &= 0x7FFFFFFF;
    truncated %= kPowersOfTen[static_cast<std::size_t>(digits)];

    return pad_with_zeros(std::to_string(truncated), static_cast<std::size_t>(digits));
}

std::string pad_with_zeros(std::string value, std::size_t length) {
    if (value.size() >= length) {
        return value;
    }
    value.insert(0, length - value.size(), '0');
    return value;
}

}  // namespace otp
