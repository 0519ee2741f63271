#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace otp {

// Keyed-hash function used for HMAC. RFC 4226 only defines SHA-1, RFC 6238
// extends TOTP to SHA-256 and SHA-512.
enum class Algorithm {
    SHA1,
    SHA256,
    SHA512,
};

// Largest digest produced by any supported algorithm (SHA-512).
constexpr std::size_t kMaxDigestLength = 64;

constexpr std::size_t digest_length(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::SHA1:
            return 20;
        case Algorithm::SHA256:
            return 32;
        case Algorithm::SHA512:
            return 64;
    }
    return 0;
}

// Canonical upper-case name as used in otpauth URIs ("SHA1", "SHA256", "SHA512").
const char *algorithm_name(Algorithm algorithm);

// Case-insensitive inverse of algorithm_name(). "SHA-1" style spellings are
// accepted as well.
std::optional<Algorithm> parse_algorithm(std::string_view name);

// Explicit moving factor (HOTP).
struct CounterFactor {
    std::uint64_t value = 0;

    bool operator==(const CounterFactor &) const = default;
};

// Time step in seconds (TOTP).
struct TimerFactor {
    double period = 30.0;

    bool operator==(const TimerFactor &) const = default;
};

// Source of the counter fed to the HMAC step.
using Factor = std::variant<CounterFactor, TimerFactor>;

template <typename... Handlers>
struct Overloaded : Handlers... {
    using Handlers::operator()...;
};
template <typename... Handlers>
Overloaded(Handlers...) -> Overloaded<Handlers...>;

}  // namespace otp
