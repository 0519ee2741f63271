#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "otp/result.h"
#include "otp/types.h"

namespace otp {

// Generator bundles everything needed to produce passwords for one account:
// the moving factor, the shared secret, the hash algorithm and the code width.
// Instances can only be obtained through create(), which rejects
// configurations that fail validate_generator().
class Generator {
  public:
    static std::optional<Generator> create(Factor factor, std::vector<std::uint8_t> secret, Algorithm algorithm,
                                           int digits);

    const Factor &factor() const { return factor_; }
    const std::vector<std::uint8_t> &secret() const { return secret_; }
    Algorithm algorithm() const { return algorithm_; }
    int digits() const { return digits_; }

    // Password at |at_time| seconds since the Unix epoch. Counter factors
    // ignore the time.
    Result<std::string> password(double at_time) const;
    Result<std::string> password(std::chrono::system_clock::time_point at) const;

    // Generator for the next HOTP value. The counter wraps modulo 2^64.
    // Timer-based generators are returned unchanged.
    [[nodiscard]] Generator successor() const;

    bool operator==(const Generator &) const = default;

  private:
    Generator(Factor factor, std::vector<std::uint8_t> secret, Algorithm algorithm, int digits);

    Factor factor_;
    std::vector<std::uint8_t> secret_;
    Algorithm algorithm_;
    int digits_;
};

// A generator together with the account it belongs to.
struct Token {
    std::string name;
    std::string issuer;
    Generator generator;

    Result<std::string> current_password(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    // "issuer:name", or just the name when there is no issuer.
    std::string label() const;

    bool operator==(const Token &) const = default;
};

}  // namespace otp
