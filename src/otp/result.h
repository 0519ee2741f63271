#pragma once

#include <utility>
#include <variant>

namespace otp {

enum class GenerationError {
    InvalidTime,    // negative (or non-representable) timestamp for a timer factor
    InvalidPeriod,  // zero or negative timer period
    InvalidDigits,  // digit count outside the [1, 9] range a uint32 can hold
};

const char *to_string(GenerationError error);

// Outcome of a generation step: either the value or the reason it could not
// be produced. Never carries a partial value.
template <typename T>
class Result {
  public:
    Result(T value) : state_(std::move(value)) {}
    Result(GenerationError error) : state_(error) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    // Throws std::bad_variant_access when called on a failed result.
    [[nodiscard]] const T &value() const { return std::get<T>(state_); }
    [[nodiscard]] GenerationError error() const { return std::get<GenerationError>(state_); }

    bool operator==(const Result &) const = default;

  private:
    std::variant<T, GenerationError> state_;
};

}  // namespace otp
