#include "otp/generator.h"

#include <utility>

#include "common/logging.h"
#include "otp/generator_functions.h"

namespace otp {

Generator::Generator(Factor factor, std::vector<std::uint8_t> secret, Algorithm algorithm, int digits)
    : factor_(std::move(factor)), secret_(std::move(secret)), algorithm_(algorithm), digits_(digits) {}

std::optional<Generator> Generator::create(Factor factor, std::vector<std::uint8_t> secret, Algorithm algorithm,
                                           int digits) {
    if (!validate_generator(factor, secret, algorithm, digits)) {
        LOG_DEBUG("Rejected generator configuration (" + std::string(algorithm_name(algorithm)) + ", " +
                  std::to_string(digits) + " digits)");
        return std::nullopt;
    }
    return Generator(std::move(factor), std::move(secret), algorithm, digits);
}

Result<std::string> Generator::password(double at_time) const {
    const auto counter = resolve_counter(factor_, at_time);
    if (!counter) {
        return counter.error();
    }
    return generate_password(algorithm_, digits_, secret_, counter.value());
}

Result<std::string> Generator::password(std::chrono::system_clock::time_point at) const {
    return password(std::chrono::duration<double>(at.time_since_epoch()).count());
}

Generator Generator::successor() const {
    const Factor next = std::visit(Overloaded{
                                       [](const CounterFactor &counter) -> Factor {
                                           return CounterFactor{counter.value + 1};
                                       },
                                       [](const TimerFactor &timer) -> Factor { return timer; },
                                   },
                                   factor_);
    return Generator(next, secret_, algorithm_, digits_);
}

Result<std::string> Token::current_password(std::chrono::system_clock::time_point now) const {
    return generator.password(now);
}

std::string Token::label() const {
    if (issuer.empty()) {
        return name;
    }
    return issuer + ":" + name;
}

}  // namespace otp
