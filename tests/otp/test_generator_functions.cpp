#include "otp/generator_functions.h"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace {

bool Expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << message << std::endl;
    }
    return condition;
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

const std::vector<std::uint8_t> kRfcSecretSha1 = Bytes("12345678901234567890");
const std::vector<std::uint8_t> kRfcSecretSha256 = Bytes("12345678901234567890123456789012");
const std::vector<std::uint8_t> kRfcSecretSha512 =
    Bytes("1234567890123456789012345678901234567890123456789012345678901234");

bool ExpectPassword(otp::Algorithm algorithm, int digits, const std::vector<std::uint8_t>& secret,
                    std::uint64_t counter, const std::string& expected) {
    const auto result = otp::generate_password(algorithm, digits, secret, counter);
    if (!result) {
        std::cerr << "generate_password failed for counter " << counter << ": " << otp::to_string(result.error())
                  << std::endl;
        return false;
    }
    return Expect(result.value() == expected, "Counter " + std::to_string(counter) + " produced " +
                                                  result.value() + ", expected " + expected);
}

bool TestRfc4226Vectors() {
    const char* expected[] = {"755224", "287082", "359152", "969429", "338314",
                              "254676", "287922", "162583", "399871", "520489"};
    bool success = true;
    for (std::uint64_t counter = 0; counter < 10; ++counter) {
        success &= ExpectPassword(otp::Algorithm::SHA1, 6, kRfcSecretSha1, counter, expected[counter]);
    }
    return success;
}

bool TestRfc6238Vectors() {
    struct Vector {
        double time;
        const char* sha1;
        const char* sha256;
        const char* sha512;
    };
    const Vector vectors[] = {
        {59.0, "94287082", "46119246", "90693936"},
        {1111111109.0, "07081804", "68084774", "25091201"},
        {1234567890.0, "89005924", "91819424", "93441116"},
        {2000000000.0, "69279037", "90698825", "38618901"},
        {20000000000.0, "65353130", "77737706", "47863826"},
    };

    bool success = true;
    for (const auto& vector : vectors) {
        const auto counter = otp::resolve_counter(otp::TimerFactor{30.0}, vector.time);
        if (!Expect(counter.ok(), "Unable to resolve TOTP counter")) {
            return false;
        }
        success &= ExpectPassword(otp::Algorithm::SHA1, 8, kRfcSecretSha1, counter.value(), vector.sha1);
        success &= ExpectPassword(otp::Algorithm::SHA256, 8, kRfcSecretSha256, counter.value(), vector.sha256);
        success &= ExpectPassword(otp::Algorithm::SHA512, 8, kRfcSecretSha512, counter.value(), vector.sha512);
    }
    return success;
}

bool TestPasswordLengthForEveryDigitCount() {
    bool success = true;
    for (int digits = otp::kMinimumDigits; digits <= otp::kMaximumDigits; ++digits) {
        for (std::uint64_t counter = 0; counter < 32; ++counter) {
            const auto result = otp::generate_password(otp::Algorithm::SHA256, digits, kRfcSecretSha1, counter);
            if (!Expect(result.ok(), "generate_password rejected " + std::to_string(digits) + " digits")) {
                return false;
            }
            const std::string& password = result.value();
            bool all_digits = true;
            for (char c : password) {
                all_digits &= std::isdigit(static_cast<unsigned char>(c)) != 0;
            }
            success &= Expect(password.size() == static_cast<std::size_t>(digits) && all_digits,
                              "Unexpected password '" + password + "' for " + std::to_string(digits) + " digits");
        }
    }
    return success;
}

bool TestRejectsDigitsOutsideHardLimit() {
    bool success = true;
    for (int digits : {-1, 0, 10, 11, 100}) {
        const auto result = otp::generate_password(otp::Algorithm::SHA1, digits, kRfcSecretSha1, 0);
        success &= Expect(!result.ok() && result.error() == otp::GenerationError::InvalidDigits,
                          "generate_password accepted " + std::to_string(digits) + " digits");
    }
    return success;
}

bool TestShortCodesArePadded() {
    // Counter 0 truncates to 1284755224; keeping the last digit yields "4"
    // and the seven-digit remainder is 4755224.
    bool success = ExpectPassword(otp::Algorithm::SHA1, 1, kRfcSecretSha1, 0, "4");
    success &= ExpectPassword(otp::Algorithm::SHA1, 7, kRfcSecretSha1, 0, "4755224");
    success &= ExpectPassword(otp::Algorithm::SHA1, 9, kRfcSecretSha1, 0, "284755224");
    success &= Expect(otp::pad_with_zeros("42", 6) == "000042", "pad_with_zeros did not pad");
    success &= Expect(otp::pad_with_zeros("1234567", 6) == "1234567", "pad_with_zeros truncated");
    success &= Expect(otp::pad_with_zeros("", 3) == "000", "pad_with_zeros mishandled empty input");
    return success;
}

bool TestEmptySecret() {
    const std::vector<std::uint8_t> empty;
    const auto first = otp::generate_password(otp::Algorithm::SHA1, 6, empty, 1);
    const auto second = otp::generate_password(otp::Algorithm::SHA1, 6, empty, 1);
    return Expect(first.ok() && first == second && first.value().size() == 6,
                  "Empty secret did not produce a stable password");
}

bool TestIdempotence() {
    bool success = true;
    for (auto algorithm : {otp::Algorithm::SHA1, otp::Algorithm::SHA256, otp::Algorithm::SHA512}) {
        const auto first = otp::generate_password(algorithm, 8, kRfcSecretSha512, 123456789);
        const auto second = otp::generate_password(algorithm, 8, kRfcSecretSha512, 123456789);
        success &= Expect(first.ok() && first == second, "Repeated generation differed");
    }
    return success;
}

bool TestResolveCounterFactor() {
    bool success = true;
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    for (std::uint64_t value : {std::uint64_t{0}, std::uint64_t{7}, max}) {
        for (double time : {-100.0, 0.0, 59.0, std::nan("")}) {
            const auto counter = otp::resolve_counter(otp::CounterFactor{value}, time);
            success &= Expect(counter.ok() && counter.value() == value, "Counter factor was not passed through");
        }
    }
    return success;
}

bool TestResolveTimerFactor() {
    bool success = true;
    const otp::Factor thirty = otp::TimerFactor{30.0};

    auto counter = otp::resolve_counter(thirty, 59.0);
    success &= Expect(counter.ok() && counter.value() == 1, "Timer(30) at 59 should be 1");
    counter = otp::resolve_counter(thirty, 60.0);
    success &= Expect(counter.ok() && counter.value() == 2, "Timer(30) at 60 should be 2");
    counter = otp::resolve_counter(thirty, 0.0);
    success &= Expect(counter.ok() && counter.value() == 0, "Timer(30) at 0 should be 0");
    counter = otp::resolve_counter(otp::TimerFactor{0.5}, 10.25);
    success &= Expect(counter.ok() && counter.value() == 20, "Fractional periods should floor");
    counter = otp::resolve_counter(otp::TimerFactor{1000.0}, 59.0);
    success &= Expect(counter.ok() && counter.value() == 0, "Periods above 300s still resolve");
    return success;
}

bool TestResolveTimerErrors() {
    bool success = true;
    for (double period : {0.0, -1.0, -30.0}) {
        const auto counter = otp::resolve_counter(otp::TimerFactor{period}, 59.0);
        success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidPeriod,
                          "Non-positive period was not rejected");
    }
    for (double time : {-1.0, -0.001, -1e9}) {
        const auto counter = otp::resolve_counter(otp::TimerFactor{30.0}, time);
        success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidTime,
                          "Negative time was not rejected");
    }

    // Time is checked before the period.
    auto counter = otp::resolve_counter(otp::TimerFactor{0.0}, -5.0);
    success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidTime,
                      "Negative time should win over invalid period");

    counter = otp::resolve_counter(otp::TimerFactor{30.0}, std::nan(""));
    success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidTime, "NaN time accepted");
    counter = otp::resolve_counter(otp::TimerFactor{std::nan("")}, 30.0);
    success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidPeriod,
                      "NaN period accepted");
    counter = otp::resolve_counter(otp::TimerFactor{1e-300}, 1e300);
    success &= Expect(!counter.ok() && counter.error() == otp::GenerationError::InvalidTime,
                      "Counter overflow was not rejected");
    return success;
}

bool TestValidateGenerator() {
    const otp::Factor counter = otp::CounterFactor{0};
    const otp::Factor timer = otp::TimerFactor{30.0};
    bool success = true;

    for (int digits : {6, 7, 8}) {
        success &= Expect(otp::validate_generator(counter, kRfcSecretSha1, otp::Algorithm::SHA1, digits),
                          "Counter generator with " + std::to_string(digits) + " digits rejected");
        success &= Expect(otp::validate_generator(timer, kRfcSecretSha1, otp::Algorithm::SHA512, digits),
                          "Timer generator with " + std::to_string(digits) + " digits rejected");
    }
    for (int digits : {0, 5, 9, 10}) {
        success &= Expect(!otp::validate_generator(counter, kRfcSecretSha1, otp::Algorithm::SHA1, digits),
                          "Counter generator with " + std::to_string(digits) + " digits accepted");
        success &= Expect(!otp::validate_generator(timer, kRfcSecretSha1, otp::Algorithm::SHA1, digits),
                          "Timer generator with " + std::to_string(digits) + " digits accepted");
    }

    for (double period : {1.0, 0.5, 30.0, 300.0}) {
        success &= Expect(otp::validate_generator(otp::TimerFactor{period}, {}, otp::Algorithm::SHA1, 6),
                          "Period " + std::to_string(period) + " rejected");
    }
    for (double period : {0.0, -30.0, 300.5, 301.0}) {
        success &= Expect(!otp::validate_generator(otp::TimerFactor{period}, {}, otp::Algorithm::SHA1, 6),
                          "Period " + std::to_string(period) + " accepted");
    }
    return success;
}

bool TestValidatorAndGeneratorRangesAreIndependent() {
    const bool rejected = !otp::validate_generator(otp::CounterFactor{0}, kRfcSecretSha1, otp::Algorithm::SHA1, 9);
    const auto generated = otp::generate_password(otp::Algorithm::SHA1, 9, kRfcSecretSha1, 0);
    return Expect(rejected && generated.ok(), "Nine digits should fail validation but still generate");
}

}  // namespace

int main() {
    bool success = true;
    success &= TestRfc4226Vectors();
    success &= TestRfc6238Vectors();
    success &= TestPasswordLengthForEveryDigitCount();
    success &= TestRejectsDigitsOutsideHardLimit();
    success &= TestShortCodesArePadded();
    success &= TestEmptySecret();
    success &= TestIdempotence();
    success &= TestResolveCounterFactor();
    success &= TestResolveTimerFactor();
    success &= TestResolveTimerErrors();
    success &= TestValidateGenerator();
    success &= TestValidatorAndGeneratorRangesAreIndependent();
    return success ? 0 : 1;
}
