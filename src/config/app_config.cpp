#include "config/app_config.h"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "otp/base32.h"
#include "otp/otpauth_uri.h"

namespace config {
namespace {
constexpr const char *kDefaultAlgorithm = "SHA1";
constexpr int kDefaultDigits = 6;
constexpr double kDefaultPeriod = 30.0;

nlohmann::json parseJsonOrThrow(const std::string &payload, const std::string &context) {
    try {
        return nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception &ex) {
        throw std::runtime_error("Failed to parse " + context + ": " + std::string(ex.what()));
    }
}

common::LogLevel parseLevelOrThrow(const std::string &name) {
    const auto level = common::parse_log_level(name);
    if (!level) {
        throw std::runtime_error("Unknown log level '" + name + "'");
    }
    return *level;
}

int parseDigitsOrThrow(const nlohmann::json &entry) {
    if (!entry.contains("digits")) {
        return kDefaultDigits;
    }
    const auto &digits = entry.at("digits");
    if (digits.is_number_unsigned()) {
        const auto value = digits.get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(value);
        }
    } else if (digits.is_number_integer()) {
        const auto value = digits.get<std::int64_t>();
        if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max()) {
            return static_cast<int>(value);
        }
    }
    throw std::runtime_error("digits must be an integer");
}

double parsePeriodOrThrow(const nlohmann::json &entry) {
    if (!entry.contains("period")) {
        return kDefaultPeriod;
    }
    const auto &period = entry.at("period");
    if (!period.is_number()) {
        throw std::runtime_error("period must be a number");
    }
    return period.get<double>();
}

}  // namespace

otp::Token parse_token(const nlohmann::json &entry) {
    if (!entry.is_object()) {
        throw std::runtime_error("token entry must be an object");
    }

    if (entry.contains("uri")) {
        const auto token = otp::parse_otpauth_uri(entry.at("uri").get<std::string>());
        if (!token) {
            throw std::runtime_error("invalid otpauth URI");
        }
        return *token;
    }

    const std::string type = entry.value("type", "totp");
    const std::string algorithm_text = entry.value("algorithm", kDefaultAlgorithm);
    const auto algorithm = otp::parse_algorithm(algorithm_text);
    if (!algorithm) {
        throw std::runtime_error("unsupported algorithm '" + algorithm_text + "'");
    }

    otp::Factor factor;
    if (type == "totp") {
        factor = otp::TimerFactor{parsePeriodOrThrow(entry)};
    } else if (type == "hotp") {
        if (entry.contains("counter") && !entry.at("counter").is_number_unsigned()) {
            throw std::runtime_error("counter must be a non-negative integer");
        }
        factor = otp::CounterFactor{entry.value("counter", std::uint64_t{0})};
    } else {
        throw std::runtime_error("unknown token type '" + type + "'");
    }

    if (!entry.contains("secret")) {
        throw std::runtime_error("missing secret");
    }
    auto secret = otp::base32_decode(entry.at("secret").get<std::string>());
    const int digits = parseDigitsOrThrow(entry);

    auto generator = otp::Generator::create(factor, std::move(secret), *algorithm, digits);
    if (!generator) {
        throw std::runtime_error("generator configuration out of range");
    }
    return otp::Token{entry.value("name", ""), entry.value("issuer", ""), std::move(*generator)};
}

AppConfig parse_config(const std::string &text) {
    const nlohmann::json document = parseJsonOrThrow(text, "configuration");
    if (!document.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    AppConfig config;
    if (document.contains("log_level")) {
        config.log_level = parseLevelOrThrow(document.at("log_level").get<std::string>());
    }

    const auto tokens = document.value("tokens", nlohmann::json::array());
    if (!tokens.is_array()) {
        throw std::runtime_error("Configuration field 'tokens' must be an array");
    }

    config.tokens.reserve(tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        try {
            config.tokens.push_back(parse_token(tokens[i]));
        } catch (const nlohmann::json::exception &ex) {
            throw std::runtime_error("Token #" + std::to_string(i) + ": " + ex.what());
        } catch (const std::runtime_error &ex) {
            throw std::runtime_error("Token #" + std::to_string(i) + ": " + ex.what());
        }
    }

    return config;
}

AppConfig load_config(const std::filesystem::path &path) {
    std::ifstream stream(path);
    if (!stream) {
        throw std::runtime_error("Unable to open configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return parse_config(buffer.str());
}

void apply_environment(AppConfig &config) {
    const char *value = std::getenv(kLogLevelEnvVar);
    if (value == nullptr || *value == '\0') {
        return;
    }
    const auto level = common::parse_log_level(value);
    if (!level) {
        LOG_WARN(std::string("Ignoring unknown ") + kLogLevelEnvVar + " value '" + value + "'");
        return;
    }
    config.log_level = *level;
}

}  // namespace config
