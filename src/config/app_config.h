#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/logging.h"
#include "otp/generator.h"

namespace config {

// Environment variable that overrides the configured log level.
constexpr const char *kLogLevelEnvVar = "OTPGEN_LOG_LEVEL";

struct AppConfig {
    common::LogLevel log_level{common::LogLevel::Info};
    std::vector<otp::Token> tokens;
};

// Parses a JSON configuration document. Every entry of "tokens" is either an
// {"uri": "otpauth://..."} object or an explicit description:
//   {"name", "issuer", "type": "totp"|"hotp", "secret" (Base32),
//    "algorithm", "digits", "period", "counter"}
// Throws std::runtime_error naming the offending entry when the document is
// malformed or a token fails generator validation.
AppConfig parse_config(const std::string &text);

// Reads and parses the configuration stored at |path|.
AppConfig load_config(const std::filesystem::path &path);

// Applies OTPGEN_LOG_LEVEL when it is set to a recognised level name.
void apply_environment(AppConfig &config);

// Builds one token from an entry of the "tokens" array. Integral fields are
// range-checked before conversion. Throws std::runtime_error (or a
// nlohmann::json::exception for mistyped string fields) on invalid entries.
otp::Token parse_token(const nlohmann::json &entry);

}  // namespace config
