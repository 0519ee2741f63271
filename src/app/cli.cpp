#include "app/cli.h"

#include <charconv>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>

#include "common/logging.h"
#include "config/app_config.h"
#include "otp/generator.h"

namespace app {
namespace {

void printUsage(const std::string &program) {
    std::cerr << "Usage: " << program << " <config.json> [--time SECONDS]" << std::endl;
}

std::optional<double> parseSeconds(std::string_view text) {
    double value = 0.0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

int run_cli(const std::vector<std::string> &args, std::ostream &out) {
    const std::string program = args.empty() ? "otpgen" : args.front();
    std::optional<std::string> config_path;
    std::optional<double> at_time;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(program);
            return kExitSuccess;
        }
        if (arg == "--time") {
            if (i + 1 >= args.size()) {
                printUsage(program);
                return kExitUsageError;
            }
            at_time = parseSeconds(args[++i]);
            if (!at_time) {
                LOG_ERROR("Invalid --time value: " + args[i]);
                return kExitUsageError;
            }
            continue;
        }
        if (config_path) {
            printUsage(program);
            return kExitUsageError;
        }
        config_path = arg;
    }

    if (!config_path) {
        printUsage(program);
        return kExitUsageError;
    }

    config::AppConfig app_config;
    try {
        app_config = config::load_config(*config_path);
    } catch (const std::exception &ex) {
        LOG_ERROR(ex.what());
        return kExitConfigError;
    }
    config::apply_environment(app_config);
    common::Logger::instance().setMinimumLevel(app_config.log_level);
    LOG_DEBUG("Loaded " + std::to_string(app_config.tokens.size()) + " token(s) from " + *config_path);

    const double now = at_time.value_or(
        std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count());

    int status = kExitSuccess;
    for (const auto &token : app_config.tokens) {
        const auto password = token.generator.password(now);
        if (!password) {
            LOG_ERROR("Unable to generate password for " + token.label() + ": " + otp::to_string(password.error()));
            status = kExitConfigError;
            continue;
        }
        out << token.label() << ' ' << password.value() << '\n';
    }
    return status;
}

}  // namespace app
