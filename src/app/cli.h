#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace app {

constexpr int kExitSuccess = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsageError = 2;

// Runs `otpgen <config.json> [--time SECONDS]`. |args| holds the full command
// line including the program name. One "label code" line per configured
// token is written to |out|; usage goes to stderr and failures to the logger.
// Returns kExitSuccess, kExitConfigError for configuration or generation
// failures, or kExitUsageError for bad arguments.
int run_cli(const std::vector<std::string> &args, std::ostream &out);

}  // namespace app
