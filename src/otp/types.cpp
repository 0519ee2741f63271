#include "otp/types.h"

#include <algorithm>
#include <cctype>

namespace otp {

const char *algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::SHA1:
            return "SHA1";
        case Algorithm::SHA256:
            return "SHA256";
        case Algorithm::SHA512:
            return "SHA512";
    }
    return "SHA1";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        if (c == '-') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (normalized == "SHA1") {
        return Algorithm::SHA1;
    }
    if (normalized == "SHA256") {
        return Algorithm::SHA256;
    }
    if (normalized == "SHA512") {
        return Algorithm::SHA512;
    }
    return std::nullopt;
}

}  // namespace otp
