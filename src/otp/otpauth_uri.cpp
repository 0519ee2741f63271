#include "otp/otpauth_uri.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <map>
#include <stdexcept>
#include <system_error>

#include "common/logging.h"
#include "otp/base32.h"

namespace otp {
namespace {
constexpr std::string_view kScheme = "otpauth://";
constexpr int kDefaultDigits = 6;
constexpr double kDefaultPeriod = 30.0;

std::string to_lower(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

std::optional<std::string> percent_decode(std::string_view text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            decoded.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        const int high = hex_value(text[i + 1]);
        const int low = hex_value(text[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        decoded.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return decoded;
}

std::string percent_encode(std::string_view text) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size());
    for (char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~' || c == '@') {
            encoded.push_back(c);
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[byte >> 4]);
            encoded.push_back(kHex[byte & 0x0F]);
        }
    }
    return encoded;
}

template <typename Number>
std::optional<Number> parse_number(std::string_view text) {
    Number value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string format_period(double period) {
    if (period == std::floor(period) && period < 1e15) {
        return std::to_string(static_cast<long long>(period));
    }
    char buffer[64];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), period);
    if (ec != std::errc()) {
        throw std::runtime_error("Unable to format TOTP period");
    }
    return std::string(buffer, end);
}

std::optional<Token> reject(const std::string &reason) {
    // The URI carries the secret, so only the reason is logged.
    LOG_WARN("Rejected otpauth URI: " + reason);
    return std::nullopt;
}

}  // namespace

std::optional<Token> parse_otpauth_uri(std::string_view uri) {
    if (uri.size() < kScheme.size() || to_lower(uri.substr(0, kScheme.size())) != kScheme) {
        return reject("scheme must be otpauth");
    }
    uri.remove_prefix(kScheme.size());

    const auto slash = uri.find('/');
    if (slash == std::string_view::npos) {
        return reject("missing label");
    }
    const std::string type = to_lower(uri.substr(0, slash));
    if (type != "totp" && type != "hotp") {
        return reject("type must be totp or hotp");
    }
    uri.remove_prefix(slash + 1);

    const auto question = uri.find('?');
    const auto raw_label = uri.substr(0, question);
    std::string_view query = question == std::string_view::npos ? std::string_view() : uri.substr(question + 1);

    if (raw_label.empty()) {
        return reject("label is empty");
    }

    std::map<std::string, std::string> parameters;
    while (!query.empty()) {
        const auto amp = query.find('&');
        const auto item = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
        if (item.empty()) {
            continue;
        }
        const auto eq = item.find('=');
        const auto key = to_lower(item.substr(0, eq));
        const auto value = percent_decode(eq == std::string_view::npos ? std::string_view() : item.substr(eq + 1));
        if (!value) {
            return reject("parameter '" + key + "' is badly encoded");
        }
        parameters[key] = *value;
    }

    // Split on the literal separator first so encoded colons stay part of
    // the issuer or account. Spaces following the separator are dropped.
    const auto colon = raw_label.find(':');
    const bool has_issuer = colon != std::string_view::npos;
    const auto decoded_name = percent_decode(has_issuer ? raw_label.substr(colon + 1) : raw_label);
    const auto decoded_issuer = percent_decode(has_issuer ? raw_label.substr(0, colon) : std::string_view());
    if (!decoded_name || !decoded_issuer) {
        return reject("label is badly encoded");
    }
    std::string name = *decoded_name;
    std::string issuer = *decoded_issuer;
    if (has_issuer) {
        name.erase(0, std::min(name.find_first_not_of(' '), name.size()));
    }
    if (const auto it = parameters.find("issuer"); it != parameters.end() && !it->second.empty()) {
        issuer = it->second;
    }

    const auto secret_it = parameters.find("secret");
    if (secret_it == parameters.end() || secret_it->second.empty()) {
        return reject("secret parameter is required");
    }
    std::vector<std::uint8_t> secret;
    try {
        secret = base32_decode(secret_it->second);
    } catch (const std::runtime_error &ex) {
        return reject(ex.what());
    }

    Algorithm algorithm = Algorithm::SHA1;
    if (const auto it = parameters.find("algorithm"); it != parameters.end()) {
        const auto parsed = parse_algorithm(it->second);
        if (!parsed) {
            return reject("unsupported algorithm '" + it->second + "'");
        }
        algorithm = *parsed;
    }

    int digits = kDefaultDigits;
    if (const auto it = parameters.find("digits"); it != parameters.end()) {
        const auto parsed = parse_number<int>(it->second);
        if (!parsed) {
            return reject("digits must be an integer");
        }
        digits = *parsed;
    }

    Factor factor;
    if (type == "totp") {
        double period = kDefaultPeriod;
        if (const auto it = parameters.find("period"); it != parameters.end()) {
            const auto parsed = parse_number<double>(it->second);
            if (!parsed) {
                return reject("period must be a number");
            }
            period = *parsed;
        }
        factor = TimerFactor{period};
    } else {
        std::uint64_t counter = 0;
        if (const auto it = parameters.find("counter"); it != parameters.end()) {
            const auto parsed = parse_number<std::uint64_t>(it->second);
            if (!parsed) {
                return reject("counter must be an unsigned integer");
            }
            counter = *parsed;
        }
        factor = CounterFactor{counter};
    }

    auto generator = Generator::create(factor, std::move(secret), algorithm, digits);
    if (!generator) {
        return reject("generator configuration out of range");
    }
    return Token{std::move(name), std::move(issuer), std::move(*generator)};
}

std::string to_otpauth_uri(const Token &token) {
    const Generator &generator = token.generator;

    std::string uri(kScheme);
    uri += std::holds_alternative<TimerFactor>(generator.factor()) ? "totp/" : "hotp/";
    if (!token.issuer.empty()) {
        uri += percent_encode(token.issuer) + ":";
    }
    uri += percent_encode(token.name);

    std::string secret = base32_encode(generator.secret());
    secret.erase(secret.find_last_not_of('=') + 1);

    uri += "?secret=" + secret;
    uri += "&algorithm=" + std::string(algorithm_name(generator.algorithm()));
    uri += "&digits=" + std::to_string(generator.digits());
    std::visit(Overloaded{
                   [&uri](const CounterFactor &counter) { uri += "&counter=" + std::to_string(counter.value); },
                   [&uri](const TimerFactor &timer) { uri += "&period=" + format_period(timer.period); },
               },
               generator.factor());
    if (!token.issuer.empty()) {
        uri += "&issuer=" + percent_encode(token.issuer);
    }
    return uri;
}

}  // namespace otp
