#include "otp/base32.h"

#include <cctype>
#include <stdexcept>

namespace otp {
namespace {
constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int char_to_base32(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= '2' && c <= '7') {
        return 26 + (c - '2');
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    return -1;
}

}  // namespace

std::vector<std::uint8_t> base32_decode(std::string_view input) {
    std::vector<std::uint8_t> output;
    output.reserve((input.size() * 5) / 8);

    unsigned int buffer = 0;
    int bits_left = 0;
    for (char c : input) {
        if (c == '=') {
            break;
        }
        const int value = char_to_base32(c);
        if (value < 0) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                throw std::runtime_error("Invalid character in base32 secret");
            }
            continue;
        }
        buffer = ((buffer << 5) | static_cast<unsigned int>(value)) & 0xFFFF;
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            output.push_back(static_cast<std::uint8_t>((buffer >> bits_left) & 0xFF));
        }
    }

    return output;
}

std::string base32_encode(std::span<const std::uint8_t> bytes) {
    std::string output;
    output.reserve(((bytes.size() + 4) / 5) * 8);

    unsigned int buffer = 0;
    int bits_left = 0;
    for (std::uint8_t byte : bytes) {
        buffer = ((buffer << 8) | byte) & 0xFFFF;
        bits_left += 8;
        while (bits_left >= 5) {
            bits_left -= 5;
            output.push_back(kBase32Alphabet[(buffer >> bits_left) & 0x1F]);
        }
    }
    if (bits_left > 0) {
        output.push_back(kBase32Alphabet[(buffer << (5 - bits_left)) & 0x1F]);
    }
    while (output.size() % 8 != 0) {
        output.push_back('=');
    }
    return output;
}

}  // namespace otp
