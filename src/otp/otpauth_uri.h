#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "otp/generator.h"

namespace otp {

// Parses a Key URI of the form
//   otpauth://TYPE/LABEL?secret=SECRET&issuer=ISSUER&algorithm=ALGO&digits=N&period=P&counter=C
// TYPE is "totp" or "hotp", LABEL is "issuer:account" or "account" and the
// secret is Base32. Omitted parameters default to SHA1, 6 digits, a 30 second
// period and a zero counter. An explicit issuer parameter overrides the label
// prefix. Returns std::nullopt (with a warning logged) for malformed URIs and
// for configurations rejected by validate_generator().
std::optional<Token> parse_otpauth_uri(std::string_view uri);

// Serializes |token| back into an otpauth URI. Parsing the result yields an
// equal token, except that leading spaces of an account name are dropped when
// the token has an issuer.
std::string to_otpauth_uri(const Token &token);

}  // namespace otp
