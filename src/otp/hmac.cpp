#include "otp/hmac.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace otp {
namespace {

static_assert(kMaxDigestLength <= EVP_MAX_MD_SIZE, "digest buffer exceeds OpenSSL maximum");

const EVP_MD *digest_for(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::SHA1:
            return EVP_sha1();
        case Algorithm::SHA256:
            return EVP_sha256();
        case Algorithm::SHA512:
            return EVP_sha512();
    }
    throw std::invalid_argument("Unsupported HMAC algorithm");
}

}  // namespace

int key_length_for_openssl(std::size_t size) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("HMAC key of " + std::to_string(size) + " bytes exceeds OpenSSL limit");
    }
    return static_cast<int>(size);
}

HmacDigest compute_hmac(Algorithm algorithm, std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> message) {
    // OpenSSL rejects a null key pointer, even with zero length.
    static const std::uint8_t kEmptyKey = 0;
    const void *key_data = key.empty() ? static_cast<const void *>(&kEmptyKey) : key.data();
    const int key_len = key_length_for_openssl(key.size());

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;
    if (HMAC(digest_for(algorithm), key_data, key_len, message.data(), message.size(),
             hash.data(), &hash_len) == nullptr) {
        throw std::runtime_error(std::string("Unable to compute HMAC-") + algorithm_name(algorithm));
    }
    if (hash_len != digest_length(algorithm)) {
        throw std::runtime_error("Unexpected HMAC-" + std::string(algorithm_name(algorithm)) +
                                 " digest length " + std::to_string(hash_len));
    }

    HmacDigest digest;
    std::copy(hash.begin(), hash.begin() + hash_len, digest.bytes.begin());
    digest.size = hash_len;
    return digest;
}

}  // namespace otp
