#include "crypto/pkce.hpp"
#include "crypto/util/encoding.hpp"

#include <sodium.h>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace evpn::crypto::pkce {

static constexpr std::string_view kUnreserved =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-._~";

std::string codeVerifier(const size_t length) {
    if (length < MIN_VERIFIER_LENGTH || length > MAX_VERIFIER_LENGTH)
        throw std::invalid_argument("PKCE code verifier length must be between 43 and 128");

    util::ensure_sodium_init();
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i)
        out.push_back(kUnreserved[randombytes_uniform(static_cast<uint32_t>(kUnreserved.size()))]);
    return out;
}

std::string codeChallenge(const std::string& verifier) {
    util::ensure_sodium_init();
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size());
    return util::b64url_encode(digest);
}

}
