#pragma once

#include <string>

namespace evpn::crypto::pkce {

constexpr size_t MIN_VERIFIER_LENGTH = 43;
constexpr size_t MAX_VERIFIER_LENGTH = 128;

// High entropy verifier over the RFC 7636 unreserved alphabet.
std::string codeVerifier(size_t length = MAX_VERIFIER_LENGTH);

// S256 transform: base64url(sha256(verifier)) without padding.
std::string codeChallenge(const std::string& verifier);

}
