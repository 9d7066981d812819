#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace evpn::crypto::util {

// Idempotent, safe to call from every entry point that touches libsodium.
void ensure_sodium_init();

std::string b64_encode(const std::vector<uint8_t>& data);

// URL-safe alphabet, no padding (RFC 4648 §5).
std::string b64url_encode(const std::vector<uint8_t>& data);

// Throws crypto::MalformedInput on anything that is not strict standard base64.
std::vector<uint8_t> b64_decode(std::string_view b64);

std::string hex_encode(const uint8_t* data, size_t len);

std::string_view trim(std::string_view s);

}
