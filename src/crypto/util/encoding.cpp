#include "crypto/util/encoding.hpp"
#include "crypto/errors.hpp"

#include <sodium.h>
#include <cstring>
#include <stdexcept>

namespace evpn::crypto::util {

void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

static std::string encode(const std::vector<uint8_t>& data, const int variant) {
    ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), variant);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      variant);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    return encode(data, sodium_base64_VARIANT_ORIGINAL);
}

std::string b64url_encode(const std::vector<uint8_t>& data) {
    return encode(data, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::vector<uint8_t> b64_decode(const std::string_view b64) {
    ensure_sodium_init();
    if (b64.empty()) throw MalformedInput("Empty base64 input");

    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.data(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        throw MalformedInput("Invalid base64 input");
    }
    decoded.resize(out_len);
    return decoded;
}

std::string hex_encode(const uint8_t* data, const size_t len) {
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}
