#pragma once

#include "crypto/TrustAnchor.hpp"
#include "crypto/util/encoding.hpp"

#include <sodium.h>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace evpn::test {

// Throwaway Ed25519 signer producing minisign-formatted keys and signatures.
struct MinisignKey {
    std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> pk{};
    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> sk{};
    std::array<uint8_t, crypto::MINISIGN_KEY_ID_SIZE> keyId{};

    MinisignKey() {
        crypto::util::ensure_sodium_init();
        crypto_sign_keypair(pk.data(), sk.data());
        randombytes_buf(keyId.data(), keyId.size());
    }

    [[nodiscard]] std::string publicKey() const {
        auto blob = prefix();
        blob.insert(blob.end(), pk.begin(), pk.end());
        return crypto::util::b64_encode(blob);
    }

    [[nodiscard]] std::string sign(const std::string_view content) const {
        std::array<uint8_t, crypto_sign_BYTES> sig{};
        crypto_sign_detached(sig.data(), nullptr,
                             reinterpret_cast<const unsigned char*>(content.data()), content.size(),
                             sk.data());
        auto blob = prefix();
        blob.insert(blob.end(), sig.begin(), sig.end());
        return crypto::util::b64_encode(blob);
    }

    // Full .minisig layout as written by the minisign tool.
    [[nodiscard]] std::string signatureFile(const std::string_view content) const {
        return "untrusted comment: signature from minisign secret key\n" + sign(content) +
               "\ntrusted comment: timestamp:1700000000\tfile:server_list.json\n"
               "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA==\n";
    }

private:
    [[nodiscard]] std::vector<uint8_t> prefix() const {
        std::vector<uint8_t> out{'E', 'd'};
        out.insert(out.end(), keyId.begin(), keyId.end());
        return out;
    }
};

}
