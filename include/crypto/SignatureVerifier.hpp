#pragma once

#include "crypto/TrustAnchor.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace evpn::crypto {

/**
 * Validates detached minisign signatures against a fixed, ordered set of
 * trust anchors. The signer is not named in the envelope, so every anchor is
 * tried in order and the first one that verifies wins.
 */
class SignatureVerifier {
public:
    using Signature = std::array<uint8_t, ED25519_SIGNATURE_SIZE>;

    struct Verification {
        std::vector<uint8_t> message;   // payload recovered by the verification primitive
        size_t anchorIndex = 0;
    };

    explicit SignatureVerifier(std::shared_ptr<const TrustAnchorSet> anchors);

    // Throws MalformedInput for a bad envelope, BadSignature if no anchor verifies.
    [[nodiscard]] std::vector<uint8_t> validate(std::string_view signature, std::span<const uint8_t> content) const;
    [[nodiscard]] std::string validate(std::string_view signature, std::string_view content) const;

    [[nodiscard]] Verification verify(std::string_view signature, std::span<const uint8_t> content) const;

    // Accepts a bare base64 line or a whole .minisig file.
    static Signature decodeSignature(std::string_view signature);

    [[nodiscard]] const TrustAnchorSet& anchors() const { return *anchors_; }

private:
    std::shared_ptr<const TrustAnchorSet> anchors_;
};

}
