#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace evpn::crypto {

// Minisign envelope: <signature_algorithm(2)> || <key_id(8)> || <material>
constexpr size_t MINISIGN_ALG_SIZE = 2;
constexpr size_t MINISIGN_KEY_ID_SIZE = 8;
constexpr size_t MINISIGN_PREFIX_SIZE = MINISIGN_ALG_SIZE + MINISIGN_KEY_ID_SIZE;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

class TrustAnchor {
public:
    using PublicKey = std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>;

    explicit TrustAnchor(const PublicKey& key) : key_(key) {}

    // Throws MalformedInput unless the blob decodes to exactly prefix + 32 bytes.
    static TrustAnchor fromMinisign(std::string_view encoded);

    [[nodiscard]] const PublicKey& publicKey() const { return key_; }

    // Short hex id for diagnostics only.
    [[nodiscard]] std::string fingerprint() const;

private:
    PublicKey key_;
};

class TrustAnchorSet {
public:
    TrustAnchorSet() = default;
    explicit TrustAnchorSet(std::vector<TrustAnchor> anchors) : anchors_(std::move(anchors)) {}

    // Decodes every key up front; a single malformed key fails the whole set.
    static std::shared_ptr<const TrustAnchorSet> fromMinisignKeys(const std::vector<std::string>& keys);

    [[nodiscard]] size_t size() const { return anchors_.size(); }
    [[nodiscard]] bool empty() const { return anchors_.empty(); }

    [[nodiscard]] std::vector<TrustAnchor>::const_iterator begin() const { return anchors_.begin(); }
    [[nodiscard]] std::vector<TrustAnchor>::const_iterator end() const { return anchors_.end(); }

private:
    std::vector<TrustAnchor> anchors_;
};

}
