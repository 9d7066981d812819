#include "crypto/TrustAnchor.hpp"
#include "crypto/errors.hpp"
#include "crypto/util/encoding.hpp"
#include "log/Registry.hpp"

#include <algorithm>

namespace evpn::crypto {

TrustAnchor TrustAnchor::fromMinisign(const std::string_view encoded) {
    const auto decoded = util::b64_decode(util::trim(encoded));
    if (decoded.size() != MINISIGN_PREFIX_SIZE + ED25519_PUBLIC_KEY_SIZE)
        throw MalformedInput("Invalid minisign public key length: " + std::to_string(decoded.size()));

    PublicKey key{};
    std::copy_n(decoded.begin() + MINISIGN_PREFIX_SIZE, key.size(), key.begin());
    return TrustAnchor(key);
}

std::string TrustAnchor::fingerprint() const {
    return util::hex_encode(key_.data(), 8);
}

std::shared_ptr<const TrustAnchorSet> TrustAnchorSet::fromMinisignKeys(const std::vector<std::string>& keys) {
    std::vector<TrustAnchor> anchors;
    anchors.reserve(keys.size());
    for (const auto& key : keys) anchors.push_back(TrustAnchor::fromMinisign(key));

    log::Registry::crypto()->debug("[TrustAnchorSet] Loaded {} trust anchors", anchors.size());
    return std::make_shared<const TrustAnchorSet>(std::move(anchors));
}

}
