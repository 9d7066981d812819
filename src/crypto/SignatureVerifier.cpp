#include "crypto/SignatureVerifier.hpp"
#include "crypto/errors.hpp"
#include "crypto/util/encoding.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace evpn::crypto {

namespace {

constexpr std::string_view UNTRUSTED_COMMENT = "untrusted comment:";

std::string_view signatureLine(const std::string_view text) {
    const auto trimmed = util::trim(text);
    if (!trimmed.starts_with(UNTRUSTED_COMMENT)) return trimmed;

    const auto eol = trimmed.find('\n');
    if (eol == std::string_view::npos) throw MalformedInput("Minisign file has no signature line");

    auto rest = trimmed.substr(eol + 1);
    const auto next = rest.find('\n');
    return util::trim(rest.substr(0, next));
}

}

SignatureVerifier::SignatureVerifier(std::shared_ptr<const TrustAnchorSet> anchors)
    : anchors_(std::move(anchors)) {
    if (!anchors_) throw std::invalid_argument("SignatureVerifier requires a trust anchor set");
    util::ensure_sodium_init();
}

SignatureVerifier::Signature SignatureVerifier::decodeSignature(const std::string_view signature) {
    const auto decoded = util::b64_decode(signatureLine(signature));
    if (decoded.size() != MINISIGN_PREFIX_SIZE + ED25519_SIGNATURE_SIZE)
        throw MalformedInput("Invalid minisign signature length: " + std::to_string(decoded.size()));

    Signature sig{};
    std::copy_n(decoded.begin() + MINISIGN_PREFIX_SIZE, sig.size(), sig.begin());
    return sig;
}

SignatureVerifier::Verification SignatureVerifier::verify(const std::string_view signature,
                                                          const std::span<const uint8_t> content) const {
    const auto sig = decodeSignature(signature);

    // crypto_sign_open works on the combined form and hands back the signed payload.
    std::vector<uint8_t> signedMessage;
    signedMessage.reserve(sig.size() + content.size());
    signedMessage.insert(signedMessage.end(), sig.begin(), sig.end());
    signedMessage.insert(signedMessage.end(), content.begin(), content.end());

    const auto logger = log::Registry::crypto();
    logger->debug("[SignatureVerifier] Trying {} verifiers", anchors_->size());

    std::vector<uint8_t> message(signedMessage.size());
    size_t index = 0;
    for (const auto& anchor : *anchors_) {
        unsigned long long messageLen = 0;
        if (crypto_sign_open(message.data(), &messageLen,
                             signedMessage.data(), signedMessage.size(),
                             anchor.publicKey().data()) == 0) {
            logger->debug("[SignatureVerifier] Used signature {}", anchor.fingerprint());
            message.resize(messageLen);
            return {std::move(message), index};
        }
        logger->debug("[SignatureVerifier] Skipping signature {}", anchor.fingerprint());
        ++index;
    }

    logger->warn("[SignatureVerifier] No trust anchor verified the signature ({} attempts)", index);
    throw BadSignature("Signature verification failed");
}

std::vector<uint8_t> SignatureVerifier::validate(const std::string_view signature,
                                                 const std::span<const uint8_t> content) const {
    return verify(signature, content).message;
}

std::string SignatureVerifier::validate(const std::string_view signature, const std::string_view content) const {
    const auto bytes = std::span(reinterpret_cast<const uint8_t*>(content.data()), content.size());
    const auto message = verify(signature, bytes).message;
    return {message.begin(), message.end()};
}

}
