#include <gtest/gtest.h>
#include "MinisignFixture.hpp"
#include "crypto/SignatureVerifier.hpp"
#include "crypto/errors.hpp"
#include "config/Config.hpp"

using namespace evpn::crypto;
using evpn::test::MinisignKey;

class SignatureVerifierTest : public ::testing::Test {
protected:
    MinisignKey a, b, c;
    const std::string content = R"({"server_list":[{"server_type":"institute_access"}]})";

    static SignatureVerifier verifierFor(const std::vector<std::string>& keys) {
        return SignatureVerifier(TrustAnchorSet::fromMinisignKeys(keys));
    }
};

TEST_F(SignatureVerifierTest, AcceptsSignatureFromSecondAnchor) {
    const auto verifier = verifierFor({a.publicKey(), b.publicKey()});
    const auto result = verifier.verify(b.sign(content), std::span(reinterpret_cast<const uint8_t*>(content.data()), content.size()));
    EXPECT_EQ(result.anchorIndex, 1u);
    EXPECT_EQ(std::string(result.message.begin(), result.message.end()), content);
}

TEST_F(SignatureVerifierTest, ValidateReturnsPayload) {
    const auto verifier = verifierFor({a.publicKey()});
    EXPECT_EQ(verifier.validate(a.sign(content), std::string_view(content)), content);
}

TEST_F(SignatureVerifierTest, RejectsSignatureFromUntrustedKey) {
    const auto verifier = verifierFor({a.publicKey(), b.publicKey()});
    EXPECT_THROW((void)verifier.validate(c.sign(content), std::string_view(content)), BadSignature);
}

TEST_F(SignatureVerifierTest, RejectsTamperedContent) {
    const auto verifier = verifierFor({a.publicKey()});
    const auto sig = a.sign(content);
    auto tampered = content;
    tampered.back() = ']';
    EXPECT_THROW((void)verifier.validate(sig, std::string_view(tampered)), BadSignature);
}

TEST_F(SignatureVerifierTest, AnchorOrderDoesNotChangeOutcome) {
    const auto sig = c.sign(content);
    const std::vector<std::vector<std::string>> orders = {
        {a.publicKey(), b.publicKey(), c.publicKey()},
        {c.publicKey(), a.publicKey(), b.publicKey()},
        {b.publicKey(), c.publicKey(), a.publicKey()},
    };
    for (const auto& keys : orders)
        EXPECT_EQ(verifierFor(keys).validate(sig, std::string_view(content)), content);
}

TEST_F(SignatureVerifierTest, EmptyAnchorSetRejectsEverything) {
    const auto verifier = verifierFor({});
    EXPECT_TRUE(verifier.anchors().empty());
    EXPECT_THROW((void)verifier.validate(a.sign(content), std::string_view(content)), BadSignature);
}

TEST_F(SignatureVerifierTest, MalformedBase64IsNotABadSignature) {
    const auto verifier = verifierFor({a.publicKey()});
    EXPECT_THROW((void)verifier.validate("not base64 at all!", std::string_view(content)), MalformedInput);
    EXPECT_THROW((void)verifier.validate("", std::string_view(content)), MalformedInput);
}

TEST_F(SignatureVerifierTest, WrongLengthEnvelopeIsMalformed) {
    const auto verifier = verifierFor({a.publicKey()});
    // A public key blob is valid base64 but 42 bytes, not 74
    EXPECT_THROW((void)verifier.validate(a.publicKey(), std::string_view(content)), MalformedInput);
}

TEST_F(SignatureVerifierTest, AcceptsMinisigFile) {
    const auto verifier = verifierFor({b.publicKey(), a.publicKey()});
    EXPECT_EQ(verifier.validate(a.signatureFile(content), std::string_view(content)), content);
}

TEST_F(SignatureVerifierTest, SurroundingWhitespaceIsIgnored) {
    const auto verifier = verifierFor({a.publicKey()});
    EXPECT_EQ(verifier.validate("  " + a.sign(content) + "\n", std::string_view(content)), content);
}

TEST_F(SignatureVerifierTest, EmptyContentCanBeSigned) {
    const auto verifier = verifierFor({a.publicKey()});
    EXPECT_EQ(verifier.validate(a.sign(""), std::string_view("")), "");
}

TEST(TrustAnchorTest, ParsesDefaultKeys) {
    const auto anchors = TrustAnchorSet::fromMinisignKeys(evpn::config::DEFAULT_VERIFY_KEYS);
    EXPECT_EQ(anchors->size(), evpn::config::DEFAULT_VERIFY_KEYS.size());
    for (const auto& anchor : *anchors) EXPECT_EQ(anchor.fingerprint().size(), 16u);
}

TEST(TrustAnchorTest, RejectsWrongLengthKey) {
    EXPECT_THROW(TrustAnchor::fromMinisign("RWRtBSX1alxyGX+Xn3LuZnWUT0w="), MalformedInput);
}

TEST(TrustAnchorTest, OneBadKeyFailsTheSet) {
    const MinisignKey good;
    EXPECT_THROW(TrustAnchorSet::fromMinisignKeys({good.publicKey(), "%%%"}), MalformedInput);
}
