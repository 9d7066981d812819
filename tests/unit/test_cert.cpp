#include <gtest/gtest.h>
#include "crypto/cert.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <memory>
#include <string>

using namespace evpn::crypto;

namespace {

struct PkeyFree { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct X509Free { void operator()(X509* x) const { X509_free(x); } };
struct BioFree { void operator()(BIO* b) const { BIO_free(b); } };

// Self-signed Ed25519 certificate, optionally with a CN.
std::string makeCertificate(const char* cn) {
    EVP_PKEY* raw = nullptr;
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                                                     &EVP_PKEY_CTX_free);
    EVP_PKEY_keygen_init(ctx.get());
    EVP_PKEY_keygen(ctx.get(), &raw);
    const std::unique_ptr<EVP_PKEY, PkeyFree> key(raw);

    const std::unique_ptr<X509, X509Free> x509(X509_new());
    X509_set_version(x509.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(x509.get()), 3600);
    X509_set_pubkey(x509.get(), key.get());

    X509_NAME* name = X509_get_subject_name(x509.get());
    X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("evpn tests"), -1, -1, 0);
    if (cn) X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8, reinterpret_cast<const unsigned char*>(cn), -1, -1, 0);
    X509_set_issuer_name(x509.get(), name);
    X509_sign(x509.get(), key.get(), nullptr);

    const std::unique_ptr<BIO, BioFree> bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509(bio.get(), x509.get());
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    return {data, static_cast<size_t>(len)};
}

}

TEST(CertTest, ExtractsCommonName) {
    EXPECT_EQ(cert::commonName(makeCertificate("f6c3a1b2e0d94c5e")), "f6c3a1b2e0d94c5e");
}

TEST(CertTest, KeepsUtf8CommonName) {
    EXPECT_EQ(cert::commonName(makeCertificate("gebruiker-\xc3\xa9")), "gebruiker-\xc3\xa9");
}

TEST(CertTest, ThrowsWithoutCommonName) {
    EXPECT_THROW(cert::commonName(makeCertificate(nullptr)), std::runtime_error);
}

TEST(CertTest, ThrowsOnGarbage) {
    EXPECT_THROW(cert::commonName("-----BEGIN CERTIFICATE-----\nnope\n-----END CERTIFICATE-----\n"), std::runtime_error);
    EXPECT_THROW(cert::commonName(""), std::runtime_error);
}
