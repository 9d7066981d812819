#include "crypto/cert.hpp"
#include "log/Registry.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <memory>
#include <stdexcept>

namespace evpn::crypto::cert {

namespace {

struct BioFree { void operator()(BIO* b) const { BIO_free(b); } };
struct X509Free { void operator()(X509* x) const { X509_free(x); } };

}

std::string commonName(const std::string& pem) {
    const std::unique_ptr<BIO, BioFree> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) throw std::runtime_error("Failed to allocate certificate buffer");

    const std::unique_ptr<X509, X509Free> cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        log::Registry::crypto()->error("[cert] Unable to parse PEM certificate");
        throw std::runtime_error("Invalid PEM certificate");
    }

    const X509_NAME* subject = X509_get_subject_name(cert.get());
    const int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) throw std::runtime_error("Certificate has no common name");

    const ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
    unsigned char* utf8 = nullptr;
    const int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) throw std::runtime_error("Certificate common name is not valid UTF-8");

    std::string cn(reinterpret_cast<const char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return cn;
}

}
