#pragma once

#include <string>

namespace evpn::crypto::cert {

// Common name of the subject of a PEM encoded client certificate.
std::string commonName(const std::string& pem);

}
