#pragma once

#include <stdexcept>

namespace evpn::crypto {

// No trust anchor verified the message; the content must be treated as untrusted.
class BadSignature : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Envelope decoding failed: invalid base64 or wrong decoded length.
class MalformedInput : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
