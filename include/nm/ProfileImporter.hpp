#pragma once

#include "nm/ConnectionManager.hpp"

#include <filesystem>
#include <string>

namespace evpn::nm {

// Hands a profile file to the connection manager's own parser.
class ProfileImportBoundary {
public:
    virtual ~ProfileImportBoundary() = default;

    virtual ConnectionPtr importFile(const std::filesystem::path& path) = 0;
};

// OpenVPN config with the client key and certificate inlined.
std::string renderProfile(const std::string& config, const std::string& privateKey, const std::string& certificate);

void writeProfile(const std::string& config, const std::string& privateKey, const std::string& certificate,
                  const std::filesystem::path& target);

class ProfileImporter {
public:
    explicit ProfileImporter(ProfileImportBoundary& boundary, std::string fileName = "eduVPN.ovpn");

    // The temp directory holding the profile is gone when this returns, also on failure.
    [[nodiscard]] ConnectionPtr importProfile(const std::string& config,
                                              const std::string& privateKey,
                                              const std::string& certificate) const;

private:
    ProfileImportBoundary& boundary_;
    std::string fileName_;
};

}
