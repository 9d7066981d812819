#pragma once

#include "nm/ProfileImporter.hpp"

namespace evpn::nm {

// Imports through the editor plugin of the one installed VPN plugin named pluginName.
class LibnmPluginImporter final : public ProfileImportBoundary {
public:
    explicit LibnmPluginImporter(std::string pluginName = "openvpn");

    ConnectionPtr importFile(const std::filesystem::path& path) override;

private:
    std::string pluginName_;
};

}
