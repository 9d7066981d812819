#pragma once

#include <filesystem>

namespace evpn::paths {

inline bool testMode = false;

std::filesystem::path getConfigDir();
std::filesystem::path getConfigPath();
std::filesystem::path getStatePath();
std::filesystem::path getLogPath();

// Redirects config, state and log locations below a fresh temp directory.
void setLogPathForTesting();

}
