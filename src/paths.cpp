#include "paths.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace evpn::paths {

static fs::path testRoot_;

static fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return fs::temp_directory_path();
}

static fs::path xdgDir(const char* var, const fs::path& fallback) {
    if (const char* dir = std::getenv(var); dir && *dir) return fs::path(dir) / "evpn";
    return homeDir() / fallback / "evpn";
}

fs::path getConfigDir() {
    if (testMode) return testRoot_ / "config";
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path getConfigPath() { return getConfigDir() / "config.yaml"; }

fs::path getStatePath() {
    if (testMode) return testRoot_ / "state" / "connection.json";
    return xdgDir("XDG_STATE_HOME", fs::path(".local") / "state") / "connection.json";
}

fs::path getLogPath() {
    if (testMode) return testRoot_ / "log";
    return xdgDir("XDG_STATE_HOME", fs::path(".local") / "state") / "log";
}

void setLogPathForTesting() {
    testMode = true;
    testRoot_ = fs::temp_directory_path() / ("evpn_test_" + std::to_string(::getpid()));
    fs::create_directories(testRoot_);
}

}
