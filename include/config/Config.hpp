#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace evpn::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum evpn    = spdlog::level::info;   // Top-level events like import/activate requests
    spdlog::level::level_enum crypto  = spdlog::level::warn;   // Signature failures, malformed envelopes
    spdlog::level::level_enum nm      = spdlog::level::info;   // NetworkManager add/update/activate results
    spdlog::level::level_enum bus     = spdlog::level::warn;   // D-Bus subscription and property read errors
    spdlog::level::level_enum storage = spdlog::level::warn;   // State file IO
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct NetworkManagerConfig {
    std::string vpn_plugin = "openvpn";
    std::string profile_file_name = "eduVPN.ovpn";
    bool persist_connections = true;
};

struct ActivationConfig {
    std::chrono::milliseconds retry_delay = std::chrono::milliseconds(100);
    unsigned int max_retries = 1;
};

// base64(<signature_algorithm> || <key_id> || <public_key>)
inline const std::vector<std::string> DEFAULT_VERIFY_KEYS = {
    "RWRtBSX1alxyGX+Xn3LuZnWUT0w//B6EmTJvgaAxBMYzlQeI+jdrO6KF",
    "RWQKqtqvd0R7rUDp0rWzbtYPA3towPWcLDCl7eY9pBMMI/ohCmrS0WiM",
};

struct TrustConfig {
    std::vector<std::string> verify_keys = DEFAULT_VERIFY_KEYS;
};

struct StorageConfig {
    std::filesystem::path state_file;   // empty = paths::getStatePath()
};

struct Config {
    LoggingConfig logging;
    NetworkManagerConfig nm;
    ActivationConfig activation;
    TrustConfig trust;
    StorageConfig storage;

    [[nodiscard]] std::filesystem::path stateFile() const;
};

// Missing file yields defaults; a malformed file throws.
Config loadConfig(const std::filesystem::path& path);

std::string dumpConfig(const Config& cfg);

} // namespace evpn::config
