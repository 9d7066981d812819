#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace evpn::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["evpn"]    = to_std_string(spdlog::level::to_string_view(rhs.evpn));
        node["crypto"]  = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["nm"]      = to_std_string(spdlog::level::to_string_view(rhs.nm));
        node["bus"]     = to_std_string(spdlog::level::to_string_view(rhs.bus));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.evpn = spdlog::level::from_str(node["evpn"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.nm = spdlog::level::from_str(node["nm"].as<std::string>("info"));
        rhs.bus = spdlog::level::from_str(node["bus"].as<std::string>("warn"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto levels = node["levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

template<>
struct convert<NetworkManagerConfig> {
    static Node encode(const NetworkManagerConfig& rhs) {
        Node node;
        node["vpn_plugin"] = rhs.vpn_plugin;
        node["profile_file_name"] = rhs.profile_file_name;
        node["persist_connections"] = rhs.persist_connections;
        return node;
    }

    static bool decode(const Node& node, NetworkManagerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.vpn_plugin = node["vpn_plugin"].as<std::string>("openvpn");
        rhs.profile_file_name = node["profile_file_name"].as<std::string>("eduVPN.ovpn");
        rhs.persist_connections = node["persist_connections"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<ActivationConfig> {
    static Node encode(const ActivationConfig& rhs) {
        Node node;
        node["retry_delay_ms"] = rhs.retry_delay.count();
        node["max_retries"] = rhs.max_retries;
        return node;
    }

    static bool decode(const Node& node, ActivationConfig& rhs) {
        if (!node.IsMap()) return false;
        const auto delay = node["retry_delay_ms"].as<long>(100);
        if (delay < 0) return false;
        rhs.retry_delay = std::chrono::milliseconds(delay);
        rhs.max_retries = node["max_retries"].as<unsigned int>(1);
        return true;
    }
};

template<>
struct convert<TrustConfig> {
    static Node encode(const TrustConfig& rhs) {
        Node node;
        node["verify_keys"] = rhs.verify_keys;
        return node;
    }

    static bool decode(const Node& node, TrustConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto keys = node["verify_keys"]) {
            if (!keys.IsSequence()) return false;
            rhs.verify_keys = keys.as<std::vector<std::string>>();
        }
        return true;
    }
};

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["state_file"] = rhs.state_file;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.state_file = node["state_file"].as<std::filesystem::path>(std::filesystem::path{});
        return true;
    }
};

} // namespace YAML
