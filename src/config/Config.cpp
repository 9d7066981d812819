#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <paths.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace evpn::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const char* key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error(std::string("Invalid config section: ") + key);
}

}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (!std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping: " + path.string());

    decodeSection(root, "logging", cfg.logging);
    decodeSection(root, "nm", cfg.nm);
    decodeSection(root, "activation", cfg.activation);
    decodeSection(root, "trust", cfg.trust);
    decodeSection(root, "storage", cfg.storage);

    return cfg;
}

std::filesystem::path Config::stateFile() const {
    return storage.state_file.empty() ? paths::getStatePath() : storage.state_file;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["logging"] = YAML::convert<LoggingConfig>::encode(cfg.logging);
    root["nm"] = YAML::convert<NetworkManagerConfig>::encode(cfg.nm);
    root["activation"] = YAML::convert<ActivationConfig>::encode(cfg.activation);
    root["trust"] = YAML::convert<TrustConfig>::encode(cfg.trust);
    root["storage"] = YAML::convert<StorageConfig>::encode(cfg.storage);

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace evpn::config
