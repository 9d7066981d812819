#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <paths.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace evpn::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = evpn::paths::getConfigDir() / (std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".yaml");
        fs::create_directories(file.parent_path());
    }

    void TearDown() override { fs::remove(file); }

    void write(const std::string& yaml) const {
        std::ofstream out(file, std::ios::trunc);
        out << yaml;
    }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.nm.vpn_plugin, "openvpn");
    EXPECT_EQ(cfg.nm.profile_file_name, "eduVPN.ovpn");
    EXPECT_TRUE(cfg.nm.persist_connections);
    EXPECT_EQ(cfg.activation.retry_delay, std::chrono::milliseconds(100));
    EXPECT_EQ(cfg.activation.max_retries, 1u);
    EXPECT_EQ(cfg.trust.verify_keys, DEFAULT_VERIFY_KEYS);
    EXPECT_EQ(cfg.stateFile(), evpn::paths::getStatePath());
}

TEST_F(ConfigTest, ReadsEverySection) {
    write(R"(
logging:
  levels:
    console_log_level: warn
    subsystem_levels:
      nm: debug
nm:
  vpn_plugin: wireguard
  profile_file_name: work.ovpn
  persist_connections: false
activation:
  retry_delay_ms: 250
  max_retries: 3
trust:
  verify_keys:
    - RWRtBSX1alxyGX+Xn3LuZnWUT0w//B6EmTJvgaAxBMYzlQeI+jdrO6KF
storage:
  state_file: /tmp/evpn-state.json
)");
    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.nm, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.crypto, spdlog::level::warn);
    EXPECT_EQ(cfg.nm.vpn_plugin, "wireguard");
    EXPECT_EQ(cfg.nm.profile_file_name, "work.ovpn");
    EXPECT_FALSE(cfg.nm.persist_connections);
    EXPECT_EQ(cfg.activation.retry_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.activation.max_retries, 3u);
    ASSERT_EQ(cfg.trust.verify_keys.size(), 1u);
    EXPECT_EQ(cfg.stateFile(), fs::path("/tmp/evpn-state.json"));
}

TEST_F(ConfigTest, EmptyFileYieldsDefaults) {
    write("");
    EXPECT_EQ(loadConfig(file).nm.vpn_plugin, "openvpn");
}

TEST_F(ConfigTest, RejectsMalformedSection) {
    write("nm: just-a-string\n");
    EXPECT_THROW(loadConfig(file), std::runtime_error);
}

TEST_F(ConfigTest, RejectsNegativeRetryDelay) {
    write("activation:\n  retry_delay_ms: -5\n");
    EXPECT_THROW(loadConfig(file), std::runtime_error);

    write("activation:\n  retry_delay_ms: 0\n");
    EXPECT_EQ(loadConfig(file).activation.retry_delay, std::chrono::milliseconds(0));
}

TEST_F(ConfigTest, RejectsNonMappingRoot) {
    write("- one\n- two\n");
    EXPECT_THROW(loadConfig(file), std::runtime_error);
}

TEST_F(ConfigTest, RejectsUnparseableYaml) {
    write("nm: [unterminated\n");
    EXPECT_THROW(loadConfig(file), std::runtime_error);
}

TEST_F(ConfigTest, DumpedConfigLoadsBack) {
    Config cfg;
    cfg.nm.vpn_plugin = "openvpn";
    cfg.activation.max_retries = 5;
    cfg.trust.verify_keys = {DEFAULT_VERIFY_KEYS.front()};
    write(dumpConfig(cfg));

    const auto loaded = loadConfig(file);
    EXPECT_EQ(loaded.activation.max_retries, 5u);
    EXPECT_EQ(loaded.trust.verify_keys, cfg.trust.verify_keys);
    EXPECT_EQ(loaded.stateFile(), evpn::paths::getStatePath());
}

TEST(ConfigRegistryTest, InitializedByTestMain) {
    EXPECT_EQ(ConfigRegistry::get().nm.vpn_plugin, "openvpn");
}
