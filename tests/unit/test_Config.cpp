#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "TempDir.hpp"

using namespace mcs::config;
using namespace mcs::test;

class ConfigTest : public ::testing::Test {
protected:
    TempDir tmp;

    Config load(const std::string& yaml) const {
        const auto path = tmp / "config.yaml";
        writeFile(path, yaml);
        return loadConfig(path);
    }
};

TEST_F(ConfigTest, DefaultsMatchMemCardPro) {
    const auto cfg = defaultConfig();
    EXPECT_EQ(cfg.ftp.port, 21);
    EXPECT_EQ(cfg.ftp.user_env, "MCP2_USER");
    EXPECT_EQ(cfg.ftp.password_env, "MCP2_PWD");
    EXPECT_EQ(cfg.sync.targets_file, "targets.json");
    EXPECT_EQ(cfg.sync.naming, Naming::Structured);
    EXPECT_EQ(cfg.transfer.chunk_size, 1024u);
    EXPECT_EQ(cfg.remote.roots.at("mc2"), "PS2");
    EXPECT_EQ(cfg.remote.roots.at("mcd"), "PS1");
}

TEST_F(ConfigTest, LoadsSections) {
    const auto cfg = load(R"(
ftp:
  host: 192.168.1.50
  port: 2121
  timeout_seconds: 5
sync:
  local_root: /srv/cards
  targets_file: cards.json
  naming: flat
  basic_output: true
transfer:
  chunk_size: 8192
remote:
  roots:
    .MC2: files/PS2
logging:
  log_dir: /tmp/ps2mcs-logs
  log_levels:
    console_log_level: warning
    subsystem_levels:
      ftp: debug
)");

    EXPECT_EQ(cfg.ftp.host, "192.168.1.50");
    EXPECT_EQ(cfg.ftp.port, 2121);
    EXPECT_EQ(cfg.ftp.timeout_seconds, 5u);
    EXPECT_EQ(cfg.ftp.user_env, "MCP2_USER");
    EXPECT_EQ(cfg.sync.local_root, "/srv/cards");
    EXPECT_EQ(cfg.sync.targets_file, "cards.json");
    EXPECT_EQ(cfg.sync.naming, Naming::Flat);
    EXPECT_TRUE(cfg.sync.basic_output);
    EXPECT_EQ(cfg.transfer.chunk_size, 8192u);
    ASSERT_EQ(cfg.remote.roots.size(), 1u);
    EXPECT_EQ(cfg.remote.roots.at("mc2"), "files/PS2");
    EXPECT_EQ(cfg.logging.log_dir, "/tmp/ps2mcs-logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.ftp, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::info);
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
    const auto cfg = load("ftp:\n  host: mcp2.local\n");
    EXPECT_EQ(cfg.ftp.host, "mcp2.local");
    EXPECT_EQ(cfg.ftp.port, 21);
    EXPECT_EQ(cfg.sync.local_root, ".");
    EXPECT_EQ(cfg.transfer.chunk_size, 1024u);
    EXPECT_EQ(cfg.remote.roots.size(), 2u);
}

TEST_F(ConfigTest, RejectsBadValues) {
    EXPECT_THROW((void)load("sync:\n  naming: nested\n"), std::invalid_argument);
    EXPECT_THROW((void)load("transfer:\n  chunk_size: 0\n"), std::invalid_argument);
    EXPECT_THROW((void)loadConfig(tmp / "missing.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsMalformedSections) {
    EXPECT_THROW((void)load("ftp: 192.168.1.50\n"), std::runtime_error);
    EXPECT_THROW((void)load("remote:\n  roots: [files/PS2]\n"), std::runtime_error);
    EXPECT_THROW((void)load("logging:\n  log_levels:\n    subsystem_levels: debug\n"), std::runtime_error);
}

TEST_F(ConfigTest, EncodeDecodeKeepsValues) {
    SyncConfig in;
    in.local_root = "/cards";
    in.naming = Naming::Flat;
    in.basic_output = true;

    SyncConfig out;
    ASSERT_TRUE(YAML::convert<SyncConfig>::decode(YAML::convert<SyncConfig>::encode(in), out));
    EXPECT_EQ(out.local_root, in.local_root);
    EXPECT_EQ(out.naming, in.naming);
    EXPECT_EQ(out.basic_output, in.basic_output);
}
