#include "core/config/Config.hpp"

#include "fakes/TempVault.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = make_temp_dir("vaultflow-config");
    clearEnv();
  }

  void TearDown() override {
    clearEnv();
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  static void clearEnv() {
    for (const char* k : {"VF_CONFIG", "VAULT_PATH", "VF_OWNER_ID", "VF_DB_PATH", "VF_API_KEY",
                          "VF_LOG_LEVEL", "VF_APPROVAL_WINDOW_HOURS", "VF_CLAIM_TTL_SECONDS",
                          "VF_POLL_INTERVAL", "VF_DRY_RUN", "VF_PORT", "VF_DASHBOARD_ROLE"}) {
      ::unsetenv(k);
    }
  }

  std::string writeFile(const std::string& name, const std::string& text) {
    const std::string path = (fs::path(dir) / name).string();
    std::ofstream(path) << text;
    return path;
  }

  std::string dir;
};

TEST_F(ConfigTest, defaults_are_safe) {
  const Config cfg = load_config();
  EXPECT_EQ(cfg.vault_path, "vault");
  EXPECT_TRUE(cfg.dry_run);
  EXPECT_EQ(cfg.approval_window, 24 * kHour);
  EXPECT_EQ(cfg.claim_ttl, 900);
  EXPECT_EQ(cfg.dashboard_role, DashboardRole::Authoritative);
  EXPECT_EQ(cfg.coordinationDbPath(), (fs::path("vault") / ".state" / "coordination.db").string());
  EXPECT_FALSE(cfg.ownerId().empty());
}

TEST_F(ConfigTest, file_overlays_only_present_keys) {
  const std::string path = writeFile("vaultflow.json", R"({
    "vault_path": "/srv/vault",
    "approval_window_hours": 48,
    "dry_run": false,
    "dashboard_role": "cloud",
    "owner_id": "laptop"
  })");
  const Config cfg = load_config_file(path);
  EXPECT_EQ(cfg.vault_path, "/srv/vault");
  EXPECT_EQ(cfg.approval_window, 48 * kHour);
  EXPECT_FALSE(cfg.dry_run);
  EXPECT_EQ(cfg.dashboard_role, DashboardRole::Contributor);
  EXPECT_EQ(cfg.ownerId(), "laptop");
  EXPECT_EQ(cfg.claim_ttl, 900);
  EXPECT_EQ(cfg.port, 8080);
}

TEST_F(ConfigTest, environment_wins_over_file) {
  const std::string path = writeFile("vaultflow.json", R"({"vault_path": "/from/file", "port": 9000})");
  ::setenv("VF_CONFIG", path.c_str(), 1);
  ::setenv("VAULT_PATH", "/from/env", 1);
  ::setenv("VF_CLAIM_TTL_SECONDS", "120", 1);
  ::setenv("VF_DRY_RUN", "off", 1);

  const Config cfg = load_config();
  EXPECT_EQ(cfg.vault_path, "/from/env");
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.claim_ttl, 120);
  EXPECT_FALSE(cfg.dry_run);
}

TEST_F(ConfigTest, bad_values_are_rejected) {
  ::setenv("VF_CLAIM_TTL_SECONDS", "15m", 1);
  EXPECT_THROW(load_config(), std::runtime_error);
  ::unsetenv("VF_CLAIM_TTL_SECONDS");

  ::setenv("VF_DRY_RUN", "maybe", 1);
  EXPECT_THROW(load_config(), std::runtime_error);
  ::unsetenv("VF_DRY_RUN");

  ::setenv("VF_APPROVAL_WINDOW_HOURS", "0", 1);
  EXPECT_THROW(load_config(), std::runtime_error);
  ::unsetenv("VF_APPROVAL_WINDOW_HOURS");

  ::setenv("VF_OWNER_ID", "../evil", 1);
  EXPECT_THROW(load_config(), std::runtime_error);
  ::unsetenv("VF_OWNER_ID");

  EXPECT_THROW(load_config_file(writeFile("bad.json", "{ nope")), std::runtime_error);
  EXPECT_THROW(load_config_file(writeFile("list.json", "[1, 2]")), std::runtime_error);
  EXPECT_THROW(load_config_file(writeFile("port.json", R"({"port": "eighty"})")), std::runtime_error);
  EXPECT_THROW(load_config_file((fs::path(dir) / "missing.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, explicit_db_path_is_kept) {
  Config cfg;
  cfg.db_path = "/tmp/coord.db";
  EXPECT_EQ(cfg.coordinationDbPath(), "/tmp/coord.db");
}
