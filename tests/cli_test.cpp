#include "services/api/StatusMap.hpp"
#include "services/cli/Cli.hpp"
#include "services/runtime/Runtime.hpp"

#include "fakes/TempVault.hpp"

#include <sstream>

#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = make_temp_dir("vaultflow-cli");
    cfg.vault_path = (fs::path(dir) / "vault").string();
    cfg.schema_path = VF_TEST_SCHEMA_PATH;
    cfg.owner_id = "cli";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  int cli(std::vector<std::string> args) {
    out.str("");
    err.str("");
    args.insert(args.begin(), "vaultflow");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return run_cli(static_cast<int>(argv.size()), argv.data(), cfg, out, err);
  }

  std::string dir;
  Config cfg;
  std::ostringstream out;
  std::ostringstream err;
};

TEST_F(CliTest, commands_that_succeed_exit_0) {
  EXPECT_EQ(cli({"help"}), kExitOk);
  EXPECT_NE(out.str().find("Usage:"), std::string::npos);

  EXPECT_EQ(cli({"ingest", "E-1", "email", "--source", "gmail_watcher", "--body", "hi"}), kExitOk);
  EXPECT_EQ(out.str(), "created E-1\n");
  EXPECT_EQ(cli({"ingest", "E-1", "email"}), kExitOk);
  EXPECT_EQ(out.str(), "duplicate E-1\n");

  EXPECT_EQ(cli({"transition", "E-1", "intake", "triaged"}), kExitOk);
  EXPECT_EQ(cli({"claim", "triaged", "E-1"}), kExitOk);
  EXPECT_EQ(out.str(), "E-1: claimed by cli\n");
}

TEST_F(CliTest, usage_errors_exit_1) {
  EXPECT_EQ(cli({}), kExitUsage);
  EXPECT_NE(out.str().find("Usage:"), std::string::npos);

  EXPECT_EQ(cli({"frobnicate"}), kExitUsage);
  EXPECT_NE(err.str().find("unknown command 'frobnicate'"), std::string::npos);

  EXPECT_EQ(cli({"transition", "E-1"}), kExitUsage);
  EXPECT_NE(err.str().find("missing from"), std::string::npos);

  EXPECT_EQ(cli({"transition", "E-1", "intake", "limbo"}), kExitUsage);
  EXPECT_EQ(cli({"ledger", "yesterday"}), kExitUsage);
  EXPECT_EQ(cli({"request-approval", "A-1"}), kExitUsage);
}

TEST_F(CliTest, store_refusals_exit_3) {
  EXPECT_EQ(cli({"transition", "ghost", "intake", "triaged"}), kExitRefused);
  EXPECT_NE(err.str().find("NotFound"), std::string::npos) << err.str();

  ASSERT_EQ(cli({"ingest", "E-1", "email"}), kExitOk);
  EXPECT_EQ(cli({"transition", "E-1", "intake", "done"}), kExitRefused);

  ASSERT_EQ(cli({"transition", "E-1", "intake", "triaged"}), kExitOk);
  ASSERT_EQ(cli({"claim", "triaged", "E-1"}), kExitOk);
  EXPECT_EQ(cli({"claim", "triaged", "E-1"}), kExitRefused);
  EXPECT_EQ(out.str(), "E-1: already claimed\n");

  // another process holds the authoritative dashboard
  Runtime holder(cfg);
  auto dash = holder.openDashboard(DashboardRole::Authoritative);
  EXPECT_EQ(cli({"dashboard"}), kExitRefused);
}

TEST_F(CliTest, other_failures_exit_2) {
  const std::string missing = (fs::path(dir) / "no-such-body.md").string();
  EXPECT_EQ(cli({"ingest", "E-2", "email", "--body-file", missing}), kExitFatal);
  EXPECT_NE(err.str().find("Fatal: cannot read"), std::string::npos);

  cfg.schema_path = (fs::path(dir) / "nope.sql").string();
  EXPECT_EQ(cli({"status"}), kExitFatal);
}

TEST(http_status, store_errors_map_to_statuses) {
  EXPECT_EQ(http_status_for(ErrorCode::NotFound), 404);
  EXPECT_EQ(http_status_for(ErrorCode::InvalidId), 400);
  EXPECT_EQ(http_status_for(ErrorCode::MalformedRecord), 422);
  EXPECT_EQ(http_status_for(ErrorCode::AlreadyExists), 409);
  EXPECT_EQ(http_status_for(ErrorCode::AlreadyClaimed), 409);
  EXPECT_EQ(http_status_for(ErrorCode::IllegalTransition), 409);
  EXPECT_EQ(http_status_for(ErrorCode::Expired), 409);
  EXPECT_EQ(http_status_for(ErrorCode::Io), 500);
}
