#include "core/ledger/AuditLedger.hpp"
#include "core/storage/Clock.hpp"

#include "fakes/TempVault.hpp"

#include <fstream>
#include <set>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;

namespace fs = std::filesystem;

class LedgerTest : public VaultTest {
protected:
  std::string partitionFile(const std::string& key) const {
    return (fs::path(root) / kLogsDir / (key + ".jsonl")).string();
  }
};

TEST_F(LedgerTest, entries_come_back_in_append_order) {
  ledger->record("transition", "w1", "E-1", {{"from", "intake"}, {"to", "triaged"}});
  ledger->record("transition", "w1", "E-1", {{"from", "triaged"}, {"to", "planned"}});
  ledger->record("claimed", "w2", "E-2", {}, AuditResult::Failure, "lost race");

  const auto got = ledger->read("2026-10-19");
  ASSERT_EQ(got.size(), 3u);
  EXPECT_EQ(got[0].parameters.at("to"), "triaged");
  EXPECT_EQ(got[1].parameters.at("to"), "planned");
  EXPECT_EQ(got[2].actor, "w2");
  EXPECT_EQ(got[2].result, AuditResult::Failure);
  EXPECT_EQ(got[2].error_detail, "lost race");
  EXPECT_EQ(got[2].timestamp, kT0);
}

TEST_F(LedgerTest, partitions_follow_the_entry_date) {
  ledger->record("a", "x", "t", {});
  clock->advance(24 * kHour);
  ledger->record("b", "x", "t", {});
  clock->advance(24 * kHour);
  ledger->record("c", "x", "t", {});

  EXPECT_EQ(ledger->partitions(), (std::vector<std::string>{"2026-10-19", "2026-10-20", "2026-10-21"}));
  EXPECT_EQ(ledger->read("2026-10-20").size(), 1u);
  EXPECT_TRUE(ledger->read("2026-01-01").empty());

  const auto last2 = ledger->recent(2);
  ASSERT_EQ(last2.size(), 2u);
  EXPECT_EQ(last2[0].action_type, "b");
  EXPECT_EQ(last2[1].action_type, "c");
}

TEST_F(LedgerTest, approval_context_is_kept) {
  AuditLogEntry e;
  e.timestamp = kT0;
  e.action_type = audit::kExecuted;
  e.actor = "orchestrator";
  e.target = "alice@example.com";
  e.approval_status = "approved";
  e.approved_by = "human";
  ledger->append(e);

  const auto got = ledger->read(date_key(kT0));
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].approval_status, "approved");
  EXPECT_EQ(got[0].approved_by, "human");
}

TEST_F(LedgerTest, parameters_are_bounded_and_secrets_masked) {
  std::map<std::string, std::string> params;
  for (int i = 0; i < 40; ++i) params["k" + std::to_string(100 + i)] = "v";
  params["api_key"] = "sk-live-123";
  params["Refresh_Token"] = "abc";
  params["body"] = std::string(2000, 'x');

  const auto bounded = bound_parameters(params);
  EXPECT_EQ(bounded.size(), kMaxParameters);
  EXPECT_EQ(bounded.at("api_key"), "***");
  EXPECT_EQ(bounded.at("Refresh_Token"), "***");
  EXPECT_EQ(bounded.at("body").size(), kMaxParameterValue);
}

TEST_F(LedgerTest, truncation_keeps_multibyte_characters_whole) {
  std::string accented;
  for (int i = 0; i < 300; ++i) accented += "\xC3\xA9";  // é
  const auto bounded = bound_parameters({{"reason", accented}});
  const std::string& v = bounded.at("reason");
  EXPECT_LE(v.size(), kMaxParameterValue);
  ASSERT_GE(v.size(), 3u);
  EXPECT_EQ(v.substr(v.size() - 3), "...");
  EXPECT_EQ((v.size() - 3) % 2, 0u);

  seed(State::PendingApproval, "A-1");
  engine->transition("A-1", State::PendingApproval, State::Rejected, "human", {{"reason", accented}});
  EXPECT_TRUE(store->exists("Rejected", "A-1"));
  ASSERT_EQ(countEntries(audit::kTransition), 1u);
  EXPECT_EQ(ledger->read("2026-10-19").back().parameters.at("reason"), v);
}

TEST_F(LedgerTest, invalid_utf8_is_written_not_thrown) {
  EXPECT_NO_THROW(ledger->record("ingest", "watcher", "X", {{"subject", "caf\xE9 \xFF"}}));
  const auto got = ledger->read("2026-10-19");
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0].parameters.at("subject").rfind("caf", 0), 0u);
}

TEST_F(LedgerTest, torn_and_garbage_lines_are_never_returned) {
  ledger->record("first", "w1", "X", {});
  {
    std::ofstream out(partitionFile("2026-10-19"), std::ios::app);
    out << "this is not json\n";
    out << "{\"timestamp\":\"2026-10-19T09:00:00Z\",\"action_type\":\"torn";
  }
  EXPECT_EQ(ledger->read("2026-10-19").size(), 1u);

  // the next writer terminates the torn tail and lands intact
  ledger->record("second", "w1", "X", {});
  const auto got = ledger->read("2026-10-19");
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].action_type, "first");
  EXPECT_EQ(got[1].action_type, "second");
}

TEST_F(LedgerTest, rejects_invalid_partition_keys) {
  EXPECT_THROW(ledger->read("../etc/passwd"), StoreError);
  EXPECT_THROW(ledger->append("not-a-date", AuditLogEntry{}), StoreError);
}

TEST_F(LedgerTest, concurrent_threads_lose_nothing) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ledger->record("tick", "t" + std::to_string(t), std::to_string(i), {{"payload", std::string(300, 'p')}});
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(ledger->read("2026-10-19").size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LedgerTest, concurrent_processes_lose_nothing) {
  constexpr int kProcs = 4;
  constexpr int kPerProc = 100;
  const std::string dir = (fs::path(root) / kLogsDir).string();

  std::vector<pid_t> pids;
  for (int p = 0; p < kProcs; ++p) {
    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
      try {
        ManualClock fixed(kT0);
        AuditLedger mine(dir, fixed);
        for (int i = 0; i < kPerProc; ++i) {
          mine.record("tick", "p" + std::to_string(p), std::to_string(i), {{"payload", std::string(2048, 'q')}});
        }
      } catch (const std::exception&) {
        ::_exit(1);
      }
      ::_exit(0);
    }
    pids.push_back(pid);
  }
  for (pid_t pid : pids) {
    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
  }

  const auto got = ledger->read("2026-10-19");
  ASSERT_EQ(got.size(), static_cast<size_t>(kProcs * kPerProc));
  std::set<std::string> seen;
  for (const auto& e : got) seen.insert(e.actor + "/" + e.target);
  EXPECT_EQ(seen.size(), got.size());
}
