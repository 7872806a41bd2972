#include "services/orchestrator/Executor.hpp"
#include "services/orchestrator/Orchestrator.hpp"

#include "fakes/MockExecutor.hpp"
#include "fakes/TempVault.hpp"

#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

class OrchestratorTest : public VaultTest {
protected:
  // Registers a mock for send_reply and returns a handle to it.
  MockExecutor* withMock(Orchestrator& o) {
    auto mock = std::make_unique<MockExecutor>();
    MockExecutor* raw = mock.get();
    o.registerExecutor("send_reply", std::move(mock));
    return raw;
  }

  void approvedRequest(const std::string& id, const std::string& action = "send_reply") {
    ApprovalSpec spec;
    spec.id = id;
    spec.action = action;
    spec.target = "alice@example.com";
    spec.body = "## Draft Reply\n\nOn it.\n";
    ASSERT_EQ(gate->requestApproval(spec, "planner"), CreateOutcome::Created);
    ASSERT_EQ(gate->approve(id, "human"), GateDecision::Executable);
  }
};

TEST_F(OrchestratorTest, approved_request_runs_once_and_lands_in_done) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", false);
  MockExecutor* mock = withMock(o);
  approvedRequest("A-1");

  EXPECT_CALL(*mock, execute(Field(&WorkItem::id, "A-1")))
    .WillOnce(Return(ExecutionOutcome{AuditResult::Success, "sent:42", ""}));

  const PassReport r = o.runOnce();
  EXPECT_EQ(r.executed, 1u);
  EXPECT_TRUE(store->exists("Done", "A-1"));
  EXPECT_TRUE(claims->claimed("orchestrator").empty());
  EXPECT_EQ(countEntries(audit::kExecuted), 1u);

  EXPECT_EQ(o.runOnce().executed, 0u);
}

TEST_F(OrchestratorTest, dry_run_touches_nothing) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", true);
  MockExecutor* mock = withMock(o);
  approvedRequest("A-1");

  EXPECT_CALL(*mock, execute(_)).Times(0);
  EXPECT_EQ(o.process("A-1"), DispatchResult::Skipped);
  EXPECT_EQ(o.process("A-1"), DispatchResult::Skipped);
  EXPECT_TRUE(store->exists("Approved", "A-1"));
  EXPECT_FALSE(coord->findClaim("A-1"));
  EXPECT_EQ(countEntries(audit::kExecuted), 0u);
}

TEST_F(OrchestratorTest, expired_request_is_never_executed) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", false);
  MockExecutor* mock = withMock(o);
  approvedRequest("A-1");
  clock->advance(25 * kHour);

  EXPECT_CALL(*mock, execute(_)).Times(0);
  const PassReport r = o.runOnce();
  EXPECT_EQ(r.expired, 1u);
  EXPECT_TRUE(store->exists("Expired", "A-1"));
  EXPECT_EQ(countEntries(audit::kExpired), 1u);
}

TEST_F(OrchestratorTest, executor_failure_is_recorded_and_not_retried) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", false);
  MockExecutor* mock = withMock(o);
  approvedRequest("A-1");

  EXPECT_CALL(*mock, execute(_)).WillOnce(Throw(std::runtime_error("smtp refused")));
  EXPECT_EQ(o.process("A-1"), DispatchResult::Executed);
  EXPECT_TRUE(store->exists("Done", "A-1"));

  ASSERT_EQ(countEntries(audit::kExecuted), 1u);
  for (const auto& e : entries()) {
    if (e.action_type != audit::kExecuted) continue;
    EXPECT_EQ(e.result, AuditResult::Failure);
    EXPECT_EQ(e.error_detail, "smtp refused");
    EXPECT_EQ(e.parameters.at("detail"), "error");
  }
}

TEST_F(OrchestratorTest, unknown_action_is_left_in_approved) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", false);
  approvedRequest("A-1", "post_tweet");
  EXPECT_FALSE(o.hasExecutor("post_tweet"));
  EXPECT_EQ(o.process("A-1"), DispatchResult::Skipped);
  EXPECT_TRUE(store->exists("Approved", "A-1"));
  EXPECT_EQ(o.process("missing"), DispatchResult::NotFound);
}

TEST_F(OrchestratorTest, builtin_executors_ask_for_manual_replies) {
  Orchestrator o(*engine, *claims, *gate, "orchestrator", false);
  register_builtin_executors(o);
  EXPECT_TRUE(o.hasExecutor("whatsapp_reply"));
  EXPECT_TRUE(o.hasExecutor("discord_reply"));
  approvedRequest("WA-1", "whatsapp_reply");

  EXPECT_EQ(o.process("WA-1"), DispatchResult::Executed);
  EXPECT_EQ(store->read("Done", "WA-1").metadata.at("result"), "manual_required");
}

TEST(executor, extract_section_reads_one_markdown_section) {
  const std::string body =
    "# Reply plan\n\n"
    "## Message\n\nHi, can we move the call?\n\n"
    "## Draft Reply\n\n  Sure, Thursday works.  \n\n"
    "## Notes\n\nnone\n";
  EXPECT_EQ(extract_section(body, "Draft Reply"), "Sure, Thursday works.");
  EXPECT_EQ(extract_section(body, "Message"), "Hi, can we move the call?");
  EXPECT_EQ(extract_section(body, "Summary"), "");
}

TEST(executor, manual_executor_reports_manual_required) {
  ManualExecutor ex("Discord");
  WorkItem w;
  w.id = "D-1";
  w.body = "## Message\n\nping\n";
  const ExecutionOutcome out = ex.execute(w);
  EXPECT_EQ(out.result, AuditResult::Success);
  EXPECT_EQ(out.detail, "manual_required");
}

TEST(executor, dispatch_result_names) {
  EXPECT_STREQ(dispatch_result_name(DispatchResult::Executed), "executed");
  EXPECT_STREQ(dispatch_result_name(DispatchResult::Contended), "contended");
}
