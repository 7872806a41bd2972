#include "core/storage/Collections.hpp"
#include "core/workflow/StateMachine.hpp"
#include "core/workflow/TransitionEngine.hpp"

#include "fakes/TempVault.hpp"

#include <atomic>
#include <set>
#include <thread>

#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;

namespace {

const std::vector<State> kAllStates = {
  State::Intake, State::Triaged, State::Planned, State::PendingApproval,
  State::Approved, State::Rejected, State::Expired, State::Done
};

} // namespace

TEST(state_machine, only_listed_edges_are_legal) {
  const std::set<std::pair<State, State>> legal = {
    {State::Intake, State::Triaged},
    {State::Triaged, State::Planned},
    {State::Triaged, State::Done},
    {State::Planned, State::PendingApproval},
    {State::Planned, State::Done},
    {State::PendingApproval, State::Approved},
    {State::PendingApproval, State::Rejected},
    {State::PendingApproval, State::Expired},
    {State::Approved, State::Done},
    {State::Approved, State::Expired},
  };
  for (State from : kAllStates) {
    for (State to : kAllStates) {
      EXPECT_EQ(is_legal_transition(from, to), legal.count({from, to}) == 1)
        << state_name(from) << " -> " << state_name(to);
    }
  }
  EXPECT_TRUE(successors(State::Done).empty());
  EXPECT_TRUE(successors(State::Rejected).empty());
  EXPECT_TRUE(successors(State::Expired).empty());
}

class WorkflowTest : public VaultTest {};

TEST_F(WorkflowTest, item_walks_the_happy_path) {
  ASSERT_EQ(engine->createIntake(item("E-1", kKindEmail), "gmail_watcher"), CreateOutcome::Created);
  engine->transition("E-1", State::Intake, State::Triaged, "triage");
  engine->transition("E-1", State::Triaged, State::Planned, "planner");
  engine->transition("E-1", State::Planned, State::PendingApproval, "planner");
  engine->transition("E-1", State::PendingApproval, State::Approved, "human");
  engine->transition("E-1", State::Approved, State::Done, "orchestrator");

  EXPECT_EQ(store->locate("E-1"), std::optional<std::string>("Done"));
  EXPECT_EQ(store->read("Done", "E-1").state, State::Done);
  EXPECT_NE(store->readRaw("Done", "E-1").find("status: done"), std::string::npos);

  EXPECT_EQ(countEntries(audit::kCreated), 1u);
  EXPECT_EQ(countEntries(audit::kTransition), 5u);
  const auto all = entries();
  EXPECT_EQ(all.back().parameters.at("from"), "approved");
  EXPECT_EQ(all.back().parameters.at("to"), "done");
  EXPECT_EQ(all.back().actor, "orchestrator");
}

TEST_F(WorkflowTest, illegal_transition_is_refused_and_flagged) {
  engine->createIntake(item("E-1"), "watcher");
  try {
    engine->transition("E-1", State::Intake, State::Done, "impatient");
    FAIL() << "expected IllegalTransition";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.code(), ErrorCode::IllegalTransition);
  }
  const WorkItem w = store->read("Intake", "E-1");
  EXPECT_EQ(w.state, State::Intake);
  EXPECT_EQ(w.metadata.at("review"), "required");
  EXPECT_EQ(countEntries(audit::kIllegalTransition), 1u);
  EXPECT_FALSE(store->exists("Done", "E-1"));
}

TEST_F(WorkflowTest, terminal_states_have_no_way_out) {
  seed(State::Rejected, "R-1");
  EXPECT_THROW(engine->transition("R-1", State::Rejected, State::Approved, "human"), StoreError);
  EXPECT_TRUE(store->exists("Rejected", "R-1"));
}

TEST_F(WorkflowTest, duplicate_creation_is_reported_not_overwritten) {
  WorkItem first = item("WA-1");
  first.body = "original\n";
  ASSERT_EQ(engine->createIntake(first, "whatsapp_watcher"), CreateOutcome::Created);

  WorkItem retry = item("WA-1");
  retry.body = "retry\n";
  EXPECT_EQ(engine->createIntake(retry, "whatsapp_watcher"), CreateOutcome::Duplicate);
  EXPECT_EQ(store->read("Intake", "WA-1").body, "original\n");
  EXPECT_EQ(countEntries(audit::kCreated), 1u);
}

TEST_F(WorkflowTest, missing_source_is_not_found) {
  try {
    engine->transition("ghost", State::Intake, State::Triaged, "triage");
    FAIL() << "expected NotFound";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NotFound);
  }
  EXPECT_EQ(countEntries(audit::kTransition), 0u);
}

TEST_F(WorkflowTest, plans_start_in_planned) {
  WorkItem plan = item("PLAN-1");
  plan.kind.clear();
  plan.linked_item_id = "E-1";
  ASSERT_EQ(engine->createPlan(plan, "planner"), CreateOutcome::Created);
  const WorkItem w = store->read("Planned", "PLAN-1");
  EXPECT_EQ(w.kind, kKindPlan);
  EXPECT_EQ(w.linked_item_id, "E-1");
}

TEST_F(WorkflowTest, resubmit_starts_over_with_a_fresh_window) {
  WorkItem a = item("A-1", kKindApprovalRequest);
  a.action = "send_reply";
  a.expires_at = clock->now() + 24 * kHour;
  ASSERT_EQ(engine->createIn(State::PendingApproval, a, "planner"), CreateOutcome::Created);
  engine->transition("A-1", State::PendingApproval, State::Rejected, "human", {{"reason", "tone"}});

  clock->advance(30 * kHour);
  ASSERT_EQ(engine->resubmit("A-1", "A-1-r1", "human"), CreateOutcome::Created);

  const WorkItem again = store->read("Intake", "A-1-r1");
  EXPECT_EQ(again.metadata.at("resubmitted_from"), "A-1");
  EXPECT_EQ(again.created_at, kT0 + 30 * kHour);
  ASSERT_TRUE(again.expires_at);
  EXPECT_EQ(*again.expires_at, kT0 + 54 * kHour);
  EXPECT_EQ(again.action, "send_reply");
  EXPECT_TRUE(store->exists("Rejected", "A-1"));

  EXPECT_EQ(engine->resubmit("A-1", "A-1-r1", "human"), CreateOutcome::Duplicate);
}

TEST_F(WorkflowTest, malformed_records_are_quarantined_on_read) {
  store->createExclusive("Triaged", "broken", "---\nid: broken\n---\n");
  EXPECT_FALSE(engine->readOrQuarantine("Triaged", "broken", "planner"));
  EXPECT_FALSE(store->exists("Triaged", "broken"));
  EXPECT_TRUE(store->exists(kQuarantine, "broken"));
  EXPECT_EQ(countEntries(audit::kMalformedRecord), 1u);

  EXPECT_FALSE(engine->readOrQuarantine("Triaged", "never-there", "planner"));
  EXPECT_EQ(countEntries(audit::kMalformedRecord), 1u);
}

TEST_F(WorkflowTest, racing_transitions_have_one_winner) {
  for (int i = 0; i < 20; ++i) seed(State::Triaged, "X" + std::to_string(i));

  std::atomic<int> won{0}, lost{0}, other{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      const State to = t % 2 == 0 ? State::Planned : State::Done;
      for (int i = 0; i < 20; ++i) {
        try {
          engine->transition("X" + std::to_string(i), State::Triaged, to, "w" + std::to_string(t));
          ++won;
        } catch (const StoreError& e) {
          (e.code() == ErrorCode::NotFound ? lost : other)++;
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(won.load(), 20);
  EXPECT_EQ(lost.load(), 60);
  EXPECT_EQ(other.load(), 0);
  EXPECT_EQ(store->list("Planned").size() + store->list("Done").size(), 20u);
  EXPECT_EQ(countEntries(audit::kTransition), 20u);
}
