#include "core/claims/ClaimController.hpp"
#include "core/storage/Collections.hpp"

#include "fakes/TempVault.hpp"

#include <atomic>
#include <ctime>
#include <filesystem>
#include <thread>

#include <gtest/gtest.h>

using namespace vf;
using namespace vf::test;

class ClaimsTest : public VaultTest {};

TEST_F(ClaimsTest, two_workers_race_for_one_item) {
  seed(State::Triaged, "X");

  std::atomic<int> claimed{0}, refused{0};
  std::thread w1([&] { (claims->claim(State::Triaged, "X", "w1") == ClaimOutcome::Claimed ? claimed : refused)++; });
  std::thread w2([&] { (claims->claim(State::Triaged, "X", "w2") == ClaimOutcome::Claimed ? claimed : refused)++; });
  w1.join();
  w2.join();

  EXPECT_EQ(claimed.load(), 1);
  EXPECT_EQ(refused.load(), 1);
  EXPECT_FALSE(store->exists("Triaged", "X"));
  const bool inW1 = store->exists("In_Progress/w1", "X");
  const bool inW2 = store->exists("In_Progress/w2", "X");
  EXPECT_NE(inW1, inW2);

  auto row = coord->findClaim("X");
  ASSERT_TRUE(row);
  EXPECT_EQ(row->owner_id, inW1 ? "w1" : "w2");
  EXPECT_EQ(row->from_state, "triaged");
  EXPECT_EQ(countEntries(audit::kClaimed), 1u);
}

TEST_F(ClaimsTest, claim_keeps_the_from_state_in_the_mirror) {
  seed(State::Planned, "P-1");
  ASSERT_EQ(claims->claim(State::Planned, "P-1", "w1"), ClaimOutcome::Claimed);
  EXPECT_EQ(store->read("In_Progress/w1", "P-1").state, State::Planned);
  EXPECT_EQ(claims->claimed("w1"), std::vector<std::string>{"P-1"});
  EXPECT_TRUE(claims->claimed("w2").empty());
}

TEST_F(ClaimsTest, release_returns_item_to_where_it_came_from) {
  seed(State::Triaged, "X");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);
  claims->release("w1", "X", "needs more context");

  EXPECT_TRUE(store->exists("Triaged", "X"));
  EXPECT_FALSE(coord->findClaim("X"));
  EXPECT_EQ(countEntries(audit::kReleased), 1u);

  EXPECT_THROW(claims->release("w1", "X", "twice"), StoreError);
  EXPECT_EQ(claims->claim(State::Triaged, "X", "w2"), ClaimOutcome::Claimed);
}

TEST_F(ClaimsTest, complete_moves_onward_and_drops_the_claim) {
  seed(State::Triaged, "X");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);
  claims->complete("w1", "X", State::Planned);

  EXPECT_TRUE(store->exists("Planned", "X"));
  EXPECT_TRUE(store->list("In_Progress/w1").empty());
  EXPECT_FALSE(coord->findClaim("X"));
}

TEST_F(ClaimsTest, complete_still_enforces_the_graph) {
  seed(State::Triaged, "X");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);
  EXPECT_THROW(claims->complete("w1", "X", State::Approved), StoreError);
  EXPECT_TRUE(store->exists("In_Progress/w1", "X"));
  EXPECT_TRUE(coord->findClaim("X"));
}

TEST_F(ClaimsTest, heartbeat_keeps_claims_alive) {
  seed(State::Triaged, "X");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);

  clock->advance(600);
  EXPECT_EQ(claims->heartbeat("w1"), 1);
  clock->advance(600);
  auto report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_TRUE(report.reclaimed.empty());
  EXPECT_TRUE(store->exists("In_Progress/w1", "X"));
}

TEST_F(ClaimsTest, stale_claims_are_reclaimed) {
  seed(State::Triaged, "X");
  seed(State::Approved, "A");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);
  ASSERT_EQ(claims->claim(State::Approved, "A", "w1"), ClaimOutcome::Claimed);

  clock->advance(kDefaultClaimTtl + 1);
  auto report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_EQ(report.reclaimed.size(), 2u);
  EXPECT_TRUE(report.orphans.empty());
  EXPECT_TRUE(store->exists("Triaged", "X"));
  EXPECT_TRUE(store->exists("Approved", "A"));
  EXPECT_TRUE(coord->allClaims().empty());
  EXPECT_EQ(countEntries(audit::kReclaimed), 2u);

  // a second sweep finds nothing
  report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_TRUE(report.reclaimed.empty());
}

// A worker that died between the move and writing its claim row leaves a
// record in its scope with no liveness at all. Orphan age is judged from the
// file's change time, so the clock is pushed past real time.
TEST_F(ClaimsTest, orphaned_records_are_returned) {
  seed(State::Planned, "P-1");
  store->moveAtomic("Planned", "In_Progress/crashed", "P-1");

  clock->set(static_cast<Timestamp>(::time(nullptr)));
  auto report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_TRUE(report.orphans.empty());

  clock->set(static_cast<Timestamp>(::time(nullptr)) + 2 * kDefaultClaimTtl);
  report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_EQ(report.orphans, std::vector<std::string>{"P-1"});
  EXPECT_TRUE(store->exists("Planned", "P-1"));
}

TEST_F(ClaimsTest, heartbeat_and_claim_stamp_the_shared_lease) {
  EXPECT_FALSE(store->leaseAt("w1"));
  seed(State::Triaged, "X");
  ASSERT_EQ(claims->claim(State::Triaged, "X", "w1"), ClaimOutcome::Claimed);
  auto lease = store->leaseAt("w1");
  ASSERT_TRUE(lease);
  EXPECT_EQ(*lease, kT0);

  clock->advance(300);
  claims->heartbeat("w1");
  lease = store->leaseAt("w1");
  ASSERT_TRUE(lease);
  EXPECT_EQ(*lease, kT0 + 300);
  EXPECT_THROW(store->touchLease("../w1", kT0), StoreError);
}

// Two hosts share the vault but not their coordination databases. The sweep
// on this host sees no row for the remote owner's claim and must go by the
// remote owner's lease instead.
TEST_F(ClaimsTest, remote_owner_with_a_fresh_lease_keeps_its_claim) {
  const std::string remoteDb = (std::filesystem::path(root) / kStateDir / "remote.db").string();
  initDatabase(remoteDb, VF_TEST_SCHEMA_PATH);
  CoordinationStore remoteCoord(remoteDb);
  ClaimController remote(*engine, remoteCoord);

  seed(State::Triaged, "R-1");
  ASSERT_EQ(remote.claim(State::Triaged, "R-1", "laptop"), ClaimOutcome::Claimed);
  EXPECT_FALSE(coord->findClaim("R-1"));

  // well past the record's change time, but the remote owner is heartbeating
  clock->set(static_cast<Timestamp>(::time(nullptr)) + 2 * kDefaultClaimTtl);
  EXPECT_EQ(remote.heartbeat("laptop"), 1);
  auto report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_TRUE(report.orphans.empty());
  EXPECT_TRUE(store->exists("In_Progress/laptop", "R-1"));
  EXPECT_EQ(countEntries(audit::kReclaimed), 0u);

  // the remote owner goes quiet
  clock->advance(kDefaultClaimTtl + 1);
  report = claims->reclaimStale(kDefaultClaimTtl, "sweeper");
  EXPECT_EQ(report.orphans, std::vector<std::string>{"R-1"});
  EXPECT_TRUE(store->exists("Triaged", "R-1"));
  EXPECT_EQ(countEntries(audit::kReclaimed), 1u);
}
