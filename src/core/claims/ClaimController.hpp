#pragma once
#include <string>
#include <vector>

#include "core/coordination/CoordinationStore.hpp"
#include "core/workflow/TransitionEngine.hpp"

namespace vf {

enum class ClaimOutcome { Claimed, AlreadyClaimed };

inline constexpr int64_t kDefaultClaimTtl = 15 * 60;

struct ReclaimReport {
  std::vector<std::string> reclaimed;  // returned to their from-state
  std::vector<std::string> orphans;    // owner-scope files with no claim row
};

// At-most-one owner per item. Claiming is a single atomic move from a state
// collection into In_Progress/<owner>; the store's rename is the only arbiter.
// Claim rows (heartbeat + TTL) live in the host's coordination database;
// owner leases in the store tell every host which owners are still alive.
class ClaimController {
public:
  ClaimController(TransitionEngine& engine, CoordinationStore& coord);

  // AlreadyClaimed when a competitor moved the item first. Not retried.
  ClaimOutcome claim(State from, const std::string& id, const std::string& owner);

  // Moves the claimed item onward (Engine-validated) and drops the claim.
  void complete(const std::string& owner, const std::string& id, State to,
                const std::map<std::string, std::string>& parameters = {});

  // Gives the item back to the collection it was claimed from.
  void release(const std::string& owner, const std::string& id, const std::string& reason);

  int heartbeat(const std::string& owner);

  // Returns stale claims (heartbeat older than ttl) and orphaned owner-scope
  // records (no claim row here, owner lease stale or missing, last moved more
  // than ttl ago) to their from-state.
  ReclaimReport reclaimStale(int64_t ttl, const std::string& actor);

  std::vector<std::string> claimed(const std::string& owner) const;

private:
  bool giveBack(const std::string& ownerCollection, const std::string& id, State from,
                const std::string& actor, const char* actionType, const std::string& reason);

  TransitionEngine& engine_;
  RecordStore& store_;
  AuditLedger& ledger_;
  CoordinationStore& coord_;
};

} // namespace vf
