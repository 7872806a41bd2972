#include "ClaimController.hpp"

#include <spdlog/spdlog.h>

#include "core/storage/Collections.hpp"

namespace vf {

ClaimController::ClaimController(TransitionEngine& engine, CoordinationStore& coord)
  : engine_(engine), store_(engine.store()), ledger_(engine.ledger()), coord_(coord) {}

ClaimOutcome ClaimController::claim(State from, const std::string& id, const std::string& owner) {
  const std::string ownerColl = owner_collection(owner);
  // lease first: a record never sits in an owner scope older than its lease
  store_.touchLease(owner, store_.clock().now());
  try {
    store_.moveAtomic(collection_of(from), ownerColl, id);
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::NotFound) throw;
    spdlog::debug("{} lost the claim on {}: {}", owner, id, e.what());
    return ClaimOutcome::AlreadyClaimed;
  }

  // We hold custody from here on, so rewriting the mirror is safe.
  auto item = engine_.readOrQuarantine(ownerColl, id, owner);
  if (!item) throw StoreError(ErrorCode::MalformedRecord, id + " was quarantined while claiming");
  if (item->state != from) {
    store_.update(ownerColl, id, [from](WorkItem& w) { w.state = from; });
  }

  const Timestamp now = store_.clock().now();
  coord_.upsertClaim(ClaimRecord{id, owner, state_name(from), now, now});
  ledger_.record(audit::kClaimed, owner, id, {{"from", state_name(from)}});
  spdlog::info("{} claimed {} from {}", owner, id, collection_of(from));
  return ClaimOutcome::Claimed;
}

void ClaimController::complete(const std::string& owner, const std::string& id, State to,
                               const std::map<std::string, std::string>& parameters) {
  engine_.advanceFrom(owner_collection(owner), id, to, owner, parameters);
  coord_.removeClaim(id);
}

void ClaimController::release(const std::string& owner, const std::string& id,
                              const std::string& reason) {
  const std::string ownerColl = owner_collection(owner);
  const WorkItem item = store_.read(ownerColl, id);
  if (!giveBack(ownerColl, id, item.state, owner, audit::kReleased, reason)) {
    throw StoreError(ErrorCode::NotFound, ownerColl + "/" + id);
  }
  coord_.removeClaim(id);
}

int ClaimController::heartbeat(const std::string& owner) {
  const Timestamp now = store_.clock().now();
  store_.touchLease(owner, now);
  return coord_.heartbeat(owner, now);
}

bool ClaimController::giveBack(const std::string& ownerColl, const std::string& id, State from,
                               const std::string& actor, const char* actionType,
                               const std::string& reason) {
  try {
    store_.moveAtomic(ownerColl, collection_of(from), id);
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::NotFound) throw;
    spdlog::debug("{} already left {}", id, ownerColl);
    return false;
  }
  ledger_.record(actionType, actor, id, {
    {"owner_collection", ownerColl},
    {"returned_to", state_name(from)},
    {"reason", reason}
  });
  spdlog::info("{} returned {} to {} ({})", actor, id, collection_of(from), reason);
  return true;
}

ReclaimReport ClaimController::reclaimStale(int64_t ttl, const std::string& actor) {
  ReclaimReport report;
  const Timestamp now = store_.clock().now();

  for (const auto& rec : coord_.claimsOlderThan(now - ttl)) {
    auto from = parse_state(rec.from_state);
    if (!from) {
      spdlog::warn("claim row for {} has unknown from_state '{}', dropping it", rec.item_id, rec.from_state);
      coord_.removeClaim(rec.item_id);
      continue;
    }
    if (giveBack(owner_collection(rec.owner_id), rec.item_id, *from, actor, audit::kReclaimed,
                 "no heartbeat from " + rec.owner_id + " since " + format_iso8601(rec.heartbeat_at))) {
      report.reclaimed.push_back(rec.item_id);
    }
    coord_.removeClaim(rec.item_id);
  }

  // Records in an owner scope with no row here. The row may live in another
  // host's database, so only owners whose shared lease went stale qualify.
  for (const auto& owner : store_.children(kInProgressRoot)) {
    const std::string ownerColl = std::string(kInProgressRoot) + "/" + owner;
    const auto lease = store_.leaseAt(owner);
    if (lease && now - *lease <= ttl) continue;
    for (const auto& id : store_.list(ownerColl)) {
      if (coord_.findClaim(id)) continue;
      Timestamp changed = 0;
      try {
        changed = store_.modifiedAt(ownerColl, id);
      } catch (const StoreError& e) {
        if (e.code() != ErrorCode::NotFound) throw;
        continue;
      }
      if (now - changed <= ttl) continue;

      auto item = engine_.readOrQuarantine(ownerColl, id, actor);
      if (!item) continue;
      if (giveBack(ownerColl, id, item->state, actor, audit::kReclaimed, "orphaned in " + ownerColl)) {
        report.orphans.push_back(id);
      }
    }
  }

  if (!report.reclaimed.empty() || !report.orphans.empty()) {
    spdlog::warn("reclaimed {} stale and {} orphaned claim(s)", report.reclaimed.size(), report.orphans.size());
  }
  return report;
}

std::vector<std::string> ClaimController::claimed(const std::string& owner) const {
  return store_.list(owner_collection(owner));
}

} // namespace vf
