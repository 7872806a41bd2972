#include "ApprovalGate.hpp"

#include <spdlog/spdlog.h>

#include "core/storage/Collections.hpp"

namespace vf {

const char* gate_decision_name(GateDecision d) {
  switch (d) {
    case GateDecision::Executable:       return "executable";
    case GateDecision::Expired:          return "expired";
    case GateDecision::AwaitingApproval: return "awaiting_approval";
    case GateDecision::AlreadyClaimed:   return "already_claimed";
    case GateDecision::NotFound:         return "not_found";
  }
  return "not_found";
}

ApprovalGate::ApprovalGate(TransitionEngine& engine, ClaimController& claims, Timestamp window)
  : engine_(engine), claims_(claims), store_(engine.store()), ledger_(engine.ledger()),
    window_(window) {}

bool ApprovalGate::overdue(const WorkItem& item, Timestamp now) const {
  return !item.expires_at || now >= *item.expires_at;
}

static std::string expiry_text(const WorkItem& item) {
  return item.expires_at ? format_iso8601(*item.expires_at) : "missing";
}

CreateOutcome ApprovalGate::requestApproval(const ApprovalSpec& spec, const std::string& actor) {
  const Timestamp now = store_.clock().now();

  WorkItem w;
  w.id = spec.id;
  w.kind = kKindApprovalRequest;
  w.priority = spec.priority;
  w.created_at = now;
  w.source = spec.source.empty() ? actor : spec.source;
  w.body = spec.body;
  w.metadata = spec.metadata;
  w.action = spec.action;
  w.target = spec.target;
  w.linked_item_id = spec.linked_item_id;
  w.expires_at = now + window_;

  const CreateOutcome out = engine_.createIn(State::PendingApproval, w, actor);
  if (out == CreateOutcome::Created) {
    ledger_.record(audit::kApprovalRequested, actor, w.id, {
      {"action", w.action},
      {"target", w.target},
      {"linked_item", w.linked_item_id},
      {"expires", format_iso8601(*w.expires_at)}
    });
  }
  return out;
}

void ApprovalGate::submitForApproval(const std::string& id, const std::string& action,
                                     const std::string& target, const std::string& actor) {
  const Timestamp now = store_.clock().now();
  const WorkItem stamped = store_.update(collection_of(State::Planned), id, [&](WorkItem& w) {
    w.action = action;
    if (!target.empty()) w.target = target;
    w.expires_at = now + window_;
  });
  engine_.transition(id, State::Planned, State::PendingApproval, actor, {{"action", action}});
  ledger_.record(audit::kApprovalRequested, actor, id, {
    {"action", action},
    {"target", stamped.target},
    {"expires", format_iso8601(*stamped.expires_at)}
  });
}

GateDecision ApprovalGate::expire(const std::string& collection, State from,
                                  const std::string& id, const WorkItem& item,
                                  const std::string& actor) {
  try {
    engine_.transition(id, from, State::Expired, actor, {{"expires", expiry_text(item)}});
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::NotFound) throw;
    // a competitor moved it first; an overdue request still reports Expired
    spdlog::debug("{} left {} before {} could expire it", id, collection, actor);
    return GateDecision::Expired;
  }
  recordExpiry(id, item, actor);
  return GateDecision::Expired;
}

void ApprovalGate::recordExpiry(const std::string& id, const WorkItem& item, const std::string& actor) {
  AuditLogEntry e;
  e.timestamp = store_.clock().now();
  e.action_type = audit::kExpired;
  e.actor = actor;
  e.target = item.target.empty() ? id : item.target;
  e.parameters = bound_parameters({{"item", id}, {"action", item.action}, {"expires", expiry_text(item)}});
  e.result = AuditResult::Failure;
  e.error_detail = "skipped_expired";
  e.approval_status = "expired";
  ledger_.append(e);
  spdlog::warn("approval {} expired ({}), action {} will not run", id, expiry_text(item), item.action);
}

GateDecision ApprovalGate::approve(const std::string& id, const std::string& approver) {
  const std::string pending = collection_of(State::PendingApproval);
  auto item = engine_.readOrQuarantine(pending, id, approver);
  if (!item) return GateDecision::NotFound;

  if (overdue(*item, store_.clock().now())) {
    return expire(pending, State::PendingApproval, id, *item, approver);
  }
  try {
    engine_.transition(id, State::PendingApproval, State::Approved, approver,
                       {{"approved_by", approver}, {"action", item->action}});
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::NotFound) throw;
    return GateDecision::NotFound;
  }

  try {
    store_.update(collection_of(State::Approved), id, [&](WorkItem& w) {
      w.metadata["approved_by"] = approver;
      w.metadata["approved_at"] = format_iso8601(store_.clock().now());
    });
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::NotFound) throw;
    spdlog::debug("{} was picked up before approval details were recorded", id);
  }
  return GateDecision::Executable;
}

void ApprovalGate::reject(const std::string& id, const std::string& approver, const std::string& reason) {
  engine_.transition(id, State::PendingApproval, State::Rejected, approver,
                     {{"rejected_by", approver}, {"reason", reason}});
}

GateDecision ApprovalGate::checkExecutable(const std::string& id) {
  const std::string actor = "approval_gate";
  const Timestamp now = store_.clock().now();

  // Pending before Approved: an item promoted between the two reads is still seen.
  const std::string pending = collection_of(State::PendingApproval);
  if (auto item = engine_.readOrQuarantine(pending, id, actor)) {
    if (overdue(*item, now)) return expire(pending, State::PendingApproval, id, *item, actor);
    return GateDecision::AwaitingApproval;
  }
  const std::string approved = collection_of(State::Approved);
  if (auto item = engine_.readOrQuarantine(approved, id, actor)) {
    if (overdue(*item, now)) return expire(approved, State::Approved, id, *item, actor);
    return GateDecision::Executable;
  }
  if (store_.exists(collection_of(State::Expired), id)) return GateDecision::Expired;

  auto where = store_.locate(id);
  if (where && where->rfind(kInProgressRoot, 0) == 0) return GateDecision::AlreadyClaimed;
  return GateDecision::NotFound;
}

GateDecision ApprovalGate::acquireForExecution(const std::string& id, const std::string& owner) {
  if (claims_.claim(State::Approved, id, owner) == ClaimOutcome::AlreadyClaimed) {
    if (store_.exists(collection_of(State::Expired), id)) return GateDecision::Expired;
    if (store_.exists(collection_of(State::PendingApproval), id)) return GateDecision::AwaitingApproval;
    auto where = store_.locate(id);
    if (where && where->rfind(kInProgressRoot, 0) == 0) return GateDecision::AlreadyClaimed;
    return GateDecision::NotFound;
  }

  const std::string ownerColl = owner_collection(owner);
  const WorkItem item = store_.read(ownerColl, id);
  if (overdue(item, store_.clock().now())) {
    claims_.complete(owner, id, State::Expired, {{"expires", expiry_text(item)}});
    recordExpiry(id, item, owner);
    return GateDecision::Expired;
  }
  return GateDecision::Executable;
}

void ApprovalGate::completeExecution(const std::string& id, const std::string& owner,
                                     const ExecutionOutcome& outcome) {
  const std::string ownerColl = owner_collection(owner);
  const WorkItem item = store_.read(ownerColl, id);

  AuditLogEntry e;
  e.timestamp = store_.clock().now();
  e.action_type = audit::kExecuted;
  e.actor = owner;
  e.target = item.target.empty() ? id : item.target;
  e.parameters = bound_parameters({{"item", id}, {"action", item.action}, {"detail", outcome.detail}});
  e.result = outcome.result;
  e.error_detail = outcome.error;
  e.approval_status = "approved";
  auto by = item.metadata.find("approved_by");
  e.approved_by = by != item.metadata.end() ? by->second : "human";
  ledger_.append(e);

  store_.update(ownerColl, id, [&](WorkItem& w) {
    w.metadata["result"] = outcome.detail.empty() ? audit_result_name(outcome.result) : outcome.detail;
    w.metadata["executed_at"] = format_iso8601(e.timestamp);
  });
  claims_.complete(owner, id, State::Done, {{"action", item.action}});
}

std::vector<std::string> ApprovalGate::expireOverdue(const std::string& actor) {
  std::vector<std::string> expired;
  const Timestamp now = store_.clock().now();
  for (State s : {State::PendingApproval, State::Approved}) {
    const std::string coll = collection_of(s);
    for (const auto& id : store_.list(coll)) {
      auto item = engine_.readOrQuarantine(coll, id, actor);
      if (!item || !overdue(*item, now)) continue;
      expire(coll, s, id, *item, actor);
      expired.push_back(id);
    }
  }
  return expired;
}

} // namespace vf
