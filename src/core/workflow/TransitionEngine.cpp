#include "TransitionEngine.hpp"

#include <spdlog/spdlog.h>

#include "core/storage/Collections.hpp"
#include "core/workflow/StateMachine.hpp"

namespace vf {

TransitionEngine::TransitionEngine(RecordStore& store, AuditLedger& ledger)
  : store_(store), ledger_(ledger) {}

CreateOutcome TransitionEngine::createIntake(WorkItem item, const std::string& actor) {
  return createIn(kInitialState, std::move(item), actor);
}

CreateOutcome TransitionEngine::createPlan(WorkItem plan, const std::string& actor) {
  if (plan.kind.empty()) plan.kind = kKindPlan;
  return createIn(State::Planned, std::move(plan), actor);
}

CreateOutcome TransitionEngine::createIn(State state, WorkItem item, const std::string& actor) {
  item.state = state;
  if (item.created_at == 0) item.created_at = store_.clock().now();
  const std::string collection = collection_of(state);
  try {
    store_.create(collection, item);
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::AlreadyExists) throw;
    spdlog::debug("{}/{} already exists, creation treated as done", collection, item.id);
    return CreateOutcome::Duplicate;
  }
  ledger_.record(audit::kCreated, actor, item.id, {
    {"collection", collection},
    {"type", item.kind},
    {"source", item.source},
    {"priority", priority_name(item.priority)}
  });
  spdlog::info("{} created {} in {}", actor, item.id, collection);
  return CreateOutcome::Created;
}

void TransitionEngine::transition(const std::string& id,
                                  State from,
                                  State to,
                                  const std::string& actor,
                                  const std::map<std::string, std::string>& parameters) {
  if (!is_legal_transition(from, to)) rejectIllegal(collection_of(from), id, from, to, actor);
  move(collection_of(from), from, to, id, actor, parameters);
}

State TransitionEngine::advanceFrom(const std::string& ownerCollection,
                                    const std::string& id,
                                    State to,
                                    const std::string& actor,
                                    const std::map<std::string, std::string>& parameters) {
  WorkItem item;
  try {
    item = store_.read(ownerCollection, id);
  } catch (const StoreError& e) {
    if (e.code() == ErrorCode::MalformedRecord) quarantineMalformed(ownerCollection, id, e, actor);
    throw;
  }
  const State from = item.state;
  if (!is_legal_transition(from, to)) rejectIllegal(ownerCollection, id, from, to, actor);
  move(ownerCollection, from, to, id, actor, parameters);
  return from;
}

void TransitionEngine::move(const std::string& fromCollection, State from, State to,
                            const std::string& id, const std::string& actor,
                            const std::map<std::string, std::string>& parameters) {
  const std::string toCollection = collection_of(to);
  store_.moveAtomic(fromCollection, toCollection, id);
  refreshStatus(toCollection, id, actor);

  auto params = parameters;
  params["from"] = state_name(from);
  params["to"] = state_name(to);
  ledger_.record(audit::kTransition, actor, id, params);
  spdlog::info("{}: {} -> {} by {}", id, state_name(from), state_name(to), actor);
}

void TransitionEngine::rejectIllegal(const std::string& collection, const std::string& id,
                                     State from, State to, const std::string& actor) {
  const std::string what = std::string("illegal transition ") + state_name(from) + " -> " +
                           state_name(to) + " for " + id;
  spdlog::error("{} (requested by {})", what, actor);
  ledger_.record(audit::kIllegalTransition, actor, id, {
    {"from", state_name(from)},
    {"to", state_name(to)},
    {"collection", collection}
  }, AuditResult::Failure, what);

  try {
    store_.update(collection, id, [&](WorkItem& w) {
      w.metadata["review"] = "required";
      w.metadata["review_reason"] = what + " requested by " + actor;
    });
  } catch (const StoreError& e) {
    if (e.code() == ErrorCode::MalformedRecord) {
      quarantineMalformed(collection, id, e, actor);
    } else {
      spdlog::warn("could not flag {}/{} for review: {}", collection, id, e.what());
    }
  }
  throw StoreError(ErrorCode::IllegalTransition, what);
}

void TransitionEngine::refreshStatus(const std::string& collection, const std::string& id,
                                     const std::string& actor) {
  try {
    store_.update(collection, id, [](WorkItem&) {});
  } catch (const StoreError& e) {
    switch (e.code()) {
      case ErrorCode::NotFound:
        spdlog::debug("{} left {} before its status was refreshed", id, collection);
        break;
      case ErrorCode::MalformedRecord:
        quarantineMalformed(collection, id, e, actor);
        break;
      default:
        // the collection stays authoritative; only the mirror is stale
        spdlog::warn("status refresh for {}/{} failed: {}", collection, id, e.what());
    }
  }
}

void TransitionEngine::quarantineMalformed(const std::string& collection, const std::string& id,
                                           const StoreError& e, const std::string& actor) {
  spdlog::error("malformed record {}/{}: {}", collection, id, e.what());
  ledger_.record(audit::kMalformedRecord, actor, id, {{"collection", collection}},
                 AuditResult::Failure, e.what());
  try {
    store_.quarantine(collection, id);
  } catch (const StoreError& q) {
    spdlog::warn("could not quarantine {}/{}: {}", collection, id, q.what());
  }
}

CreateOutcome TransitionEngine::resubmit(const std::string& rejectedId,
                                         const std::string& newId,
                                         const std::string& actor) {
  WorkItem item = store_.read(collection_of(State::Rejected), rejectedId);
  const Timestamp now = store_.clock().now();

  // an approval request re-enters with a fresh window of the same length
  if (item.expires_at) {
    const Timestamp window = *item.expires_at - item.created_at;
    item.expires_at = now + (window > 0 ? window : kDefaultApprovalWindow);
  }
  item.id = newId;
  item.created_at = now;
  item.metadata.erase("review");
  item.metadata.erase("review_reason");
  item.metadata["resubmitted_from"] = rejectedId;
  return createIn(kInitialState, std::move(item), actor);
}

std::optional<WorkItem> TransitionEngine::readOrQuarantine(const std::string& collection,
                                                           const std::string& id,
                                                           const std::string& actor) {
  try {
    return store_.read(collection, id);
  } catch (const StoreError& e) {
    if (e.code() == ErrorCode::NotFound) return std::nullopt;
    if (e.code() != ErrorCode::MalformedRecord) throw;
    quarantineMalformed(collection, id, e, actor);
    return std::nullopt;
  }
}

} // namespace vf
