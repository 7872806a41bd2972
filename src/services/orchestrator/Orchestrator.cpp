#include "Orchestrator.hpp"

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/storage/Collections.hpp"

namespace vf {

const char* dispatch_result_name(DispatchResult r) {
  switch (r) {
    case DispatchResult::Executed:  return "executed";
    case DispatchResult::Expired:   return "expired";
    case DispatchResult::Skipped:   return "skipped";
    case DispatchResult::Contended: return "contended";
    case DispatchResult::NotFound:  return "not_found";
  }
  return "not_found";
}

Orchestrator::Orchestrator(TransitionEngine& engine, ClaimController& claims, ApprovalGate& gate,
                           std::string owner, bool dryRun)
  : engine_(engine), claims_(claims), gate_(gate), store_(engine.store()),
    owner_(std::move(owner)), dryRun_(dryRun) {}

void Orchestrator::registerExecutor(const std::string& action, std::unique_ptr<Executor> executor) {
  executors_[action] = std::move(executor);
}

bool Orchestrator::hasExecutor(const std::string& action) const {
  return executors_.count(action) > 0;
}

DispatchResult Orchestrator::process(const std::string& id) {
  const std::string approved = collection_of(State::Approved);
  auto item = engine_.readOrQuarantine(approved, id, owner_);
  if (!item) return DispatchResult::NotFound;

  auto ex = executors_.find(item->action);
  if (ex == executors_.end()) {
    if (announced_.insert(id).second) {
      spdlog::warn("no executor for action '{}' ({}), leaving it in {}", item->action, id, approved);
    }
    return DispatchResult::Skipped;
  }

  if (dryRun_) {
    const GateDecision d = gate_.checkExecutable(id);
    if (d == GateDecision::Expired) return DispatchResult::Expired;
    if (d != GateDecision::Executable) return DispatchResult::Contended;
    if (announced_.insert(id).second) {
      spdlog::info("[dry run] would run {} for {} (target {})", item->action, id,
                   item->target.empty() ? "-" : item->target);
    }
    return DispatchResult::Skipped;
  }

  switch (gate_.acquireForExecution(id, owner_)) {
    case GateDecision::Executable:
      break;
    case GateDecision::Expired:
      return DispatchResult::Expired;
    case GateDecision::NotFound:
      return DispatchResult::NotFound;
    case GateDecision::AwaitingApproval:
    case GateDecision::AlreadyClaimed:
      return DispatchResult::Contended;
  }

  const WorkItem held = store_.read(owner_collection(owner_), id);
  ExecutionOutcome outcome;
  try {
    outcome = ex->second->execute(held);
  } catch (const std::exception& e) {
    spdlog::error("executing {} for {} failed: {}", held.action, id, e.what());
    outcome = ExecutionOutcome{AuditResult::Failure, "error", e.what()};
  }
  gate_.completeExecution(id, owner_, outcome);
  spdlog::info("{} {} -> {}", held.action, id, outcome.detail);
  return DispatchResult::Executed;
}

PassReport Orchestrator::runOnce() {
  PassReport report;
  claims_.heartbeat(owner_);

  const auto ids = store_.list(collection_of(State::Approved));
  if (!ids.empty()) spdlog::debug("{} record(s) in Approved", ids.size());
  for (const auto& id : ids) {
    try {
      switch (process(id)) {
        case DispatchResult::Executed:  ++report.executed; break;
        case DispatchResult::Expired:   ++report.expired; break;
        case DispatchResult::Skipped:   ++report.skipped; break;
        case DispatchResult::Contended:
        case DispatchResult::NotFound:  ++report.contended; break;
      }
    } catch (const std::exception& e) {
      // one bad record must not stop the pass; it stays where it is for review
      spdlog::error("processing {} failed: {}", id, e.what());
    }
  }
  return report;
}

void Orchestrator::runLoop(int64_t pollInterval, const std::atomic<bool>& stop) {
  spdlog::info("orchestrator started: owner={} interval={}s dry_run={} executors={}",
               owner_, pollInterval, dryRun_, executors_.size());
  while (!stop.load()) {
    try {
      const PassReport r = runOnce();
      if (r.executed + r.expired > 0) {
        spdlog::info("pass: executed={} expired={} skipped={} contended={}",
                     r.executed, r.expired, r.skipped, r.contended);
      }
    } catch (const std::exception& e) {
      spdlog::error("orchestrator pass failed: {}", e.what());
    }
    for (int64_t waited = 0; waited < pollInterval && !stop.load(); ++waited) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
  spdlog::info("orchestrator stopped");
}

void register_builtin_executors(Orchestrator& o) {
  o.registerExecutor("discord_reply", std::make_unique<ManualExecutor>("Discord"));
  o.registerExecutor("whatsapp_reply", std::make_unique<ManualExecutor>("WhatsApp"));
  o.registerExecutor("draft_email", std::make_unique<ManualExecutor>("email draft"));
}

} // namespace vf
