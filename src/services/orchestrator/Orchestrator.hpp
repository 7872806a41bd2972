#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>

#include "core/approval/ApprovalGate.hpp"
#include "core/claims/ClaimController.hpp"
#include "core/workflow/TransitionEngine.hpp"
#include "services/orchestrator/Executor.hpp"

namespace vf {

enum class DispatchResult {
  Executed,   // executor ran (successfully or not) and the record is in Done
  Expired,    // past its window; moved to Expired, nothing ran
  Skipped,    // dry run, or no executor for the action; left in Approved
  Contended,  // another worker got it first
  NotFound
};

const char* dispatch_result_name(DispatchResult r);

struct PassReport {
  size_t executed = 0;
  size_t expired = 0;
  size_t skipped = 0;
  size_t contended = 0;
};

// Polls Approved and runs each request through acquireForExecution, the
// executor registered for its action and completeExecution. With dry_run set
// nothing is claimed or moved; the intended action is only logged.
class Orchestrator {
public:
  Orchestrator(TransitionEngine& engine, ClaimController& claims, ApprovalGate& gate,
               std::string owner, bool dryRun);

  void registerExecutor(const std::string& action, std::unique_ptr<Executor> executor);
  bool hasExecutor(const std::string& action) const;

  DispatchResult process(const std::string& id);

  PassReport runOnce();

  // Runs passes every pollInterval seconds until `stop` is set.
  void runLoop(int64_t pollInterval, const std::atomic<bool>& stop);

  const std::string& owner() const { return owner_; }

private:
  TransitionEngine& engine_;
  ClaimController& claims_;
  ApprovalGate& gate_;
  RecordStore& store_;
  std::string owner_;
  bool dryRun_;
  std::map<std::string, std::unique_ptr<Executor>> executors_;
  std::set<std::string> announced_;  // ids already reported once (dry run / no executor)
};

// Registers the executors that need no external service:
// discord_reply, whatsapp_reply and draft_email.
void register_builtin_executors(Orchestrator& o);

} // namespace vf
