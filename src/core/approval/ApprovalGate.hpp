#pragma once
#include <string>
#include <vector>

#include "core/claims/ClaimController.hpp"
#include "core/workflow/TransitionEngine.hpp"

namespace vf {

enum class GateDecision {
  Executable,        // Approved and inside its window
  Expired,           // past expires_at; the record is (now) in Expired
  AwaitingApproval,  // still in PendingApproval
  AlreadyClaimed,    // another executor holds it
  NotFound           // not in Approved or PendingApproval (done, rejected, unknown)
};

const char* gate_decision_name(GateDecision d);

struct ApprovalSpec {
  std::string id;
  std::string action;
  std::string target;
  std::string linked_item_id;
  std::string source;
  std::string body;
  Priority    priority = Priority::Normal;
  std::map<std::string, std::string> metadata;
};

struct ExecutionOutcome {
  AuditResult result = AuditResult::Success;
  std::string detail;  // e.g. "sent:<message id>", "dry_run", "manual_required"
  std::string error;
};

// Time-bounded approval requests. Expiry is always judged against the
// store's clock and fails closed: a missing or unreadable expiry counts as
// expired, and an expired request only ever moves to Expired.
class ApprovalGate {
public:
  ApprovalGate(TransitionEngine& engine, ClaimController& claims,
               Timestamp window = kDefaultApprovalWindow);

  // New ApprovalRequest in PendingApproval, expires_at = now + window.
  CreateOutcome requestApproval(const ApprovalSpec& spec, const std::string& actor);

  // Stamps a Planned item with action/target/expiry, then Planned -> PendingApproval.
  void submitForApproval(const std::string& id, const std::string& action,
                         const std::string& target, const std::string& actor);

  // Human decisions. approve() on an overdue request expires it instead.
  GateDecision approve(const std::string& id, const std::string& approver);
  void reject(const std::string& id, const std::string& approver, const std::string& reason);

  // Executable iff Approved and now < expires_at. An overdue request is
  // moved to Expired with one atomic move and Expired is returned; once a
  // request has been reported Expired it can never be reported Executable.
  GateDecision checkExecutable(const std::string& id);

  // Claims the request out of Approved for `owner`, then re-checks expiry
  // under custody. On Executable the owner holds the record.
  GateDecision acquireForExecution(const std::string& id, const std::string& owner);

  // Ledger entry with the executor's outcome, then Approved -> Done.
  void completeExecution(const std::string& id, const std::string& owner,
                         const ExecutionOutcome& outcome);

  // Moves every overdue PendingApproval/Approved record to Expired.
  std::vector<std::string> expireOverdue(const std::string& actor);

  Timestamp window() const { return window_; }

private:
  bool overdue(const WorkItem& item, Timestamp now) const;
  GateDecision expire(const std::string& collection, State from, const std::string& id,
                      const WorkItem& item, const std::string& actor);
  void recordExpiry(const std::string& id, const WorkItem& item, const std::string& actor);

  TransitionEngine& engine_;
  ClaimController& claims_;
  RecordStore& store_;
  AuditLedger& ledger_;
  Timestamp window_;
};

} // namespace vf
