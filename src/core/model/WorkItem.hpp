#pragma once
#include <map>
#include <optional>
#include <string>

#include "core/model/Timestamp.hpp"

namespace vf {

enum class State {
  Intake,
  Triaged,
  Planned,
  PendingApproval,
  Approved,
  Rejected,
  Expired,
  Done
};

enum class Priority { Low, Normal, High, Urgent };

// Kinds the pipeline knows about. Any lower-case identifier is accepted.
inline constexpr const char* kKindMessage = "message";
inline constexpr const char* kKindEmail = "email";
inline constexpr const char* kKindFileDrop = "file_drop";
inline constexpr const char* kKindPlan = "plan";
inline constexpr const char* kKindApprovalRequest = "approval_request";

inline constexpr Timestamp kDefaultApprovalWindow = 24 * 3600;

struct WorkItem {
  std::string id;
  std::string kind;
  State       state = State::Intake;
  Priority    priority = Priority::Normal;
  Timestamp   created_at = 0;
  std::string source;

  // payload: body text plus free-form metadata
  std::string body;
  std::map<std::string, std::string> metadata;

  // approval-bound fields
  std::string              action;
  std::optional<Timestamp> expires_at;
  std::string              linked_item_id;
  std::string              target;

  bool isApprovalRequest() const { return !action.empty() || kind == kKindApprovalRequest; }
};

const char* state_name(State s);            // "pending_approval"
const char* state_collection(State s);      // "Pending_Approval"
std::optional<State> parse_state(const std::string& s);  // accepts either form

const char* priority_name(Priority p);
std::optional<Priority> parse_priority(const std::string& s);

bool is_terminal(State s);

// lower-case identifier: [a-z][a-z0-9_]*
bool is_identifier(const std::string& s);

} // namespace vf
