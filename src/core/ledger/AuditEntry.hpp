#pragma once
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/model/Timestamp.hpp"

namespace vf {

enum class AuditResult { Success, Failure, Partial };

const char* audit_result_name(AuditResult r);
std::optional<AuditResult> parse_audit_result(const std::string& s);

// Well-known action_type values written by the core.
namespace audit {
inline constexpr const char* kCreated = "item_created";
inline constexpr const char* kTransition = "transition";
inline constexpr const char* kIllegalTransition = "illegal_transition";
inline constexpr const char* kMalformedRecord = "malformed_record";
inline constexpr const char* kClaimed = "claimed";
inline constexpr const char* kReleased = "claim_released";
inline constexpr const char* kReclaimed = "claim_reclaimed";
inline constexpr const char* kApprovalRequested = "approval_requested";
inline constexpr const char* kExpired = "approval_expired";
inline constexpr const char* kExecuted = "action_executed";
inline constexpr const char* kDeltaDropped = "dashboard_delta_dropped";
} // namespace audit

struct AuditLogEntry {
  Timestamp   timestamp = 0;
  std::string action_type;
  std::string actor;
  std::string target;
  std::map<std::string, std::string> parameters;
  AuditResult result = AuditResult::Success;
  std::string error_detail;

  // approval context, when the entry concerns an approval-bound action
  std::string approval_status;
  std::string approved_by;
};

inline constexpr size_t kMaxParameters = 32;
inline constexpr size_t kMaxParameterValue = 512;

// Caps the parameter count and value length and masks values whose key looks
// like a credential ("token", "secret", "password", ...).
std::map<std::string, std::string> bound_parameters(const std::map<std::string, std::string>& in);

nlohmann::json to_json(const AuditLogEntry& e);

// Throws nlohmann::json::exception or std::invalid_argument on bad input.
AuditLogEntry audit_entry_from_json(const nlohmann::json& j);

} // namespace vf
