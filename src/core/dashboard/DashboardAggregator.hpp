#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/coordination/CoordinationStore.hpp"
#include "core/ledger/AuditLedger.hpp"
#include "core/storage/RecordStore.hpp"

namespace vf {

enum class DashboardRole { Authoritative, Contributor };

std::optional<DashboardRole> parse_dashboard_role(const std::string& s);

struct DashboardDelta {
  std::string    delta_id;
  std::string    field;
  nlohmann::json value;
  Timestamp      at = 0;
  std::string    author;
};

struct PendingApprovalView {
  std::string id;
  std::string action;
  std::string target;
  Timestamp   expires_at = 0;
};

struct DashboardSnapshot {
  Timestamp generated_at = 0;
  std::map<std::string, size_t> counts;         // collection -> records
  std::map<std::string, size_t> claims;         // owner -> records held
  std::vector<PendingApprovalView> pending;     // soonest expiry first
  std::vector<AuditLogEntry> recent;            // newest last
  std::vector<std::string> alerts;
  std::map<std::string, nlohmann::json> fields; // merged peer deltas
};

struct MergeReport {
  size_t applied = 0;
  size_t superseded = 0;
  size_t dropped = 0;
};

// Builds Dashboard.md. Exactly one process may hold the Authoritative role
// (enforced by an exclusive lock on .state/dashboard.lock); everyone else may
// only submit deltas into the Updates collection.
class DashboardAggregator {
public:
  DashboardAggregator(RecordStore& store, AuditLedger& ledger, CoordinationStore& coord,
                      std::string vaultRoot, DashboardRole role, size_t recentEntries = 10);
  ~DashboardAggregator();
  DashboardAggregator(const DashboardAggregator&) = delete;
  DashboardAggregator& operator=(const DashboardAggregator&) = delete;

  // Any role. Resubmitting the same delta_id is a no-op.
  void submitDelta(const DashboardDelta& delta);

  // Authoritative only. Applies unprocessed deltas last-writer-wins per field.
  MergeReport merge();

  DashboardSnapshot snapshot() const;

  // Authoritative only: merge, render and atomically replace Dashboard.md.
  DashboardSnapshot publish();

  DashboardRole role() const { return role_; }
  std::string dashboardPath() const;

private:
  void requireAuthoritative(const char* op) const;

  RecordStore& store_;
  AuditLedger& ledger_;
  CoordinationStore& coord_;
  std::string root_;
  DashboardRole role_;
  size_t recentEntries_;
  int lockFd_ = -1;
  std::mutex mergeMu_;
};

nlohmann::json to_json(const DashboardSnapshot& s);

std::string render_markdown(const DashboardSnapshot& s);

} // namespace vf
