#pragma once
#include <memory>
#include <string>

#include "core/approval/ApprovalGate.hpp"
#include "core/claims/ClaimController.hpp"
#include "core/config/Config.hpp"
#include "core/coordination/CoordinationStore.hpp"
#include "core/dashboard/DashboardAggregator.hpp"
#include "core/ledger/AuditLedger.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/workflow/TransitionEngine.hpp"

namespace vf {

// Explicit schema_path, then ./schema.sql (the build copies it next to the
// binaries), the executable's directory, then the source tree.
std::string find_schema_path(const Config& cfg);

// Creates every collection directory of the vault. Idempotent.
void ensure_vault_layout(const std::string& root);

// The components of one process, wired over one vault.
class Runtime {
public:
  explicit Runtime(Config cfg);
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // Throws StoreError(AlreadyClaimed) when asking for Authoritative while
  // another process holds it.
  std::unique_ptr<DashboardAggregator> openDashboard(DashboardRole role);

  const Config& config() const { return cfg_; }
  const std::string& owner() const { return owner_; }

  LocalFSBackend& store() { return store_; }
  AuditLedger& ledger() { return ledger_; }
  CoordinationStore& coordination() { return coord_; }
  TransitionEngine& engine() { return engine_; }
  ClaimController& claims() { return claims_; }
  ApprovalGate& gate() { return gate_; }

private:
  Config cfg_;
  std::string owner_;
  LocalFSBackend store_;
  AuditLedger ledger_;
  CoordinationStore coord_;
  TransitionEngine engine_;
  ClaimController claims_;
  ApprovalGate gate_;
};

} // namespace vf
