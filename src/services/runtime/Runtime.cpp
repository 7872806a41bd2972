#include "Runtime.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/coordination/InitDb.hpp"
#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"

namespace fs = std::filesystem;

namespace vf {

// -------- helpers --------

static fs::path executable_dir() {
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  return ec ? fs::path() : exe.parent_path();
}

std::string find_schema_path(const Config& cfg) {
  if (!cfg.schema_path.empty()) {
    if (fs::exists(cfg.schema_path)) return cfg.schema_path;
    throw std::runtime_error("schema.sql not found at " + cfg.schema_path);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    executable_dir() / "schema.sql",
    fs::path("src/core/coordination/schema.sql")
  };
  for (const auto& p : candidates) {
    if (!p.empty() && fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in cwd, next to the executable and src/core/coordination)");
}

void ensure_vault_layout(const std::string& root) {
  std::vector<std::string> dirs = {kInProgressRoot, kQuarantine, kUpdates, kLogsDir};
  for (State s : {State::Intake, State::Triaged, State::Planned, State::PendingApproval,
                  State::Approved, State::Rejected, State::Expired, State::Done}) {
    dirs.push_back(collection_of(s));
  }
  for (const auto& d : dirs) {
    std::error_code ec;
    fs::create_directories(fs::path(root) / d, ec);
    if (ec) throw StoreError(ErrorCode::Io, "cannot create " + (fs::path(root) / d).string() + ": " + ec.message());
  }
}

static std::string prepared_db(const Config& cfg) {
  const std::string dbPath = cfg.coordinationDbPath();
  fs::path parent = fs::path(dbPath).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  initDatabase(dbPath, find_schema_path(cfg));
  return dbPath;
}

// -------- Runtime --------

Runtime::Runtime(Config cfg)
  : cfg_(std::move(cfg)),
    owner_(cfg_.ownerId()),
    store_(cfg_.vault_path),
    ledger_((fs::path(cfg_.vault_path) / kLogsDir).string(), store_.clock()),
    coord_(prepared_db(cfg_)),
    engine_(store_, ledger_),
    claims_(engine_, coord_),
    gate_(engine_, claims_, cfg_.approval_window) {
  ensure_vault_layout(cfg_.vault_path);
  spdlog::debug("runtime ready: vault={} owner={}", cfg_.vault_path, owner_);
}

std::unique_ptr<DashboardAggregator> Runtime::openDashboard(DashboardRole role) {
  return std::make_unique<DashboardAggregator>(store_, ledger_, coord_, cfg_.vault_path, role,
                                               cfg_.recent_entries);
}

} // namespace vf
