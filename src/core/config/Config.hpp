#pragma once
#include <cstdint>
#include <string>

#include "core/dashboard/DashboardAggregator.hpp"

namespace vf {

struct Config {
  std::string vault_path = "vault";
  std::string owner_id;                    // empty: <hostname>-<pid>
  std::string db_path;                     // empty: <vault>/.state/coordination.db
  std::string schema_path;                 // empty: searched for at startup
  int64_t approval_window = 24 * 3600;     // seconds
  int64_t claim_ttl = 15 * 60;             // seconds
  int64_t poll_interval = 30;              // seconds
  bool dry_run = true;
  int port = 8080;
  std::string api_key;                     // empty = auth disabled
  std::string log_level = "info";
  DashboardRole dashboard_role = DashboardRole::Authoritative;
  size_t recent_entries = 10;

  std::string coordinationDbPath() const;
  std::string ownerId() const;
};

std::string get_env_or(const char* key, const std::string& defval);

// Overlays the keys present in a JSON config file onto `base`.
// Throws std::runtime_error when the file is unreadable or invalid.
Config load_config_file(const std::string& path, Config base = {});

// Overlays VAULT_PATH and the VF_* environment variables onto `base`.
void apply_env(Config& cfg);

// Defaults, then $VF_CONFIG (if set), then the environment.
Config load_config();

} // namespace vf
