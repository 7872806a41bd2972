#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/model/Ids.hpp"
#include "core/storage/Collections.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace vf {

// -------- helpers --------

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int64_t parse_int(const char* key, const std::string& text) {
  size_t used = 0;
  int64_t v = 0;
  try {
    v = std::stoll(text, &used);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string(key) + ": not an integer: '" + text + "'");
  }
  if (used != text.size()) throw std::runtime_error(std::string(key) + ": not an integer: '" + text + "'");
  return v;
}

static bool parse_bool(const char* key, std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
  if (text == "0" || text == "false" || text == "no" || text == "off") return false;
  throw std::runtime_error(std::string(key) + ": not a boolean: '" + text + "'");
}

static DashboardRole parse_role(const char* key, const std::string& text) {
  auto r = parse_dashboard_role(text);
  if (!r) throw std::runtime_error(std::string(key) + ": unknown dashboard role '" + text + "'");
  return *r;
}

static void require_positive(const char* key, int64_t v) {
  if (v <= 0) throw std::runtime_error(std::string(key) + " must be positive");
}

// -------- Config --------

std::string Config::coordinationDbPath() const {
  if (!db_path.empty()) return db_path;
  return (fs::path(vault_path) / kStateDir / "coordination.db").string();
}

std::string Config::ownerId() const {
  return owner_id.empty() ? default_owner_id() : owner_id;
}

Config load_config_file(const std::string& path, Config base) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open config file " + path);

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    throw std::runtime_error("invalid config file " + path + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config file " + path + " must hold a JSON object");

  try {
    if (j.contains("vault_path"))            base.vault_path = j["vault_path"].get<std::string>();
    if (j.contains("owner_id"))              base.owner_id = j["owner_id"].get<std::string>();
    if (j.contains("db_path"))               base.db_path = j["db_path"].get<std::string>();
    if (j.contains("schema_path"))           base.schema_path = j["schema_path"].get<std::string>();
    if (j.contains("approval_window_hours")) base.approval_window = j["approval_window_hours"].get<int64_t>() * 3600;
    if (j.contains("claim_ttl_seconds"))     base.claim_ttl = j["claim_ttl_seconds"].get<int64_t>();
    if (j.contains("poll_interval_seconds")) base.poll_interval = j["poll_interval_seconds"].get<int64_t>();
    if (j.contains("dry_run"))               base.dry_run = j["dry_run"].get<bool>();
    if (j.contains("port"))                  base.port = j["port"].get<int>();
    if (j.contains("api_key"))               base.api_key = j["api_key"].get<std::string>();
    if (j.contains("log_level"))             base.log_level = j["log_level"].get<std::string>();
    if (j.contains("recent_entries"))        base.recent_entries = j["recent_entries"].get<size_t>();
    if (j.contains("dashboard_role")) {
      base.dashboard_role = parse_role("dashboard_role", j["dashboard_role"].get<std::string>());
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("invalid value in config file " + path + ": " + e.what());
  }
  return base;
}

void apply_env(Config& cfg) {
  cfg.vault_path = get_env_or("VAULT_PATH", cfg.vault_path);
  cfg.owner_id   = get_env_or("VF_OWNER_ID", cfg.owner_id);
  cfg.db_path    = get_env_or("VF_DB_PATH", cfg.db_path);
  cfg.api_key    = get_env_or("VF_API_KEY", cfg.api_key);
  cfg.log_level  = get_env_or("VF_LOG_LEVEL", cfg.log_level);

  std::string v;
  if (!(v = get_env_or("VF_APPROVAL_WINDOW_HOURS", "")).empty()) {
    cfg.approval_window = parse_int("VF_APPROVAL_WINDOW_HOURS", v) * 3600;
  }
  if (!(v = get_env_or("VF_CLAIM_TTL_SECONDS", "")).empty()) {
    cfg.claim_ttl = parse_int("VF_CLAIM_TTL_SECONDS", v);
  }
  if (!(v = get_env_or("VF_POLL_INTERVAL", "")).empty()) {
    cfg.poll_interval = parse_int("VF_POLL_INTERVAL", v);
  }
  if (!(v = get_env_or("VF_DRY_RUN", "")).empty()) cfg.dry_run = parse_bool("VF_DRY_RUN", v);
  if (!(v = get_env_or("VF_PORT", "")).empty()) cfg.port = static_cast<int>(parse_int("VF_PORT", v));
  if (!(v = get_env_or("VF_DASHBOARD_ROLE", "")).empty()) {
    cfg.dashboard_role = parse_role("VF_DASHBOARD_ROLE", v);
  }
}

Config load_config() {
  Config cfg;
  const std::string file = get_env_or("VF_CONFIG", "");
  if (!file.empty()) cfg = load_config_file(file, cfg);
  apply_env(cfg);

  require_positive("approval window", cfg.approval_window);
  require_positive("claim ttl", cfg.claim_ttl);
  require_positive("poll interval", cfg.poll_interval);
  if (cfg.port <= 0 || cfg.port > 65535) throw std::runtime_error("port out of range");
  if (!cfg.owner_id.empty() && !is_valid_id(cfg.owner_id)) {
    throw std::runtime_error("invalid owner id '" + cfg.owner_id + "'");
  }
  return cfg;
}

} // namespace vf
