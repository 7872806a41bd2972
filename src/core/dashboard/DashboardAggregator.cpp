#include "DashboardAggregator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/model/Ids.hpp"
#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace vf {

std::optional<DashboardRole> parse_dashboard_role(const std::string& s) {
  if (s == "authoritative" || s == "local") return DashboardRole::Authoritative;
  if (s == "contributor" || s == "cloud") return DashboardRole::Contributor;
  return std::nullopt;
}

DashboardAggregator::DashboardAggregator(RecordStore& store, AuditLedger& ledger,
                                         CoordinationStore& coord, std::string vaultRoot,
                                         DashboardRole role, size_t recentEntries)
  : store_(store), ledger_(ledger), coord_(coord), root_(std::move(vaultRoot)),
    role_(role), recentEntries_(recentEntries) {
  if (role_ != DashboardRole::Authoritative) return;

  const std::string lockPath = (fs::path(root_) / kStateDir / "dashboard.lock").string();
  std::error_code ec;
  fs::create_directories(fs::path(lockPath).parent_path(), ec);
  if (ec) throw StoreError(ErrorCode::Io, "cannot create " + lockPath + ": " + ec.message());

  lockFd_ = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (lockFd_ < 0) {
    throw StoreError(ErrorCode::Io, "open " + lockPath + ": " + std::strerror(errno));
  }
  if (::flock(lockFd_, LOCK_EX | LOCK_NB) != 0) {
    int err = errno;
    ::close(lockFd_);
    lockFd_ = -1;
    if (err == EWOULDBLOCK) {
      throw StoreError(ErrorCode::AlreadyClaimed,
                       "another process holds the authoritative dashboard role");
    }
    throw StoreError(ErrorCode::Io, "flock " + lockPath + ": " + std::strerror(err));
  }
  spdlog::info("dashboard: holding authoritative role");
}

DashboardAggregator::~DashboardAggregator() {
  if (lockFd_ >= 0) ::close(lockFd_);
}

void DashboardAggregator::requireAuthoritative(const char* op) const {
  if (role_ != DashboardRole::Authoritative) {
    throw StoreError(ErrorCode::AlreadyClaimed,
                     std::string("dashboard ") + op + " requires the authoritative role");
  }
}

std::string DashboardAggregator::dashboardPath() const {
  return (fs::path(root_) / "Dashboard.md").string();
}

void DashboardAggregator::submitDelta(const DashboardDelta& delta) {
  if (!is_valid_id(delta.delta_id)) {
    throw StoreError(ErrorCode::InvalidId, "invalid delta id '" + delta.delta_id + "'");
  }
  json j = {
    {"delta_id", delta.delta_id},
    {"field", delta.field},
    {"value", delta.value},
    {"at", delta.at != 0 ? delta.at : store_.clock().now()},
    {"author", delta.author}
  };
  try {
    store_.createExclusive(kUpdates, delta.delta_id, j.dump(2) + "\n");
  } catch (const StoreError& e) {
    if (e.code() != ErrorCode::AlreadyExists) throw;
    spdlog::debug("delta {} already submitted", delta.delta_id);
  }
}

// Returns the reason a delta is unusable, or an empty string.
static std::string delta_problem(const json& j, const std::string& fileId) {
  if (!j.is_object()) return "not a JSON object";
  if (!j.contains("delta_id") || !j["delta_id"].is_string()) return "missing delta_id";
  if (j["delta_id"].get<std::string>() != fileId) return "delta_id does not match file name";
  if (!j.contains("field") || !j["field"].is_string() || j["field"].get<std::string>().empty()) {
    return "missing field";
  }
  if (!j.contains("value")) return "missing value";
  if (!j.contains("at") || !j["at"].is_number_integer()) return "missing at";
  if (j.contains("author") && !j["author"].is_string()) return "author is not a string";
  return {};
}

MergeReport DashboardAggregator::merge() {
  requireAuthoritative("merge");
  std::lock_guard<std::mutex> lock(mergeMu_);
  MergeReport report;
  const Timestamp now = store_.clock().now();

  for (const auto& id : store_.list(kUpdates)) {
    if (coord_.isProcessed(id)) continue;

    std::string raw;
    try {
      raw = store_.readRaw(kUpdates, id);
    } catch (const StoreError& e) {
      if (e.code() != ErrorCode::NotFound) throw;
      continue;
    }

    json j = json::parse(raw, nullptr, false);
    std::string problem = j.is_discarded() ? "not valid JSON" : delta_problem(j, id);
    if (!problem.empty()) {
      spdlog::warn("dashboard: dropping delta {}: {}", id, problem);
      ledger_.record(audit::kDeltaDropped, "dashboard", id, {{"reason", problem}},
                     AuditResult::Failure, problem);
      coord_.markProcessed(id, DeltaOutcome::Dropped, now);
      ++report.dropped;
      continue;
    }

    FieldRegister reg{
      j["field"].get<std::string>(),
      j["value"].dump(),
      j["at"].get<int64_t>(),
      id,
      j.value("author", "")
    };
    if (coord_.putFieldIfNewer(reg)) {
      coord_.markProcessed(id, DeltaOutcome::Applied, now);
      ++report.applied;
    } else {
      coord_.markProcessed(id, DeltaOutcome::Superseded, now);
      ++report.superseded;
    }
  }

  if (report.applied + report.superseded + report.dropped > 0) {
    spdlog::info("dashboard: merged deltas applied={} superseded={} dropped={}",
                 report.applied, report.superseded, report.dropped);
  }
  return report;
}

DashboardSnapshot DashboardAggregator::snapshot() const {
  DashboardSnapshot s;
  s.generated_at = store_.clock().now();

  for (State st : {State::Intake, State::Triaged, State::Planned, State::PendingApproval,
                   State::Approved, State::Rejected, State::Expired, State::Done}) {
    s.counts[collection_of(st)] = store_.list(collection_of(st)).size();
  }

  const auto quarantined = store_.list(kQuarantine);
  s.counts[kQuarantine] = quarantined.size();
  for (const auto& id : quarantined) s.alerts.push_back("quarantined record " + id + " needs review");

  for (const auto& owner : store_.children(kInProgressRoot)) {
    const auto held = store_.list(std::string(kInProgressRoot) + "/" + owner);
    if (!held.empty()) s.claims[owner] = held.size();
  }

  const std::string pending = collection_of(State::PendingApproval);
  for (const auto& id : store_.list(pending)) {
    try {
      const WorkItem item = store_.read(pending, id);
      PendingApprovalView v{id, item.action, item.target, item.expires_at.value_or(0)};
      if (!item.expires_at || s.generated_at >= *item.expires_at) {
        s.alerts.push_back("approval " + id + " is past its expiry");
      }
      s.pending.push_back(std::move(v));
    } catch (const StoreError& e) {
      if (e.code() == ErrorCode::NotFound) continue;
      if (e.code() != ErrorCode::MalformedRecord) throw;
      s.alerts.push_back("malformed record " + pending + "/" + id);
    }
  }
  std::sort(s.pending.begin(), s.pending.end(),
            [](const PendingApprovalView& a, const PendingApprovalView& b) {
              return a.expires_at < b.expires_at;
            });

  // alerts come from the newest ledger entries, activity from the last few
  const auto entries = ledger_.recent(std::max<size_t>(recentEntries_, 200));
  static const std::set<std::string> kAlertTypes = {
    audit::kIllegalTransition, audit::kMalformedRecord, audit::kDeltaDropped
  };
  for (const auto& e : entries) {
    if (kAlertTypes.count(e.action_type)) {
      s.alerts.push_back(format_iso8601(e.timestamp) + " " + e.action_type + " " + e.target +
                         (e.error_detail.empty() ? "" : ": " + e.error_detail));
    }
  }
  const size_t take = std::min(recentEntries_, entries.size());
  s.recent.assign(entries.end() - static_cast<std::ptrdiff_t>(take), entries.end());

  for (const auto& f : coord_.fields()) {
    json v = json::parse(f.value_json, nullptr, false);
    s.fields[f.field] = v.is_discarded() ? json(f.value_json) : v;
  }
  return s;
}

DashboardSnapshot DashboardAggregator::publish() {
  requireAuthoritative("publish");
  merge();
  DashboardSnapshot s = snapshot();

  const std::string target = dashboardPath();
  const std::string tmp = (fs::path(root_) / kStateDir / "tmp" / ("Dashboard." + uuid4() + ".tmp")).string();
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw StoreError(ErrorCode::Io, "cannot write " + tmp);
    os << render_markdown(s);
    os.flush();
    if (!os) throw StoreError(ErrorCode::Io, "write failed for " + tmp);
  }
  if (std::rename(tmp.c_str(), target.c_str()) != 0) {
    int err = errno;
    std::remove(tmp.c_str());
    throw StoreError(ErrorCode::Io, "rename " + tmp + " -> " + target + ": " + std::strerror(err));
  }
  spdlog::info("dashboard published: {}", target);
  return s;
}

json to_json(const DashboardSnapshot& s) {
  json pending = json::array();
  for (const auto& p : s.pending) {
    pending.push_back({
      {"id", p.id},
      {"action", p.action},
      {"target", p.target},
      {"expires", p.expires_at ? format_iso8601(p.expires_at) : ""}
    });
  }
  json recent = json::array();
  for (const auto& e : s.recent) recent.push_back(to_json(e));
  json fields = json::object();
  for (const auto& kv : s.fields) fields[kv.first] = kv.second;

  return {
    {"generated_at", format_iso8601(s.generated_at)},
    {"counts", s.counts},
    {"claims", s.claims},
    {"pending_approvals", pending},
    {"recent", recent},
    {"alerts", s.alerts},
    {"fields", fields}
  };
}

std::string render_markdown(const DashboardSnapshot& s) {
  std::ostringstream os;
  os << "---\n"
     << "type: dashboard\n"
     << "generated: " << format_iso8601(s.generated_at) << "\n"
     << "---\n\n"
     << "# Dashboard\n\n";

  os << "## Pipeline\n\n| Collection | Records |\n|---|---|\n";
  for (const auto& kv : s.counts) os << "| " << kv.first << " | " << kv.second << " |\n";

  os << "\n## Pending Approvals\n\n";
  if (s.pending.empty()) os << "_None._\n";
  for (const auto& p : s.pending) {
    os << "- **" << p.id << "** `" << (p.action.empty() ? "?" : p.action) << "`";
    if (!p.target.empty()) os << " to " << p.target;
    os << ", expires " << (p.expires_at ? format_iso8601(p.expires_at) : "never (treated as expired)") << "\n";
  }

  os << "\n## In Progress\n\n";
  if (s.claims.empty()) os << "_Nothing claimed._\n";
  for (const auto& kv : s.claims) os << "- " << kv.first << ": " << kv.second << "\n";

  os << "\n## Alerts\n\n";
  if (s.alerts.empty()) os << "_No alerts._\n";
  for (const auto& a : s.alerts) os << "- " << a << "\n";

  os << "\n## Recent Activity\n\n| Time | Action | Actor | Target | Result |\n|---|---|---|---|---|\n";
  for (auto it = s.recent.rbegin(); it != s.recent.rend(); ++it) {
    os << "| " << format_iso8601(it->timestamp) << " | " << it->action_type << " | " << it->actor
       << " | " << it->target << " | " << audit_result_name(it->result) << " |\n";
  }

  if (!s.fields.empty()) {
    os << "\n## Updates\n\n";
    for (const auto& kv : s.fields) {
      os << "- **" << kv.first << "**: "
         << (kv.second.is_string() ? kv.second.get<std::string>() : kv.second.dump()) << "\n";
    }
  }
  return os.str();
}

} // namespace vf
