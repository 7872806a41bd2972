#include "Cli.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/model/Ids.hpp"
#include "core/model/RecordCodec.hpp"
#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"
#include "services/orchestrator/Orchestrator.hpp"
#include "services/runtime/Runtime.hpp"

using nlohmann::json;

// ---------- helpers ----------

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

// Positional arguments plus "--key value" options.
struct Args {
  std::vector<std::string> pos;
  std::map<std::string, std::string> opt;

  const std::string& at(size_t i, const char* what) const {
    if (i >= pos.size()) throw std::invalid_argument(std::string("missing ") + what);
    return pos[i];
  }
  std::string get(const std::string& k, const std::string& def = {}) const {
    auto it = opt.find(k);
    return it == opt.end() ? def : it->second;
  }
  bool has(const std::string& k) const { return opt.count(k) > 0; }
};

Args parse_args(int argc, char** argv, int first) {
  Args a;
  for (int i = first; i < argc; ++i) {
    std::string s = argv[i];
    if (s.rfind("--", 0) == 0) {
      std::string key = s.substr(2);
      if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
        a.opt[key] = argv[++i];
      } else {
        a.opt[key] = "";
      }
    } else {
      a.pos.push_back(std::move(s));
    }
  }
  return a;
}

vf::State state_arg(const std::string& s) {
  auto st = vf::parse_state(s);
  if (!st) throw std::invalid_argument("unknown state '" + s + "'");
  return *st;
}

std::string body_arg(const Args& a) {
  if (a.has("body-file")) {
    std::ifstream in(a.get("body-file"), std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + a.get("body-file"));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
  return a.get("body");
}

vf::Priority priority_arg(const Args& a) {
  if (!a.has("priority")) return vf::Priority::Normal;
  auto p = vf::parse_priority(a.get("priority"));
  if (!p) throw std::invalid_argument("unknown priority '" + a.get("priority") + "'");
  return *p;
}

// --meta k1=v1,k2=v2
std::map<std::string, std::string> metadata_arg(const Args& a) {
  std::map<std::string, std::string> m;
  std::stringstream ss(a.get("meta"));
  std::string kv;
  while (std::getline(ss, kv, ',')) {
    auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    m[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  return m;
}

void print_usage(std::ostream& out, const char* argv0) {
  out << "Usage:\n"
            << "  " << argv0 << " init                                   # create vault layout and coordination DB\n"
            << "  " << argv0 << " ingest <id> <kind> [--source S] [--priority P] [--body T | --body-file F] [--meta k=v,...]\n"
            << "  " << argv0 << " plan <id> --linked <item> [--body T | --body-file F]\n"
            << "  " << argv0 << " transition <id> <from> <to>\n"
            << "  " << argv0 << " request-approval <id> --action A [--target T] [--linked X] [--body T | --body-file F]\n"
            << "  " << argv0 << " submit <id> --action A [--target T]      # Planned -> Pending_Approval\n"
            << "  " << argv0 << " approve <id> [--by NAME]\n"
            << "  " << argv0 << " reject <id> [--by NAME] [--reason R]\n"
            << "  " << argv0 << " resubmit <rejected-id> [<new-id>]\n"
            << "  " << argv0 << " check <id>                             # is the approval executable now?\n"
            << "  " << argv0 << " claim <state> <id>\n"
            << "  " << argv0 << " complete <id> <to>\n"
            << "  " << argv0 << " release <id> [--reason R]\n"
            << "  " << argv0 << " sweep                                  # expire overdue approvals, reclaim stale claims\n"
            << "  " << argv0 << " dashboard                              # merge deltas and publish Dashboard.md\n"
            << "  " << argv0 << " delta <field> <json-value> [--id D]     # contribute a dashboard field\n"
            << "  " << argv0 << " orchestrate [--once]                   # execute approved actions\n"
            << "  " << argv0 << " status                                 # dashboard snapshot as JSON\n"
            << "  " << argv0 << " ledger [YYYY-MM-DD]\n"
            << "Environment: VAULT_PATH, VF_CONFIG, VF_OWNER_ID, VF_DRY_RUN, VF_LOG_LEVEL, ...\n";
}

int run(const std::string& cmd, const Args& a, vf::Runtime& rt, std::ostream& out) {
  using namespace vf;
  const std::string& owner = rt.owner();

  if (cmd == "init") {
    out << "vault initialized at: " << rt.config().vault_path << "\n"
              << "coordination DB: " << rt.config().coordinationDbPath() << "\n";
    return kExitOk;
  }

  if (cmd == "ingest") {
    WorkItem w;
    w.id = a.at(0, "id");
    w.kind = a.at(1, "kind");
    w.source = a.get("source", "cli");
    w.priority = priority_arg(a);
    w.body = body_arg(a);
    w.metadata = metadata_arg(a);
    auto res = rt.engine().createIntake(w, owner);
    out << (res == CreateOutcome::Created ? "created " : "duplicate ") << w.id << "\n";
    return kExitOk;
  }

  if (cmd == "plan") {
    WorkItem w;
    w.id = a.at(0, "id");
    w.kind = kKindPlan;
    w.source = owner;
    w.linked_item_id = a.get("linked");
    w.priority = priority_arg(a);
    w.body = body_arg(a);
    auto res = rt.engine().createPlan(w, owner);
    out << (res == CreateOutcome::Created ? "created " : "duplicate ") << w.id << "\n";
    return kExitOk;
  }

  if (cmd == "transition") {
    rt.engine().transition(a.at(0, "id"), state_arg(a.at(1, "from")), state_arg(a.at(2, "to")), owner);
    out << a.pos[0] << " -> " << state_name(state_arg(a.pos[2])) << "\n";
    return kExitOk;
  }

  if (cmd == "request-approval") {
    ApprovalSpec spec;
    spec.id = a.at(0, "id");
    spec.action = a.get("action");
    spec.target = a.get("target");
    spec.linked_item_id = a.get("linked");
    spec.priority = priority_arg(a);
    spec.body = body_arg(a);
    spec.metadata = metadata_arg(a);
    if (spec.action.empty()) throw std::invalid_argument("missing --action");
    auto res = rt.gate().requestApproval(spec, owner);
    out << (res == CreateOutcome::Created ? "requested " : "duplicate ") << spec.id << "\n";
    return kExitOk;
  }

  if (cmd == "submit") {
    if (a.get("action").empty()) throw std::invalid_argument("missing --action");
    rt.gate().submitForApproval(a.at(0, "id"), a.get("action"), a.get("target"), owner);
    out << a.pos[0] << " -> " << state_name(State::PendingApproval) << "\n";
    return kExitOk;
  }

  if (cmd == "approve") {
    GateDecision d = rt.gate().approve(a.at(0, "id"), a.get("by", "human"));
    out << a.pos[0] << ": " << gate_decision_name(d) << "\n";
    return d == GateDecision::Executable ? kExitOk : kExitRefused;
  }

  if (cmd == "reject") {
    rt.gate().reject(a.at(0, "id"), a.get("by", "human"), a.get("reason"));
    out << a.pos[0] << " -> " << state_name(State::Rejected) << "\n";
    return kExitOk;
  }

  if (cmd == "resubmit") {
    const std::string newId = a.pos.size() > 1 ? a.pos[1] : a.at(0, "rejected id") + "-r" + uuid4().substr(0, 8);
    auto res = rt.engine().resubmit(a.at(0, "rejected id"), newId, owner);
    out << (res == CreateOutcome::Created ? "resubmitted as " : "duplicate ") << newId << "\n";
    return kExitOk;
  }

  if (cmd == "check") {
    GateDecision d = rt.gate().checkExecutable(a.at(0, "id"));
    out << a.pos[0] << ": " << gate_decision_name(d) << "\n";
    return d == GateDecision::Executable ? kExitOk : kExitRefused;
  }

  if (cmd == "claim") {
    auto res = rt.claims().claim(state_arg(a.at(0, "state")), a.at(1, "id"), owner);
    if (res == ClaimOutcome::AlreadyClaimed) {
      out << a.pos[1] << ": already claimed\n";
      return kExitRefused;
    }
    out << a.pos[1] << ": claimed by " << owner << "\n";
    return kExitOk;
  }

  if (cmd == "complete") {
    rt.claims().complete(owner, a.at(0, "id"), state_arg(a.at(1, "to")));
    out << a.pos[0] << " -> " << state_name(state_arg(a.pos[1])) << "\n";
    return kExitOk;
  }

  if (cmd == "release") {
    rt.claims().release(owner, a.at(0, "id"), a.get("reason", "released"));
    out << a.pos[0] << ": released\n";
    return kExitOk;
  }

  if (cmd == "sweep") {
    auto expired = rt.gate().expireOverdue(owner);
    auto report = rt.claims().reclaimStale(rt.config().claim_ttl, owner);
    out << "expired: " << expired.size()
              << ", reclaimed: " << report.reclaimed.size()
              << ", orphans: " << report.orphans.size() << "\n";
    return kExitOk;
  }

  if (cmd == "dashboard") {
    auto dash = rt.openDashboard(DashboardRole::Authoritative);
    dash->publish();
    out << "published " << dash->dashboardPath() << "\n";
    return kExitOk;
  }

  if (cmd == "delta") {
    DashboardDelta d;
    d.delta_id = a.get("id", uuid4());
    d.field = a.at(0, "field");
    d.value = json::parse(a.at(1, "value"), nullptr, false);
    if (d.value.is_discarded()) d.value = a.pos[1];
    d.author = owner;
    rt.openDashboard(DashboardRole::Contributor)->submitDelta(d);
    out << "submitted " << d.delta_id << "\n";
    return kExitOk;
  }

  if (cmd == "orchestrate") {
    Orchestrator orch(rt.engine(), rt.claims(), rt.gate(), owner, rt.config().dry_run);
    register_builtin_executors(orch);
    if (a.has("once")) {
      PassReport r = orch.runOnce();
      out << "executed: " << r.executed << ", expired: " << r.expired
                << ", skipped: " << r.skipped << ", contended: " << r.contended << "\n";
      return kExitOk;
    }
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    orch.runLoop(rt.config().poll_interval, g_stop);
    return kExitOk;
  }

  if (cmd == "status") {
    auto dash = rt.openDashboard(DashboardRole::Contributor);
    out << to_json(dash->snapshot()).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return kExitOk;
  }

  if (cmd == "ledger") {
    const std::string key = a.pos.empty() ? date_key(rt.store().clock().now()) : a.pos[0];
    if (!is_date_key(key)) throw std::invalid_argument("expected YYYY-MM-DD, got '" + key + "'");
    for (const auto& e : rt.ledger().read(key)) out << to_json(e).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    return kExitOk;
  }

  return -1;
}

} // namespace

namespace vf {

int run_cli(int argc, char** argv, const Config& cfg, std::ostream& out, std::ostream& err) {
  const char* argv0 = argc > 0 ? argv[0] : "vaultflow";
  if (argc < 2) {
    print_usage(out, argv0);
    return kExitUsage;
  }
  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    print_usage(out, argv0);
    return kExitOk;
  }

  try {
    Runtime rt(cfg);
    const int rc = run(cmd, parse_args(argc, argv, 2), rt, out);
    if (rc < 0) {
      err << "error: unknown command '" << cmd << "'\n";
      print_usage(out, argv0);
      return kExitUsage;
    }
    return rc;
  } catch (const std::invalid_argument& e) {
    err << "error: " << e.what() << "\n";
    print_usage(out, argv0);
    return kExitUsage;
  } catch (const StoreError& e) {
    err << "error: " << e.what() << "\n";
    return kExitRefused;
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", cmd, e.what());
    err << "Fatal: " << e.what() << "\n";
    return kExitFatal;
  }
}

} // namespace vf
