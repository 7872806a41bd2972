#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/dashboard/DashboardAggregator.hpp"
#include "core/model/Ids.hpp"
#include "core/model/RecordCodec.hpp"
#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"
#include "services/api/StatusMap.hpp"
#include "services/runtime/Runtime.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static void reply_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

static void reply_error(httplib::Response& res, const vf::StoreError& e) {
  const int status = vf::http_status_for(e.code());
  if (status >= 500) spdlog::error("request failed: {}", e.what());
  reply_json(res, status, {{"error", vf::error_code_name(e.code())}, {"detail", e.what()}});
}

// Optional JSON body; nullopt (and a 400 reply) when present but invalid.
static std::optional<json> body_json(const httplib::Request& req, httplib::Response& res) {
  if (req.body.empty()) return json::object();
  json j = json::parse(req.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    reply_json(res, 400, {{"error", "invalid JSON body"}});
    return std::nullopt;
  }
  return j;
}

static std::string str_or(const json& j, const char* k, const std::string& def) {
  if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
  return def;
}

static std::optional<vf::State> state_param(const std::string& s, httplib::Response& res) {
  auto st = vf::parse_state(s);
  if (!st) reply_json(res, 404, {{"error", "unknown state"}, {"detail", s}});
  return st;
}

// -------- server --------

namespace vf {

void run_http_server(Runtime& rt,
                     DashboardAggregator& dashboard,
                     int port,
                     const std::string& apiKey) {
  httplib::Server svr;
  RecordStore& store = rt.store();
  AuditLedger& ledger = rt.ledger();
  ApprovalGate& gate = rt.gate();

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /collections/<state> -> ids in that collection
  svr.Get(R"(/collections/([A-Za-z_]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto st = state_param(req.matches[1], res);
    if (!st) return;
    try {
      reply_json(res, 200, {{"state", state_name(*st)}, {"ids", store.list(collection_of(*st))}});
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // GET /items/<state>/<id> -> record
  svr.Get(R"(/items/([A-Za-z_]+)/([A-Za-z0-9][A-Za-z0-9._-]*))",
          [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto st = state_param(req.matches[1], res);
    if (!st) return;
    try {
      reply_json(res, 200, to_json(store.read(collection_of(*st), req.matches[2])));
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // GET /ledger/<YYYY-MM-DD> -> entries in append order
  svr.Get(R"(/ledger/(\d{4}-\d{2}-\d{2}))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      json entries = json::array();
      for (const auto& e : ledger.read(req.matches[1])) entries.push_back(to_json(e));
      reply_json(res, 200, {{"partition", std::string(req.matches[1])}, {"entries", entries}});
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // GET /dashboard -> current snapshot
  svr.Get("/dashboard", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    try {
      if (dashboard.role() == DashboardRole::Authoritative) dashboard.merge();
      reply_json(res, 200, to_json(dashboard.snapshot()));
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // POST /deltas
  // Body: {"field": ..., "value": ..., "delta_id"?: ..., "at"?: epoch seconds, "author"?: ...}
  svr.Post("/deltas", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto j = body_json(req, res);
    if (!j) return;

    DashboardDelta d;
    d.delta_id = str_or(*j, "delta_id", uuid4());
    d.field = str_or(*j, "field", "");
    d.author = str_or(*j, "author", req.get_header_value("X-Author"));
    if (d.field.empty() || !j->contains("value")) {
      reply_json(res, 422, {{"error", "field and value required"}});
      return;
    }
    d.value = (*j)["value"];
    if (j->contains("at") && (*j)["at"].is_number_integer()) d.at = (*j)["at"].get<int64_t>();

    try {
      dashboard.submitDelta(d);
    } catch (const StoreError& e) {
      reply_error(res, e);
      return;
    }
    reply_json(res, 202, {{"delta_id", d.delta_id}});
  });

  // POST /approvals/<id>/approve   Body: {"approver"?: ...}
  svr.Post(R"(/approvals/([A-Za-z0-9][A-Za-z0-9._-]*)/approve)",
           [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto j = body_json(req, res);
    if (!j) return;
    const std::string id = req.matches[1];
    const std::string approver = str_or(*j, "approver", "human");
    try {
      const GateDecision d = gate.approve(id, approver);
      const int status = d == GateDecision::Executable ? 200 : d == GateDecision::NotFound ? 404 : 409;
      reply_json(res, status, {{"id", id}, {"decision", gate_decision_name(d)}});
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // POST /approvals/<id>/reject    Body: {"approver"?: ..., "reason"?: ...}
  svr.Post(R"(/approvals/([A-Za-z0-9][A-Za-z0-9._-]*)/reject)",
           [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    auto j = body_json(req, res);
    if (!j) return;
    const std::string id = req.matches[1];
    try {
      gate.reject(id, str_or(*j, "approver", "human"), str_or(*j, "reason", ""));
      reply_json(res, 200, {{"id", id}, {"state", state_name(State::Rejected)}});
    } catch (const StoreError& e) {
      reply_error(res, e);
    }
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
    throw std::runtime_error("cannot listen on port " + std::to_string(port));
  }
}

} // namespace vf
