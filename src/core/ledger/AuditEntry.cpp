#include "AuditEntry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

using nlohmann::json;

namespace vf {

const char* audit_result_name(AuditResult r) {
  switch (r) {
    case AuditResult::Success: return "success";
    case AuditResult::Failure: return "failure";
    case AuditResult::Partial: return "partial";
  }
  return "failure";
}

std::optional<AuditResult> parse_audit_result(const std::string& s) {
  if (s == "success") return AuditResult::Success;
  if (s == "failure") return AuditResult::Failure;
  if (s == "partial") return AuditResult::Partial;
  return std::nullopt;
}

static bool looks_secret(const std::string& key) {
  static const std::array<const char*, 7> kMarkers = {
    "token", "secret", "password", "passwd", "credential", "api_key", "authorization"
  };
  std::string k(key);
  std::transform(k.begin(), k.end(), k.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const char* m : kMarkers) {
    if (k.find(m) != std::string::npos) return true;
  }
  return false;
}

std::map<std::string, std::string> bound_parameters(const std::map<std::string, std::string>& in) {
  std::map<std::string, std::string> out;
  for (const auto& kv : in) {
    if (out.size() >= kMaxParameters) break;
    if (looks_secret(kv.first)) {
      out.emplace(kv.first, "***");
      continue;
    }
    std::string v = kv.second;
    if (v.size() > kMaxParameterValue) {
      size_t cut = kMaxParameterValue - 3;
      // never split a UTF-8 sequence: back up over continuation bytes
      while (cut > 0 && (static_cast<unsigned char>(v[cut]) & 0xC0) == 0x80) --cut;
      v.resize(cut);
      v += "...";
    }
    out.emplace(kv.first, std::move(v));
  }
  return out;
}

json to_json(const AuditLogEntry& e) {
  json j = {
    {"timestamp", format_iso8601(e.timestamp)},
    {"action_type", e.action_type},
    {"actor", e.actor},
    {"target", e.target},
    {"parameters", e.parameters},
    {"result", audit_result_name(e.result)}
  };
  if (!e.error_detail.empty())    j["error_detail"] = e.error_detail;
  if (!e.approval_status.empty()) j["approval_status"] = e.approval_status;
  if (!e.approved_by.empty())     j["approved_by"] = e.approved_by;
  return j;
}

AuditLogEntry audit_entry_from_json(const json& j) {
  AuditLogEntry e;
  auto ts = parse_iso8601(j.at("timestamp").get<std::string>());
  if (!ts) throw std::invalid_argument("bad timestamp");
  e.timestamp = *ts;
  e.action_type = j.at("action_type").get<std::string>();
  e.actor = j.at("actor").get<std::string>();
  e.target = j.at("target").get<std::string>();
  if (j.contains("parameters") && j["parameters"].is_object()) {
    for (auto it = j["parameters"].begin(); it != j["parameters"].end(); ++it) {
      e.parameters[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
  }
  auto r = parse_audit_result(j.at("result").get<std::string>());
  if (!r) throw std::invalid_argument("bad result");
  e.result = *r;
  e.error_detail = j.value("error_detail", "");
  e.approval_status = j.value("approval_status", "");
  e.approved_by = j.value("approved_by", "");
  return e;
}

} // namespace vf
