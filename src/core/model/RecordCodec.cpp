#include "RecordCodec.hpp"

#include <cctype>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"

using nlohmann::json;

namespace vf {

namespace {

const std::set<std::string> kReserved = {
  "id", "type", "status", "priority", "created", "source",
  "action", "expires", "linked_item", "target", "to"
};

[[noreturn]] void malformed(const std::string& why) {
  throw StoreError(ErrorCode::MalformedRecord, why);
}

bool is_key(const std::string& k) {
  if (k.empty()) return false;
  for (char c : k) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool needs_quotes(const std::string& v) {
  if (v.empty()) return true;
  if (std::isspace(static_cast<unsigned char>(v.front())) ||
      std::isspace(static_cast<unsigned char>(v.back()))) {
    return true;
  }
  if (v.front() == '\'') return true;
  for (char c : v) {
    if (c == '"' || c == '\\' || c == '\n' || c == '\r' || c == '\t' || c == '#' || c == ':') {
      return true;
    }
  }
  return false;
}

std::string quote(const std::string& v) {
  if (!needs_quotes(v)) return v;
  std::string out = "\"";
  for (char c : v) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:   out += c;
    }
  }
  out += '"';
  return out;
}

std::string unquote(const std::string& raw) {
  std::string v = trim(raw);
  if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') {
    return v.substr(1, v.size() - 2);
  }
  if (v.empty() || v.front() != '"') return v;

  std::string out;
  size_t i = 1;
  for (; i < v.size(); ++i) {
    char c = v[i];
    if (c == '"') break;
    if (c == '\\' && i + 1 < v.size()) {
      char n = v[++i];
      switch (n) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default:  out += n;
      }
      continue;
    }
    out += c;
  }
  if (i >= v.size()) malformed("unterminated quoted value");
  return out;
}

} // namespace

void validate_record(const WorkItem& item) {
  if (!is_valid_id(item.id)) malformed("invalid id '" + item.id + "'");
  if (!is_identifier(item.kind)) malformed("invalid type '" + item.kind + "' for " + item.id);
  if (item.source.empty()) malformed("missing source for " + item.id);
  if (item.created_at <= 0) malformed("missing created timestamp for " + item.id);
  if (!item.action.empty() && !is_identifier(item.action)) {
    malformed("invalid action '" + item.action + "' for " + item.id);
  }
  if (!item.linked_item_id.empty() && !is_valid_id(item.linked_item_id)) {
    malformed("invalid linked_item '" + item.linked_item_id + "' for " + item.id);
  }
  if (item.kind == kKindApprovalRequest) {
    if (item.action.empty()) malformed("approval request " + item.id + " has no action");
    if (!item.expires_at) malformed("approval request " + item.id + " has no expiry");
  }
  if (item.expires_at && *item.expires_at <= item.created_at) {
    malformed("expiry precedes creation for " + item.id);
  }
  for (const auto& kv : item.metadata) {
    if (!is_key(kv.first) || kReserved.count(kv.first)) {
      malformed("invalid metadata key '" + kv.first + "' for " + item.id);
    }
  }
}

std::string encode_record(const WorkItem& item) {
  validate_record(item);

  std::ostringstream os;
  os << "---\n";
  os << "id: " << quote(item.id) << "\n";
  os << "type: " << item.kind << "\n";
  os << "status: " << state_name(item.state) << "\n";
  os << "priority: " << priority_name(item.priority) << "\n";
  os << "created: " << format_iso8601(item.created_at) << "\n";
  os << "source: " << quote(item.source) << "\n";
  if (!item.action.empty())         os << "action: " << item.action << "\n";
  if (item.expires_at)              os << "expires: " << format_iso8601(*item.expires_at) << "\n";
  if (!item.linked_item_id.empty()) os << "linked_item: " << quote(item.linked_item_id) << "\n";
  if (!item.target.empty())         os << "target: " << quote(item.target) << "\n";
  for (const auto& kv : item.metadata) {
    os << kv.first << ": " << quote(kv.second) << "\n";
  }
  os << "---\n";
  if (!item.body.empty()) os << "\n" << item.body;
  return os.str();
}

WorkItem decode_record(const std::string& content, std::optional<State> location) {
  if (content.compare(0, 4, "---\n") != 0 && content.compare(0, 5, "---\r\n") != 0) {
    malformed("no frontmatter block");
  }
  size_t start = content.find('\n') + 1;
  size_t end = content.find("\n---", start - 1);
  if (end == std::string::npos) malformed("unterminated frontmatter block");

  std::map<std::string, std::string> fm;
  std::istringstream lines(content.substr(start, end - start + 1));
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;
    auto colon = t.find(':');
    if (colon == std::string::npos) malformed("frontmatter line without key: '" + t + "'");
    std::string key = trim(t.substr(0, colon));
    if (!is_key(key)) malformed("invalid frontmatter key '" + key + "'");
    fm[key] = unquote(t.substr(colon + 1));
  }

  // body starts after the closing "---" line and an optional blank line
  size_t body_pos = content.find('\n', end + 1);
  std::string body;
  if (body_pos != std::string::npos) {
    body = content.substr(body_pos + 1);
    if (body.compare(0, 1, "\n") == 0) body.erase(0, 1);
    else if (body.compare(0, 2, "\r\n") == 0) body.erase(0, 2);
  }

  auto required = [&](const char* k) -> const std::string& {
    auto it = fm.find(k);
    if (it == fm.end() || it->second.empty()) malformed(std::string("missing field '") + k + "'");
    return it->second;
  };

  WorkItem item;
  item.id = required("id");
  item.kind = required("type");
  item.source = required("source");
  item.body = std::move(body);

  if (location) {
    item.state = *location;
  } else {
    auto st = parse_state(required("status"));
    if (!st) malformed("unknown status '" + fm["status"] + "'");
    item.state = *st;
  }

  auto pr = parse_priority(required("priority"));
  if (!pr) malformed("unknown priority '" + fm["priority"] + "'");
  item.priority = *pr;

  auto created = parse_iso8601(required("created"));
  if (!created) malformed("unparseable created timestamp '" + fm["created"] + "'");
  item.created_at = *created;

  if (auto it = fm.find("action"); it != fm.end()) item.action = it->second;
  if (auto it = fm.find("linked_item"); it != fm.end()) item.linked_item_id = it->second;
  if (auto it = fm.find("target"); it != fm.end()) item.target = it->second;
  // hand-written approval files name the recipient `to:`
  if (auto it = fm.find("to"); it != fm.end() && item.target.empty()) item.target = it->second;
  if (auto it = fm.find("expires"); it != fm.end() && !it->second.empty()) {
    auto exp = parse_iso8601(it->second);
    if (!exp) malformed("unparseable expires timestamp '" + it->second + "'");
    item.expires_at = *exp;
  }

  for (auto& kv : fm) {
    if (!kReserved.count(kv.first)) item.metadata.emplace(kv.first, kv.second);
  }

  validate_record(item);
  return item;
}

json to_json(const WorkItem& item) {
  json j = {
    {"id", item.id},
    {"type", item.kind},
    {"status", state_name(item.state)},
    {"priority", priority_name(item.priority)},
    {"created", format_iso8601(item.created_at)},
    {"source", item.source},
    {"metadata", item.metadata},
    {"body", item.body}
  };
  if (!item.action.empty())         j["action"] = item.action;
  if (item.expires_at)              j["expires"] = format_iso8601(*item.expires_at);
  if (!item.linked_item_id.empty()) j["linked_item"] = item.linked_item_id;
  if (!item.target.empty())         j["target"] = item.target;
  return j;
}

} // namespace vf
