#include "Executor.hpp"

#include <sstream>

#include <spdlog/spdlog.h>

namespace vf {

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::string extract_section(const std::string& body, const std::string& header) {
  std::istringstream in(body);
  std::string line;
  std::string out;
  bool inside = false;
  while (std::getline(in, line)) {
    if (line.rfind("## ", 0) == 0) {
      if (inside) break;
      inside = trim(line.substr(3)) == header;
      continue;
    }
    if (inside) out += line + "\n";
  }
  return trim(out);
}

static std::string meta_or(const WorkItem& item, const char* key, const std::string& def) {
  auto it = item.metadata.find(key);
  return it != item.metadata.end() && !it->second.empty() ? it->second : def;
}

ExecutionOutcome ManualExecutor::execute(const WorkItem& item) {
  std::string text = extract_section(item.body, "Draft Reply");
  if (text.empty()) text = extract_section(item.body, "Message");

  const std::string contact = meta_or(item, "contact", "(unknown)");
  const std::string channel = item.target.empty() ? meta_or(item, "channel", contact) : item.target;
  const std::string from = meta_or(item, "author", contact);
  const std::string rule(62, '-');

  spdlog::info("\n{}\n  ACTION REQUIRED: manual {} reply\n  Item     : {}\n  Channel  : {}\n"
               "  From     : {}\n\n  Reply text to send:\n\n{}\n\n{}",
               rule, platform_, item.id, channel, from,
               text.empty() ? "(no draft in the approval record)" : text, rule);

  return ExecutionOutcome{AuditResult::Success, "manual_required", {}};
}

} // namespace vf
