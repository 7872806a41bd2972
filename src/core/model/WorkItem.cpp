#include "WorkItem.hpp"

#include <array>
#include <cctype>

namespace vf {

namespace {

struct StateNames {
  State       state;
  const char* name;
  const char* collection;
};

constexpr std::array<StateNames, 8> kStates{{
  {State::Intake,          "intake",           "Intake"},
  {State::Triaged,         "triaged",          "Triaged"},
  {State::Planned,         "planned",          "Planned"},
  {State::PendingApproval, "pending_approval", "Pending_Approval"},
  {State::Approved,        "approved",         "Approved"},
  {State::Rejected,        "rejected",         "Rejected"},
  {State::Expired,         "expired",          "Expired"},
  {State::Done,            "done",             "Done"},
}};

std::string lower(const std::string& s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

const char* state_name(State s) {
  for (const auto& e : kStates) if (e.state == s) return e.name;
  return "unknown";
}

const char* state_collection(State s) {
  for (const auto& e : kStates) if (e.state == s) return e.collection;
  return "";
}

std::optional<State> parse_state(const std::string& s) {
  const std::string l = lower(s);
  for (const auto& e : kStates) {
    if (l == e.name || s == e.collection || l == lower(e.collection)) return e.state;
  }
  // older records carry "pending" for freshly created items
  if (l == "pending") return State::Intake;
  return std::nullopt;
}

const char* priority_name(Priority p) {
  switch (p) {
    case Priority::Low:    return "low";
    case Priority::Normal: return "normal";
    case Priority::High:   return "high";
    case Priority::Urgent: return "urgent";
  }
  return "normal";
}

std::optional<Priority> parse_priority(const std::string& s) {
  const std::string l = lower(s);
  if (l == "low")    return Priority::Low;
  if (l == "normal") return Priority::Normal;
  if (l == "high")   return Priority::High;
  if (l == "urgent") return Priority::Urgent;
  return std::nullopt;
}

bool is_terminal(State s) {
  return s == State::Done || s == State::Rejected || s == State::Expired;
}

bool is_identifier(const std::string& s) {
  if (s.empty() || !std::islower(static_cast<unsigned char>(s[0]))) return false;
  for (char c : s) {
    if (!(std::islower(static_cast<unsigned char>(c)) ||
          std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
      return false;
    }
  }
  return true;
}

} // namespace vf
