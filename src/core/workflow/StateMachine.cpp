#include "StateMachine.hpp"

namespace vf {

std::vector<State> successors(State from) {
  switch (from) {
    case State::Intake:          return {State::Triaged};
    case State::Triaged:         return {State::Planned, State::Done};
    case State::Planned:         return {State::PendingApproval, State::Done};
    case State::PendingApproval: return {State::Approved, State::Rejected, State::Expired};
    case State::Approved:        return {State::Done, State::Expired};
    case State::Rejected:
    case State::Expired:
    case State::Done:            return {};
  }
  return {};
}

bool is_legal_transition(State from, State to) {
  for (State s : successors(from)) {
    if (s == to) return true;
  }
  return false;
}

} // namespace vf
