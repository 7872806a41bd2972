#pragma once
#include <vector>

#include "core/model/WorkItem.hpp"

namespace vf {

// The one transition graph every producer and consumer shares:
//
//   Intake          -> Triaged
//   Triaged         -> Planned | Done
//   Planned         -> PendingApproval | Done
//   PendingApproval -> Approved | Rejected | Expired
//   Approved        -> Done | Expired
//
// Done, Rejected and Expired are terminal.
bool is_legal_transition(State from, State to);

std::vector<State> successors(State from);

inline constexpr State kInitialState = State::Intake;

} // namespace vf
