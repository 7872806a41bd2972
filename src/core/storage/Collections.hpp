#pragma once
#include <optional>
#include <string>

#include "core/model/WorkItem.hpp"

namespace vf {

// Collection names are relative directory paths under the vault root.
inline constexpr const char* kInProgressRoot = "In_Progress";
inline constexpr const char* kQuarantine = "Quarantine";
inline constexpr const char* kUpdates = "Updates";
inline constexpr const char* kLogsDir = "Logs";
inline constexpr const char* kStateDir = ".state";

// [A-Za-z0-9][A-Za-z0-9._-]{0,127}
bool is_valid_id(const std::string& id);

// One or more '/'-separated segments, each a valid id.
bool is_valid_collection(const std::string& collection);

inline std::string collection_of(State s) { return state_collection(s); }

// Owner-scoped namespace for claims: In_Progress/<owner>
std::string owner_collection(const std::string& owner_id);

// Inverse of collection_of; nullopt for owner scopes, Quarantine, Updates.
std::optional<State> state_of_collection(const std::string& collection);

} // namespace vf
