#include "Collections.hpp"

#include <cctype>

#include "core/storage/StoreError.hpp"

namespace vf {

bool is_valid_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  if (!std::isalnum(static_cast<unsigned char>(id[0]))) return false;
  for (char c : id) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-')) {
      return false;
    }
  }
  return true;
}

bool is_valid_collection(const std::string& collection) {
  if (collection.empty()) return false;
  size_t pos = 0;
  while (pos <= collection.size()) {
    size_t slash = collection.find('/', pos);
    if (slash == std::string::npos) slash = collection.size();
    if (!is_valid_id(collection.substr(pos, slash - pos))) return false;
    pos = slash + 1;
  }
  return true;
}

std::string owner_collection(const std::string& owner_id) {
  if (!is_valid_id(owner_id)) {
    throw StoreError(ErrorCode::InvalidId, "invalid owner id '" + owner_id + "'");
  }
  return std::string(kInProgressRoot) + "/" + owner_id;
}

std::optional<State> state_of_collection(const std::string& collection) {
  for (State s : {State::Intake, State::Triaged, State::Planned, State::PendingApproval,
                  State::Approved, State::Rejected, State::Expired, State::Done}) {
    if (collection == state_collection(s)) return s;
  }
  return std::nullopt;
}

} // namespace vf
