#include "RecordStore.hpp"

#include <spdlog/spdlog.h>

#include "core/model/RecordCodec.hpp"
#include "core/storage/Collections.hpp"

namespace vf {

void RecordStore::create(const WorkItem& item) {
  create(collection_of(item.state), item);
}

void RecordStore::create(const std::string& collection, const WorkItem& item) {
  createExclusive(collection, item.id, encode_record(item));
}

WorkItem RecordStore::read(const std::string& collection, const std::string& id) const {
  return decode_record(readRaw(collection, id), state_of_collection(collection));
}

WorkItem RecordStore::update(const std::string& collection,
                             const std::string& id,
                             const std::function<void(WorkItem&)>& mutator) {
  WorkItem item = read(collection, id);
  const std::string originalId = item.id;
  mutator(item);
  item.id = originalId;
  replaceRaw(collection, id, encode_record(item));
  return item;
}

void RecordStore::quarantine(const std::string& collection, const std::string& id) {
  moveAtomic(collection, kQuarantine, id);
  spdlog::warn("quarantined {}/{}", collection, id);
}

std::optional<std::string> RecordStore::locate(const std::string& id) const {
  for (State s : {State::Intake, State::Triaged, State::Planned, State::PendingApproval,
                  State::Approved, State::Rejected, State::Expired, State::Done}) {
    if (exists(collection_of(s), id)) return collection_of(s);
  }
  for (const auto& owner : children(kInProgressRoot)) {
    const std::string c = std::string(kInProgressRoot) + "/" + owner;
    if (exists(c, id)) return c;
  }
  if (exists(kQuarantine, id)) return std::string(kQuarantine);
  return std::nullopt;
}

} // namespace vf
