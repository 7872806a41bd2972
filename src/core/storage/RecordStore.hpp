#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/model/WorkItem.hpp"
#include "core/storage/Clock.hpp"

namespace vf {

// Durable, hierarchically named persistence. Concurrency correctness of the
// whole pipeline rests on the two atomic primitives below; any backend that
// offers exclusive create and move-if-present satisfies the contract.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // Throws StoreError(AlreadyExists) if `id` is already in `collection`.
  // Readers never observe partially written content.
  virtual void createExclusive(const std::string& collection,
                               const std::string& id,
                               const std::string& content) = 0;

  // Indivisible relocation. Throws StoreError(NotFound) if `id` is not in
  // `from`, StoreError(AlreadyExists) if `to` already holds it. The record is
  // always in exactly one of the two collections.
  virtual void moveAtomic(const std::string& from,
                          const std::string& to,
                          const std::string& id) = 0;

  // Snapshot, sorted. Stale as soon as it returns.
  virtual std::vector<std::string> list(const std::string& collection) const = 0;

  // Child collections of `parent` (e.g. owner scopes under In_Progress).
  virtual std::vector<std::string> children(const std::string& parent) const = 0;

  virtual bool exists(const std::string& collection, const std::string& id) const = 0;

  // Throws StoreError(NotFound).
  virtual std::string readRaw(const std::string& collection, const std::string& id) const = 0;

  // Replaces content of an existing record. Never recreates a record that was
  // moved away concurrently: throws StoreError(NotFound) instead.
  virtual void replaceRaw(const std::string& collection,
                          const std::string& id,
                          const std::string& content) = 0;

  // Last time the record was written or moved, in store time.
  virtual Timestamp modifiedAt(const std::string& collection, const std::string& id) const = 0;

  // Owner liveness shared by every host that mounts the store. Stamps the
  // owner's lease with `at` (store time).
  virtual void touchLease(const std::string& owner, Timestamp at) = 0;

  // Last stamp of the owner's lease; nullopt if the owner never held one.
  virtual std::optional<Timestamp> leaseAt(const std::string& owner) const = 0;

  // Authoritative time source for expiry decisions.
  virtual const Clock& clock() const = 0;

  // -------- typed helpers --------

  // Serializes and creates the item in the collection of its state.
  void create(const WorkItem& item);
  void create(const std::string& collection, const WorkItem& item);

  // Decodes and validates. Items read from a state collection take that state;
  // items in other collections keep their status mirror.
  WorkItem read(const std::string& collection, const std::string& id) const;

  // Last-writer-wins read-modify-write. The caller must hold custody (a claim)
  // when the record is contended.
  WorkItem update(const std::string& collection,
                  const std::string& id,
                  const std::function<void(WorkItem&)>& mutator);

  // Moves a record into Quarantine for human review.
  void quarantine(const std::string& collection, const std::string& id);

  // Collection currently holding `id`, searching state collections, owner
  // scopes and Quarantine.
  std::optional<std::string> locate(const std::string& id) const;
};

} // namespace vf
