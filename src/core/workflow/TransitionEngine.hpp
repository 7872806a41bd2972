#pragma once
#include <map>
#include <optional>
#include <string>

#include "core/ledger/AuditLedger.hpp"
#include "core/model/WorkItem.hpp"
#include "core/storage/RecordStore.hpp"
#include "core/storage/StoreError.hpp"

namespace vf {

enum class CreateOutcome { Created, Duplicate };

// Validates and performs state transitions. Each transition is exactly one
// moveAtomic between two collections followed by a ledger entry; the status
// mirror inside the record is refreshed afterwards.
class TransitionEngine {
public:
  TransitionEngine(RecordStore& store, AuditLedger& ledger);

  // Adapter entry point. A retried creation of the same id is a Duplicate,
  // which callers treat as success.
  CreateOutcome createIntake(WorkItem item, const std::string& actor);

  // Derived plan record, created directly in Planned.
  CreateOutcome createPlan(WorkItem plan, const std::string& actor);

  // Creates `item` in the collection of `state` (stamping created_at when
  // unset). Used for derived records such as approval requests.
  CreateOutcome createIn(State state, WorkItem item, const std::string& actor);

  // Moves `id` from the collection of `from` to the collection of `to`.
  // Throws StoreError: IllegalTransition (after flagging the record and
  // writing the ledger), NotFound when a competitor moved it first.
  void transition(const std::string& id,
                  State from,
                  State to,
                  const std::string& actor,
                  const std::map<std::string, std::string>& parameters = {});

  // Moves an item out of an owner-scoped collection. The state it was claimed
  // from is read from its status mirror. Returns that state.
  State advanceFrom(const std::string& ownerCollection,
                    const std::string& id,
                    State to,
                    const std::string& actor,
                    const std::map<std::string, std::string>& parameters = {});

  // Creates a new Intake record carrying the content of a rejected one.
  CreateOutcome resubmit(const std::string& rejectedId,
                         const std::string& newId,
                         const std::string& actor);

  // Read that quarantines malformed records (ledger + Quarantine) and
  // returns nullopt for them and for records that are gone.
  std::optional<WorkItem> readOrQuarantine(const std::string& collection,
                                           const std::string& id,
                                           const std::string& actor);

  RecordStore& store() { return store_; }
  AuditLedger& ledger() { return ledger_; }

private:
  void move(const std::string& fromCollection, State from, State to, const std::string& id,
            const std::string& actor, const std::map<std::string, std::string>& parameters);
  [[noreturn]] void rejectIllegal(const std::string& collection, const std::string& id,
                                  State from, State to, const std::string& actor);
  void refreshStatus(const std::string& collection, const std::string& id, const std::string& actor);
  void quarantineMalformed(const std::string& collection, const std::string& id,
                           const StoreError& e, const std::string& actor);

  RecordStore& store_;
  AuditLedger& ledger_;
};

} // namespace vf
