#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/ledger/AuditEntry.hpp"
#include "core/storage/Clock.hpp"

namespace vf {

// Append-only, date-partitioned audit trail: <dir>/<YYYY-MM-DD>.jsonl, one
// JSON object per line. Appends from any number of processes are serialized
// by an exclusive flock(2) on the partition file and land as one write(2) of
// a complete line. There is deliberately no update or delete.
class AuditLedger {
public:
  AuditLedger(std::string dir, const Clock& clock);

  void append(const std::string& partitionKey, const AuditLogEntry& entry);

  // Partition derived from the entry's timestamp (UTC date).
  void append(const AuditLogEntry& entry);

  // Stamps the entry with the clock, bounds its parameters and appends it.
  AuditLogEntry record(const std::string& actionType,
                       const std::string& actor,
                       const std::string& target,
                       const std::map<std::string, std::string>& parameters,
                       AuditResult result = AuditResult::Success,
                       const std::string& errorDetail = {});

  // Entries in append order. Torn or undecodable lines are skipped.
  std::vector<AuditLogEntry> read(const std::string& partitionKey) const;

  // Sorted partition keys.
  std::vector<std::string> partitions() const;

  // The last `n` entries across the newest partitions, oldest first.
  std::vector<AuditLogEntry> recent(size_t n) const;

  const Clock& clock() const { return clock_; }

private:
  std::string pathOf(const std::string& partitionKey) const;

  std::string dir_;
  const Clock& clock_;
  std::mutex mu_;
};

} // namespace vf
