#pragma once
#include <memory>
#include <string>
#include <vector>

#include "core/storage/RecordStore.hpp"

namespace vf {

// RecordStore over a local (or shared, POSIX-compliant) directory tree:
//
//   <root>/<collection>/<id>.md      records
//   <root>/Updates/<id>.json         dashboard deltas
//   <root>/.state/tmp/               staging for atomic publication
//   <root>/.state/leases/<owner>     owner liveness, mtime = last heartbeat
//
// Exclusive create publishes a fully written temp file with link(2); moves
// use renameat2(RENAME_NOREPLACE); replacements use RENAME_EXCHANGE.
class LocalFSBackend : public RecordStore {
public:
  // clock defaults to a StoreClock stamping <root>/.state/clock
  explicit LocalFSBackend(std::string root, std::shared_ptr<Clock> clock = nullptr);

  void createExclusive(const std::string& collection,
                       const std::string& id,
                       const std::string& content) override;
  void moveAtomic(const std::string& from,
                  const std::string& to,
                  const std::string& id) override;
  std::vector<std::string> list(const std::string& collection) const override;
  std::vector<std::string> children(const std::string& parent) const override;
  bool exists(const std::string& collection, const std::string& id) const override;
  std::string readRaw(const std::string& collection, const std::string& id) const override;
  void replaceRaw(const std::string& collection,
                  const std::string& id,
                  const std::string& content) override;
  Timestamp modifiedAt(const std::string& collection, const std::string& id) const override;
  void touchLease(const std::string& owner, Timestamp at) override;
  std::optional<Timestamp> leaseAt(const std::string& owner) const override;
  const Clock& clock() const override { return *clock_; }

  const std::string& root() const { return root_; }

  // Full path of a record file; validates collection and id.
  std::string pathOf(const std::string& collection, const std::string& id) const;

private:
  std::string dirOf(const std::string& collection) const;
  std::string ensureDir(const std::string& collection) const;
  std::string leasePath(const std::string& owner) const;
  // Writes content into a fresh file under .state/tmp and fsyncs it.
  std::string stage(const std::string& id, const std::string& content) const;

  std::string root_;
  std::shared_ptr<Clock> clock_;
};

} // namespace vf
