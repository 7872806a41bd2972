#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vf {

struct ClaimRecord {
  std::string item_id;
  std::string owner_id;
  std::string from_state;
  int64_t     claimed_at;
  int64_t     heartbeat_at;
};

// One last-writer-wins register of the dashboard summary.
struct FieldRegister {
  std::string field;
  std::string value_json;
  int64_t     stamp;
  std::string delta_id;
  std::string author;
};

enum class DeltaOutcome { Applied, Superseded, Dropped };

// SQLite-backed coordination state (claims liveness, dashboard registers).
// The database must have been created with initDatabase().
class CoordinationStore {
public:
  explicit CoordinationStore(const std::string& dbPath);
  ~CoordinationStore();
  CoordinationStore(const CoordinationStore&) = delete;
  CoordinationStore& operator=(const CoordinationStore&) = delete;

  // -------- claims --------
  // Replaces any leftover row for the same item.
  void upsertClaim(const ClaimRecord& r);
  void removeClaim(const std::string& item_id);
  std::optional<ClaimRecord> findClaim(const std::string& item_id);
  std::vector<ClaimRecord> claimsFor(const std::string& owner_id);
  std::vector<ClaimRecord> allClaims();
  std::vector<ClaimRecord> claimsOlderThan(int64_t heartbeatCutoff);
  // Returns the number of claims refreshed.
  int heartbeat(const std::string& owner_id, int64_t at);

  // -------- dashboard registers --------
  // Writes the register unless the stored one is newer by (stamp, delta_id).
  // Returns true when the register now holds this delta.
  bool putFieldIfNewer(const FieldRegister& f);
  std::optional<FieldRegister> field(const std::string& name);
  std::vector<FieldRegister> fields();

  void markProcessed(const std::string& delta_id, DeltaOutcome outcome, int64_t at);
  bool isProcessed(const std::string& delta_id);

private:
  std::vector<ClaimRecord> queryClaims(const char* sql, const std::string* textArg, const int64_t* intArg);

  void* db_; // sqlite3*
  std::mutex mu_;
};

} // namespace vf
