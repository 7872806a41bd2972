#include "CoordinationStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace vf {

namespace {

// Finalizes the statement on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() { sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Stmt& s, const char* what) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + " prepare failed: " + sqlite3_errmsg(db));
  }
}

void stepDone(sqlite3* db, Stmt& s, const char* what) {
  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

std::string columnText(sqlite3_stmt* st, int i) {
  const unsigned char* t = sqlite3_column_text(st, i);
  return t ? reinterpret_cast<const char*>(t) : "";
}

const char* outcomeName(DeltaOutcome o) {
  switch (o) {
    case DeltaOutcome::Applied:    return "applied";
    case DeltaOutcome::Superseded: return "superseded";
    case DeltaOutcome::Dropped:    return "dropped";
  }
  return "dropped";
}

} // namespace

CoordinationStore::CoordinationStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

CoordinationStore::~CoordinationStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

// -------- claims --------

void CoordinationStore::upsertClaim(const ClaimRecord& r) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT OR REPLACE INTO claims (item_id, owner_id, from_state, claimed_at, heartbeat_at)
    VALUES (?,?,?,?,?)
  )SQL";
  Stmt s;
  prepare(db, sql, s, "upsertClaim");
  int i = 1;
  sqlite3_bind_text(s.st, i++, r.item_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.owner_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, r.from_state.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, r.claimed_at);
  sqlite3_bind_int64(s.st, i++, r.heartbeat_at);
  stepDone(db, s, "upsertClaim");
}

void CoordinationStore::removeClaim(const std::string& item_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, "DELETE FROM claims WHERE item_id = ?", s, "removeClaim");
  sqlite3_bind_text(s.st, 1, item_id.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, s, "removeClaim");
}

std::vector<ClaimRecord> CoordinationStore::queryClaims(const char* sql,
                                                        const std::string* textArg,
                                                        const int64_t* intArg) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, sql, s, "queryClaims");
  if (textArg) sqlite3_bind_text(s.st, 1, textArg->c_str(), -1, SQLITE_TRANSIENT);
  if (intArg) sqlite3_bind_int64(s.st, 1, *intArg);

  std::vector<ClaimRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(ClaimRecord{
      columnText(s.st, 0),
      columnText(s.st, 1),
      columnText(s.st, 2),
      sqlite3_column_int64(s.st, 3),
      sqlite3_column_int64(s.st, 4)
    });
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("queryClaims failed: ") + sqlite3_errmsg(db));
  }
  return out;
}

std::optional<ClaimRecord> CoordinationStore::findClaim(const std::string& item_id) {
  auto rows = queryClaims(
    "SELECT item_id, owner_id, from_state, claimed_at, heartbeat_at FROM claims WHERE item_id = ?",
    &item_id, nullptr);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

std::vector<ClaimRecord> CoordinationStore::claimsFor(const std::string& owner_id) {
  return queryClaims(
    "SELECT item_id, owner_id, from_state, claimed_at, heartbeat_at FROM claims "
    "WHERE owner_id = ? ORDER BY item_id",
    &owner_id, nullptr);
}

std::vector<ClaimRecord> CoordinationStore::allClaims() {
  return queryClaims(
    "SELECT item_id, owner_id, from_state, claimed_at, heartbeat_at FROM claims "
    "ORDER BY owner_id, item_id",
    nullptr, nullptr);
}

std::vector<ClaimRecord> CoordinationStore::claimsOlderThan(int64_t heartbeatCutoff) {
  return queryClaims(
    "SELECT item_id, owner_id, from_state, claimed_at, heartbeat_at FROM claims "
    "WHERE heartbeat_at < ? ORDER BY heartbeat_at",
    nullptr, &heartbeatCutoff);
}

int CoordinationStore::heartbeat(const std::string& owner_id, int64_t at) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, "UPDATE claims SET heartbeat_at = ? WHERE owner_id = ?", s, "heartbeat");
  sqlite3_bind_int64(s.st, 1, at);
  sqlite3_bind_text(s.st, 2, owner_id.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, s, "heartbeat");
  return sqlite3_changes(db);
}

// -------- dashboard registers --------

bool CoordinationStore::putFieldIfNewer(const FieldRegister& f) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO dashboard_fields (field, value, stamp, delta_id, author)
    VALUES (?,?,?,?,?)
    ON CONFLICT(field) DO UPDATE SET
      value = excluded.value,
      stamp = excluded.stamp,
      delta_id = excluded.delta_id,
      author = excluded.author
    WHERE excluded.stamp > dashboard_fields.stamp
       OR (excluded.stamp = dashboard_fields.stamp AND excluded.delta_id >= dashboard_fields.delta_id)
  )SQL";
  Stmt s;
  prepare(db, sql, s, "putFieldIfNewer");
  int i = 1;
  sqlite3_bind_text(s.st, i++, f.field.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, f.value_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, f.stamp);
  sqlite3_bind_text(s.st, i++, f.delta_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, f.author.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, s, "putFieldIfNewer");
  return sqlite3_changes(db) > 0;
}

std::optional<FieldRegister> CoordinationStore::field(const std::string& name) {
  for (auto& f : fields()) {
    if (f.field == name) return f;
  }
  return std::nullopt;
}

std::vector<FieldRegister> CoordinationStore::fields() {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, "SELECT field, value, stamp, delta_id, author FROM dashboard_fields ORDER BY field",
          s, "fields");
  std::vector<FieldRegister> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(FieldRegister{
      columnText(s.st, 0),
      columnText(s.st, 1),
      sqlite3_column_int64(s.st, 2),
      columnText(s.st, 3),
      columnText(s.st, 4)
    });
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("fields failed: ") + sqlite3_errmsg(db));
  return out;
}

void CoordinationStore::markProcessed(const std::string& delta_id, DeltaOutcome outcome, int64_t at) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db,
          "INSERT OR REPLACE INTO dashboard_processed (delta_id, outcome, processed_at) VALUES (?,?,?)",
          s, "markProcessed");
  sqlite3_bind_text(s.st, 1, delta_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, outcomeName(outcome), -1, SQLITE_STATIC);
  sqlite3_bind_int64(s.st, 3, at);
  stepDone(db, s, "markProcessed");
}

bool CoordinationStore::isProcessed(const std::string& delta_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, "SELECT 1 FROM dashboard_processed WHERE delta_id = ?", s, "isProcessed");
  sqlite3_bind_text(s.st, 1, delta_id.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return true;
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("isProcessed failed: ") + sqlite3_errmsg(db));
  return false;
}

} // namespace vf
