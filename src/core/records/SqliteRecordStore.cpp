#include "SqliteRecordStore.hpp"
#include <memory>
#include <sqlite3.h>

namespace jds {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr prepare(sqlite3* db, const char* sql, const char* what) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    throw StoreError(std::string(what) + " prepare failed: " + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

std::string columnText(sqlite3_stmt* st, int col) {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(st, col))) : std::string();
}

void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

// Steps a write and returns its own change count. The connection mutex is
// held so another thread's statement cannot overwrite sqlite3_changes().
int stepChanges(sqlite3* db, sqlite3_stmt* st, const char* what) {
  sqlite3_mutex* mu = sqlite3_db_mutex(db);
  sqlite3_mutex_enter(mu);
  int changes = 0;
  try {
    stepDone(db, st, what);
    changes = sqlite3_changes(db);
  } catch (...) {
    sqlite3_mutex_leave(mu);
    throw;
  }
  sqlite3_mutex_leave(mu);
  return changes;
}

} // namespace

SqliteRecordStore::SqliteRecordStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SqliteRecordStore::~SqliteRecordStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void SqliteRecordStore::applySchema(const std::string& schemaSql) {
  auto* db = static_cast<sqlite3*>(db_);
  char* err = nullptr;
  if (sqlite3_exec(db, schemaSql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StoreError("applySchema failed: " + msg);
  }
}

std::vector<RecordSummary> SqliteRecordStore::listRecords() {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT id, created_at, updated_at FROM json_data
    ORDER BY updated_at DESC, touched_seq DESC
  )SQL";
  auto st = prepare(db, sql, "listRecords");

  std::vector<RecordSummary> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(RecordSummary{
      columnText(st.get(), 0),
      sqlite3_column_int64(st.get(), 1),
      sqlite3_column_int64(st.get(), 2)
    });
  }
  if (rc != SQLITE_DONE) {
    throw StoreError(std::string("listRecords failed: ") + sqlite3_errmsg(db));
  }
  return out;
}

std::optional<Record> SqliteRecordStore::findRecord(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT id, data, created_at, updated_at FROM json_data WHERE id = ?
  )SQL";
  auto st = prepare(db, sql, "findRecord");
  sqlite3_bind_text(st.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw StoreError(std::string("findRecord failed: ") + sqlite3_errmsg(db));
  }
  return Record{
    columnText(st.get(), 0),
    columnText(st.get(), 1),
    sqlite3_column_int64(st.get(), 2),
    sqlite3_column_int64(st.get(), 3)
  };
}

void SqliteRecordStore::insertRecord(const Record& r) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO json_data (id, data, created_at, updated_at, touched_seq)
    VALUES (?,?,?,?, (SELECT COALESCE(MAX(touched_seq), 0) + 1 FROM json_data))
  )SQL";
  auto st = prepare(db, sql, "insertRecord");
  int i=1;
  sqlite3_bind_text(st.get(), i++, r.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.get(), i++, r.data_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.get(), i++, r.created_at);
  sqlite3_bind_int64(st.get(), i++, r.updated_at);
  stepDone(db, st.get(), "insertRecord");
}

bool SqliteRecordStore::updateRecord(const std::string& id,
                                     const std::string& data_json,
                                     int64_t updated_at) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE json_data SET data = ?, updated_at = ?,
      touched_seq = (SELECT COALESCE(MAX(touched_seq), 0) + 1 FROM json_data)
    WHERE id = ?
  )SQL";
  auto st = prepare(db, sql, "updateRecord");
  sqlite3_bind_text(st.get(), 1, data_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.get(), 2, updated_at);
  sqlite3_bind_text(st.get(), 3, id.c_str(), -1, SQLITE_TRANSIENT);
  return stepChanges(db, st.get(), "updateRecord") > 0;
}

bool SqliteRecordStore::deleteRecord(const std::string& id) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "DELETE FROM json_data WHERE id = ?", "deleteRecord");
  sqlite3_bind_text(st.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
  return stepChanges(db, st.get(), "deleteRecord") > 0;
}

} // namespace jds
