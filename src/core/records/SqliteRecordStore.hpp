#pragma once
#include <string>

#include "core/records/RecordStore.hpp"

namespace jds {

// Local variant: one long-lived connection opened in serialized
// (FULLMUTEX) mode, shared by all request threads.
class SqliteRecordStore : public RecordStore {
public:
  explicit SqliteRecordStore(const std::string& dbPath);
  ~SqliteRecordStore() override;

  SqliteRecordStore(const SqliteRecordStore&) = delete;
  SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

  void applySchema(const std::string& schemaSql) override;
  std::vector<RecordSummary> listRecords() override;
  std::optional<Record> findRecord(const std::string& id) override;
  void insertRecord(const Record& r) override;
  bool updateRecord(const std::string& id,
                    const std::string& data_json,
                    int64_t updated_at) override;
  bool deleteRecord(const std::string& id) override;

private:
  void* db_; // sqlite3*
};

} // namespace jds
