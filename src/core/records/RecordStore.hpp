#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/records/Record.hpp"

namespace jds {

// Raised by every RecordStore implementation when the engine fails.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Persistence gateway over the single json_data table.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // Executes schema.sql contents (idempotent CREATE ... IF NOT EXISTS).
  virtual void applySchema(const std::string& schemaSql) = 0;

  // Ordered by updated_at descending, most recent write first on ties.
  virtual std::vector<RecordSummary> listRecords() = 0;
  virtual std::optional<Record> findRecord(const std::string& id) = 0;
  virtual void insertRecord(const Record& r) = 0;
  // Replaces data and updated_at; created_at is left alone.
  // Returns false if no row matched.
  virtual bool updateRecord(const std::string& id,
                            const std::string& data_json,
                            int64_t updated_at) = 0;
  // Returns false if no row was removed.
  virtual bool deleteRecord(const std::string& id) = 0;
};

} // namespace jds
