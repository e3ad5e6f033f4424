#pragma once
#include <cstdint>
#include <string>

namespace jds {

// Row of the json_data table. data_json is the serialized payload;
// timestamps are Unix epoch milliseconds.
struct Record {
  std::string id;
  std::string data_json;
  int64_t     created_at;
  int64_t     updated_at;
};

// What List returns: never the payload.
struct RecordSummary {
  std::string id;
  int64_t     created_at;
  int64_t     updated_at;
};

} // namespace jds
