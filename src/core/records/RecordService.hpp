#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/records/RecordStore.hpp"

namespace jds {

// A record with its payload parsed back into structured JSON.
struct Document {
  std::string    id;
  nlohmann::json data;
  int64_t        created_at;
  int64_t        updated_at;
};

// Current time as Unix epoch milliseconds.
using Clock = std::function<int64_t()>;
int64_t systemClockMillis();

// 32 lowercase hex chars, 128 random bits.
std::string newRecordId();
bool isRecordId(const std::string& s);

// Deepest container nesting accepted in a payload. dump() recurses per
// level, so anything deeper is refused before it is ever serialized.
constexpr int kMaxJsonDepth = 512;

// json::parse with the nesting limit applied while parsing; throws
// std::invalid_argument past kMaxJsonDepth and json::exception on bad input.
nlohmann::json parseJsonLimited(const std::string& text);

// Container nesting of v, computed without recursion (a scalar is 0).
int jsonDepth(const nlohmann::json& v);

// "2026-10-19T08:15:02.117Z"
std::string formatTimestamp(int64_t epochMillis);

class RecordService {
public:
  explicit RecordService(RecordStore& store, Clock clock = systemClockMillis);

  std::vector<RecordSummary> list();
  std::optional<Document> get(const std::string& id);
  // Both writes throw std::invalid_argument if data nests deeper than kMaxJsonDepth.
  Document create(const nlohmann::json& data);
  // nullopt if the id does not exist; nothing is written in that case.
  std::optional<Document> update(const std::string& id, const nlohmann::json& data);
  bool remove(const std::string& id);

private:
  RecordStore& store_;
  Clock clock_;
};

} // namespace jds
