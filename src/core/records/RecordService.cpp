#include "RecordService.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

using nlohmann::json;

namespace jds {

int64_t systemClockMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string newRecordId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v) {
    static const char* k = "0123456789abcdef";
    std::string s(16, '0');
    for (int i = 15; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  return hexn(rng()) + hexn(rng());
}

bool isRecordId(const std::string& s) {
  return s.size() == 32 && std::all_of(s.begin(), s.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

json parseJsonLimited(const std::string& text) {
  json::parser_callback_t limit = [](int depth, json::parse_event_t event, json&) {
    if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
        depth >= kMaxJsonDepth) {
      throw std::invalid_argument("JSON nested deeper than " + std::to_string(kMaxJsonDepth) + " levels");
    }
    return true;
  };
  return json::parse(text, limit);
}

int jsonDepth(const json& v) {
  int deepest = 0;
  std::vector<std::pair<const json*, int>> pending{{&v, 0}};
  while (!pending.empty()) {
    auto [node, depth] = pending.back();
    pending.pop_back();
    if (!node->is_structured()) continue;
    deepest = std::max(deepest, depth + 1);
    for (const auto& child : *node) pending.emplace_back(&child, depth + 1);
  }
  return deepest;
}

static void checkDepth(const json& data) {
  if (jsonDepth(data) > kMaxJsonDepth) {
    throw std::invalid_argument("data nested deeper than " + std::to_string(kMaxJsonDepth) + " levels");
  }
}

std::string formatTimestamp(int64_t epochMillis) {
  int64_t secs = epochMillis / 1000;
  int64_t ms = epochMillis % 1000;
  if (ms < 0) { ms += 1000; --secs; }
  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}

RecordService::RecordService(RecordStore& store, Clock clock)
  : store_(store), clock_(std::move(clock)) {}

std::vector<RecordSummary> RecordService::list() {
  return store_.listRecords();
}

std::optional<Document> RecordService::get(const std::string& id) {
  auto rec = store_.findRecord(id);
  if (!rec) return std::nullopt;
  json data;
  try {
    data = json::parse(rec->data_json);
  } catch (const json::parse_error& e) {
    throw StoreError("stored data for " + id + " is not valid JSON: " + e.what());
  }
  return Document{rec->id, std::move(data), rec->created_at, rec->updated_at};
}

Document RecordService::create(const json& data) {
  checkDepth(data);
  const int64_t now = clock_();
  const Record rec{newRecordId(), data.dump(), now, now};
  store_.insertRecord(rec);

  auto doc = get(rec.id);
  if (!doc) throw StoreError("record " + rec.id + " missing right after insert");
  return *doc;
}

std::optional<Document> RecordService::update(const std::string& id, const json& data) {
  checkDepth(data);
  auto existing = store_.findRecord(id);
  if (!existing) return std::nullopt;

  // updated_at must move forward even within the same millisecond
  const int64_t stamp = std::max(clock_(), existing->updated_at + 1);
  if (!store_.updateRecord(id, data.dump(), stamp)) {
    // deleted concurrently between the check and the write
    return std::nullopt;
  }
  return get(id);
}

bool RecordService::remove(const std::string& id) {
  return store_.deleteRecord(id);
}

} // namespace jds
