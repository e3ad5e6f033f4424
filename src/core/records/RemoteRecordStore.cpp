#include "RemoteRecordStore.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace jds {

static const char* kPipelinePath = "/v2/pipeline";

std::string RemoteRecordStore::httpBaseUrl(const std::string& url) {
  std::string u = url;
  for (const char* scheme : {"libsql://", "wss://"}) {
    const std::string s(scheme);
    if (u.rfind(s, 0) == 0) { u = "https://" + u.substr(s.size()); break; }
  }
  if (u.rfind("ws://", 0) == 0) u = "http://" + u.substr(5);
  while (!u.empty() && u.back() == '/') u.pop_back();
  return u;
}

RemoteRecordStore::RemoteRecordStore(RemoteOptions opts)
  : baseUrl_(httpBaseUrl(opts.url)), opts_(std::move(opts)) {
  if (baseUrl_.empty()) throw std::invalid_argument("remote store URL is empty");
}

std::vector<hrana::ResultSet> RemoteRecordStore::post(const std::string& body) {
  httplib::Client cli(baseUrl_);
  cli.set_connection_timeout(opts_.timeoutSec, 0);
  cli.set_read_timeout(opts_.timeoutSec, 0);
  if (!opts_.authToken.empty()) cli.set_bearer_token_auth(opts_.authToken);

  auto res = cli.Post(kPipelinePath, body, "application/json");
  if (!res) {
    throw StoreError("remote request to " + baseUrl_ + " failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    spdlog::debug("remote pipeline status {} body {}", res->status, res->body);
    throw StoreError("remote returned HTTP " + std::to_string(res->status));
  }
  return hrana::decodePipeline(res->body);
}

hrana::ResultSet RemoteRecordStore::execute(hrana::Statement stmt) {
  auto results = post(hrana::encodePipeline({std::move(stmt)}));
  if (results.empty()) throw StoreError("remote returned no result for statement");
  return std::move(results.front());
}

void RemoteRecordStore::applySchema(const std::string& schemaSql) {
  post(hrana::encodeSequence({schemaSql}));
}

std::vector<RecordSummary> RemoteRecordStore::listRecords() {
  auto rs = execute({
    "SELECT id, created_at, updated_at FROM json_data ORDER BY updated_at DESC, touched_seq DESC",
    {}
  });
  std::vector<RecordSummary> out;
  out.reserve(rs.rows.size());
  for (const auto& row : rs.rows) {
    if (row.size() < 3) throw StoreError("listRecords: short row from remote");
    out.push_back(RecordSummary{
      hrana::cellText(row[0]),
      hrana::cellInteger(row[1]),
      hrana::cellInteger(row[2])
    });
  }
  return out;
}

std::optional<Record> RemoteRecordStore::findRecord(const std::string& id) {
  auto rs = execute({
    "SELECT id, data, created_at, updated_at FROM json_data WHERE id = ?",
    {hrana::textArg(id)}
  });
  if (rs.rows.empty()) return std::nullopt;
  const auto& row = rs.rows.front();
  if (row.size() < 4) throw StoreError("findRecord: short row from remote");
  return Record{
    hrana::cellText(row[0]),
    hrana::cellText(row[1]),
    hrana::cellInteger(row[2]),
    hrana::cellInteger(row[3])
  };
}

void RemoteRecordStore::insertRecord(const Record& r) {
  execute({
    "INSERT INTO json_data (id, data, created_at, updated_at, touched_seq) "
    "VALUES (?,?,?,?, (SELECT COALESCE(MAX(touched_seq), 0) + 1 FROM json_data))",
    {hrana::textArg(r.id), hrana::textArg(r.data_json),
     hrana::integerArg(r.created_at), hrana::integerArg(r.updated_at)}
  });
}

bool RemoteRecordStore::updateRecord(const std::string& id,
                                     const std::string& data_json,
                                     int64_t updated_at) {
  auto rs = execute({
    "UPDATE json_data SET data = ?, updated_at = ?, "
    "touched_seq = (SELECT COALESCE(MAX(touched_seq), 0) + 1 FROM json_data) WHERE id = ?",
    {hrana::textArg(data_json), hrana::integerArg(updated_at), hrana::textArg(id)}
  });
  return rs.affected_row_count > 0;
}

bool RemoteRecordStore::deleteRecord(const std::string& id) {
  auto rs = execute({"DELETE FROM json_data WHERE id = ?", {hrana::textArg(id)}});
  return rs.affected_row_count > 0;
}

} // namespace jds
