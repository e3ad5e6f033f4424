#pragma once
#include <string>

#include "core/records/HranaCodec.hpp"
#include "core/records/RecordStore.hpp"

namespace jds {

struct RemoteOptions {
  std::string url;            // https://host[:port] or libsql://host
  std::string authToken;      // sent as Bearer; empty = no auth header
  int         timeoutSec = 10;
};

// Remote variant: every call is one stateless pipeline request to
// POST {url}/v2/pipeline. No connection state is kept between calls.
class RemoteRecordStore : public RecordStore {
public:
  explicit RemoteRecordStore(RemoteOptions opts);

  void applySchema(const std::string& schemaSql) override;
  std::vector<RecordSummary> listRecords() override;
  std::optional<Record> findRecord(const std::string& id) override;
  void insertRecord(const Record& r) override;
  bool updateRecord(const std::string& id,
                    const std::string& data_json,
                    int64_t updated_at) override;
  bool deleteRecord(const std::string& id) override;

  // libsql:// and wss:// URLs are served over https.
  static std::string httpBaseUrl(const std::string& url);

private:
  std::vector<hrana::ResultSet> post(const std::string& body);
  hrana::ResultSet execute(hrana::Statement stmt);

  std::string baseUrl_;
  RemoteOptions opts_;
};

} // namespace jds
