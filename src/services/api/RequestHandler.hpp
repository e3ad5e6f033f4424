#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib { struct Request; struct Response; }

namespace jds {

class RecordService;
class MutationGuard;
struct Document;

// Target after prefix/query stripping: the first non-empty segment is the id.
struct RouteTarget {
  std::optional<std::string> id;
};

RouteTarget parseTarget(const std::string& path, const std::string& basePath);

nlohmann::json documentToJson(const Document& d);

// Maps one HTTP request onto one RecordService operation. Every failure
// ends here as a JSON error response; nothing propagates to the server.
class RequestHandler {
public:
  RequestHandler(RecordService& service, const MutationGuard& guard, std::string basePath);

  void handle(const httplib::Request& req, httplib::Response& res) const;

private:
  void dispatch(const httplib::Request& req, httplib::Response& res) const;

  void listRecords(httplib::Response& res) const;
  void getRecord(const std::string& id, httplib::Response& res) const;
  void createRecord(const httplib::Request& req, httplib::Response& res) const;
  void updateRecord(const std::string& id, const httplib::Request& req, httplib::Response& res) const;
  void deleteRecord(const std::string& id, httplib::Response& res) const;

  RecordService& service_;
  const MutationGuard& guard_;
  std::string basePath_;
};

} // namespace jds
