#include "RequestHandler.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "core/records/RecordService.hpp"
#include "services/api/ApiError.hpp"
#include "services/api/MutationGuard.hpp"

using nlohmann::json;

namespace jds {

// -------- helpers --------

static void sendJson(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void sendError(httplib::Response& res, int status, const std::string& message) {
  sendJson(res, json{{"error", message}}, status);
}

static bool isMutation(const std::string& method) {
  return method == "POST" || method == "PUT" || method == "DELETE";
}

// Body must be JSON carrying a top-level "data" key; its value may be null.
// Syntax errors, number overflow and excessive nesting are all client errors.
static json readData(const httplib::Request& req) {
  json body;
  try {
    body = parseJsonLimited(req.body);
  } catch (const json::exception&) {
    throw ApiError(ErrorKind::BadRequest, "Invalid JSON body");
  } catch (const std::invalid_argument&) {
    throw ApiError(ErrorKind::BadRequest, "Invalid JSON body");
  }
  if (!body.is_object() || !body.contains("data")) {
    throw ApiError(ErrorKind::BadRequest, "Data field is required");
  }
  return body["data"];
}

RouteTarget parseTarget(const std::string& path, const std::string& basePath) {
  std::string p = path.substr(0, path.find('?'));
  if (!basePath.empty() && p.rfind(basePath, 0) == 0 &&
      (p.size() == basePath.size() || p[basePath.size()] == '/' || basePath.back() == '/')) {
    p = p.substr(basePath.size());
  }

  RouteTarget t;
  size_t pos = 0;
  while (pos <= p.size()) {
    size_t next = p.find('/', pos);
    if (next == std::string::npos) next = p.size();
    if (next > pos) {
      t.id = p.substr(pos, next - pos);
      break;
    }
    pos = next + 1;
  }
  return t;
}

json documentToJson(const Document& d) {
  return json{
    {"id", d.id},
    {"data", d.data},
    {"created_at", formatTimestamp(d.created_at)},
    {"updated_at", formatTimestamp(d.updated_at)}
  };
}

// -------- handler --------

RequestHandler::RequestHandler(RecordService& service,
                               const MutationGuard& guard,
                               std::string basePath)
  : service_(service), guard_(guard), basePath_(std::move(basePath)) {}

void RequestHandler::handle(const httplib::Request& req, httplib::Response& res) const {
  // Preflight answers before any routing.
  if (req.method == "OPTIONS") {
    res.status = 200;
    res.set_header("Content-Type", "application/json");
    return;
  }

  try {
    if (isMutation(req.method) && guard_.mutationsDisabled(req)) {
      throw ApiError(ErrorKind::Forbidden, req.method + " is disabled in production");
    }
    dispatch(req, res);
  } catch (const ApiError& e) {
    if (e.kind() == ErrorKind::Internal) spdlog::error("{} {}: {}", req.method, req.path, e.what());
    sendError(res, e.status(), e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} {}: unexpected: {}", req.method, req.path, e.what());
    sendError(res, 500, std::string("Internal server error: ") + e.what());
  }
}

void RequestHandler::dispatch(const httplib::Request& req, httplib::Response& res) const {
  const auto target = parseTarget(req.path, basePath_);
  const std::string& m = req.method;

  if (m == "GET" || m == "HEAD") {
    if (target.id) getRecord(*target.id, res);
    else listRecords(res);
  } else if (m == "POST") {
    createRecord(req, res);
  } else if (m == "PUT") {
    if (!target.id) throw ApiError(ErrorKind::BadRequest, "ID is required for update");
    updateRecord(*target.id, req, res);
  } else if (m == "DELETE") {
    if (!target.id) throw ApiError(ErrorKind::BadRequest, "ID is required for delete");
    deleteRecord(*target.id, res);
  } else {
    throw ApiError(ErrorKind::MethodNotAllowed, "Method not allowed");
  }
}

void RequestHandler::listRecords(httplib::Response& res) const {
  try {
    json out = json::array();
    for (const auto& s : service_.list()) {
      out.push_back({
        {"id", s.id},
        {"created_at", formatTimestamp(s.created_at)},
        {"updated_at", formatTimestamp(s.updated_at)}
      });
    }
    sendJson(res, out);
  } catch (const std::exception& e) {
    throw ApiError(ErrorKind::Internal, std::string("Failed to list records: ") + e.what());
  }
}

void RequestHandler::getRecord(const std::string& id, httplib::Response& res) const {
  std::optional<Document> doc;
  try {
    doc = service_.get(id);
  } catch (const std::exception& e) {
    throw ApiError(ErrorKind::Internal, std::string("Failed to retrieve record: ") + e.what());
  }
  if (!doc) throw ApiError(ErrorKind::NotFound, "Record not found");
  sendJson(res, documentToJson(*doc));
}

void RequestHandler::createRecord(const httplib::Request& req, httplib::Response& res) const {
  const json data = readData(req);
  try {
    sendJson(res, documentToJson(service_.create(data)));
  } catch (const std::exception& e) {
    throw ApiError(ErrorKind::Internal, std::string("Failed to create record: ") + e.what());
  }
}

void RequestHandler::updateRecord(const std::string& id,
                                  const httplib::Request& req,
                                  httplib::Response& res) const {
  const json data = readData(req);
  std::optional<Document> doc;
  try {
    doc = service_.update(id, data);
  } catch (const std::exception& e) {
    throw ApiError(ErrorKind::Internal, std::string("Failed to update record: ") + e.what());
  }
  if (!doc) throw ApiError(ErrorKind::NotFound, "Record not found");
  sendJson(res, documentToJson(*doc));
}

void RequestHandler::deleteRecord(const std::string& id, httplib::Response& res) const {
  bool removed = false;
  try {
    removed = service_.remove(id);
  } catch (const std::exception& e) {
    throw ApiError(ErrorKind::Internal, std::string("Failed to delete record: ") + e.what());
  }
  if (!removed) throw ApiError(ErrorKind::NotFound, "Record not found");
  res.status = 204;
}

} // namespace jds
