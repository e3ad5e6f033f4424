#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>

#include "services/api/RequestHandler.hpp"

using nlohmann::json;

namespace jds {

void register_routes(httplib::Server& svr, const RequestHandler& handler) {
  svr.set_default_headers({
    {"Access-Control-Allow-Origin", "*"},
    {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS"},
    {"Access-Control-Allow-Headers", "Content-Type"}
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} -> {}", req.method, req.path, res.status);
  });

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // Everything else goes through the record handler, which does its own
  // path parsing (base prefix, id segment).
  auto route = [&handler](const httplib::Request& req, httplib::Response& res) {
    handler.handle(req, res);
  };
  svr.Options(".*", route);
  svr.Get(".*", route);
  svr.Post(".*", route);
  svr.Put(".*", route);
  svr.Delete(".*", route);
  svr.Patch(".*", route);

  // Fallback for responses the library produced itself (bad request line,
  // unknown verb); handler responses already carry a JSON body.
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.body.empty()) {
      const std::string msg = res.status == 404 ? "Not found"
                            : res.status == 405 ? "Method not allowed"
                            : "Bad request";
      res.set_content(json{{"error", msg}}.dump(), "application/json");
    }
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string what = "unknown";
    try {
      if (ep) std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      what = e.what();
    } catch (...) {
      what = "non-standard exception";
    }
    spdlog::error("{} {}: {}", req.method, req.path, what);
    res.status = 500;
    res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
  });
}

bool run_http_server(const RequestHandler& handler,
                     const std::string& host,
                     int port) {
  httplib::Server svr;
  register_routes(svr, handler);

  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr.listen(host, port)) {
    spdlog::error("Failed to bind {}:{}", host, port);
    return false;
  }
  return true;
}

} // namespace jds
