#pragma once
#include <string>

namespace httplib { class Server; }

namespace jds {
  class RequestHandler;

  // Installs CORS headers, access logging, /health and the catch-all
  // record routes on svr. handler must outlive svr.
  void register_routes(httplib::Server& svr, const RequestHandler& handler);

  // Start a blocking HTTP server. Returns false if the address cannot be bound.
  bool run_http_server(const RequestHandler& handler,
                       const std::string& host,
                       int port);
}
