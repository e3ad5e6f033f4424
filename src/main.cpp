// src/main.cpp
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/records/InitDb.hpp"
#include "core/records/RecordService.hpp"
#include "core/records/RemoteRecordStore.hpp"
#include "core/records/SqliteRecordStore.hpp"
#include "services/api/HttpServer.hpp"
#include "services/api/MutationGuard.hpp"
#include "services/api/RequestHandler.hpp"

using namespace jds;

// ---------- helpers ----------

// JDS_SCHEMA_PATH wins; otherwise CWD (CI copies it there), then the source tree.
static std::string findSchemaPath(const Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) return cfg.schemaPath;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/records/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/records)");
}

// Creates/upgrades the schema for whichever backend is configured.
static void initSchema(const Config& cfg) {
  const std::string schemaPath = findSchemaPath(cfg);
  if (cfg.backend == Backend::Sqlite) {
    initDatabase(cfg.dbPath, schemaPath);
    return;
  }
  RemoteRecordStore remote({cfg.remoteUrl, cfg.remoteToken, cfg.remoteTimeoutSec});
  remote.applySchema(loadSchema(schemaPath));
  spdlog::info("schema applied to {}", cfg.remoteUrl);
}

static std::unique_ptr<RecordStore> openStore(const Config& cfg) {
  if (cfg.backend == Backend::Sqlite) {
    return std::make_unique<SqliteRecordStore>(cfg.dbPath);
  }
  return std::make_unique<RemoteRecordStore>(
    RemoteOptions{cfg.remoteUrl, cfg.remoteToken, cfg.remoteTimeoutSec});
}

static std::unique_ptr<MutationGuard> makeGuard(const Config& cfg) {
  if (!cfg.gateEnabled()) return std::make_unique<AllowAllGuard>();
  return std::make_unique<ProductionGate>(cfg.environment, cfg.gateHeader, cfg.gateValue);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade the records schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (JDS_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const Config cfg = loadConfig();
    init_default_logger(parse_log_level(cfg.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      initSchema(cfg);
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Self-heal schema on startup (idempotent)
      initSchema(cfg);

      auto store = openStore(cfg);
      auto guard = makeGuard(cfg);
      RecordService service(*store);
      RequestHandler handler(service, *guard, cfg.basePath);

      spdlog::info("backend={} environment='{}' production_gate={}",
                   cfg.backend == Backend::Sqlite ? "sqlite:" + cfg.dbPath : "remote:" + cfg.remoteUrl,
                   cfg.environment, cfg.gateEnabled() ? "armed" : "off");

      return run_http_server(handler, cfg.bindHost, cfg.port) ? 0 : 1;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
