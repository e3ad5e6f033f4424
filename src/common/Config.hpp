#pragma once
#include <functional>
#include <string>

namespace jds {

enum class Backend { Sqlite, Remote };
enum class GateMode { Auto, On, Off };

struct Config {
  Backend     backend      = Backend::Sqlite;
  std::string dbPath       = "data/json-storage.db";
  std::string schemaPath;            // empty = search default locations
  std::string remoteUrl;
  std::string remoteToken;
  int         remoteTimeoutSec = 10;

  std::string environment;           // "production" arms the gate
  GateMode    gate         = GateMode::Auto;
  std::string gateHeader   = "X-Client-Id";
  std::string gateValue;

  std::string basePath     = "/api";
  std::string bindHost     = "0.0.0.0";
  int         port         = 8080;
  std::string logLevel     = "info";

  // Auto arms the gate for the remote backend only.
  bool gateEnabled() const {
    return gate == GateMode::On || (gate == GateMode::Auto && backend == Backend::Remote);
  }
};

// Returns the variable's value or defval when unset.
using EnvLookup = std::function<std::string(const char* key, const std::string& defval)>;

std::string get_env_or(const char* key, const std::string& defval);

// Throws std::invalid_argument on an unknown backend/gate mode or a remote
// backend without URL. An unparsable port falls back to 8080.
Config loadConfig(const EnvLookup& env = get_env_or);

} // namespace jds
