#include "Config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace jds {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static int intOr(const EnvLookup& env, const char* key, int defval) {
  const std::string raw = env(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    int v = std::stoi(raw, &used);
    if (used == raw.size() && v > 0 && v <= 65535) return v;
  } catch (const std::exception&) {
  }
  spdlog::warn("{}='{}' is not a valid value, using {}", key, raw, defval);
  return defval;
}

Config loadConfig(const EnvLookup& env) {
  Config c;

  const std::string backend = env("JDS_BACKEND", "sqlite");
  if (backend == "sqlite") c.backend = Backend::Sqlite;
  else if (backend == "remote") c.backend = Backend::Remote;
  else throw std::invalid_argument("JDS_BACKEND must be 'sqlite' or 'remote', got '" + backend + "'");

  c.dbPath           = env("JDS_DB_PATH", c.dbPath);
  c.schemaPath       = env("JDS_SCHEMA_PATH", "");
  c.remoteUrl        = env("JDS_REMOTE_URL", "");
  c.remoteToken      = env("JDS_REMOTE_TOKEN", "");
  c.remoteTimeoutSec = intOr(env, "JDS_REMOTE_TIMEOUT_SEC", c.remoteTimeoutSec);
  if (c.backend == Backend::Remote && c.remoteUrl.empty()) {
    throw std::invalid_argument("JDS_REMOTE_URL is required for the remote backend");
  }

  c.environment = env("JDS_ENV", "");
  const std::string gate = env("JDS_PRODUCTION_GATE", "auto");
  if (gate == "auto") c.gate = GateMode::Auto;
  else if (gate == "on") c.gate = GateMode::On;
  else if (gate == "off") c.gate = GateMode::Off;
  else throw std::invalid_argument("JDS_PRODUCTION_GATE must be auto, on or off, got '" + gate + "'");
  c.gateHeader = env("JDS_GATE_HEADER", c.gateHeader);
  c.gateValue  = env("JDS_GATE_HEADER_VALUE", "");

  c.basePath = env("JDS_BASE_PATH", c.basePath);
  c.bindHost = env("JDS_BIND", c.bindHost);
  c.port     = intOr(env, "JDS_PORT", 8080);
  c.logLevel = env("JDS_LOG_LEVEL", c.logLevel);
  return c;
}

} // namespace jds
