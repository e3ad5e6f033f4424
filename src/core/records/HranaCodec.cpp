#include "HranaCodec.hpp"
#include <stdexcept>

#include "core/records/RecordStore.hpp"

using nlohmann::json;

namespace jds::hrana {

json textArg(const std::string& v) {
  return json{{"type", "text"}, {"value", v}};
}

// Hrana carries 64-bit integers as decimal strings.
json integerArg(int64_t v) {
  return json{{"type", "integer"}, {"value", std::to_string(v)}};
}

std::string encodePipeline(const std::vector<Statement>& stmts) {
  json requests = json::array();
  for (const auto& s : stmts) {
    json stmt = {{"sql", s.sql}};
    if (!s.args.empty()) stmt["args"] = s.args;
    requests.push_back({{"type", "execute"}, {"stmt", stmt}});
  }
  requests.push_back({{"type", "close"}});
  return json{{"requests", requests}}.dump();
}

std::string encodeSequence(const Sequence& seq) {
  json requests = json::array({
    {{"type", "sequence"}, {"sql", seq.sql}},
    {{"type", "close"}}
  });
  return json{{"requests", requests}}.dump();
}

std::vector<ResultSet> decodePipeline(const std::string& body) {
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error& e) {
    throw StoreError(std::string("remote returned invalid JSON: ") + e.what());
  }
  if (!root.is_object() || !root.contains("results") || !root["results"].is_array()) {
    throw StoreError("remote response has no results array");
  }

  std::vector<ResultSet> out;
  try {
    for (const auto& r : root["results"]) {
      const std::string type = r.value("type", "");
      if (type == "error") {
        std::string msg = "unknown error";
        if (r.contains("error") && r["error"].is_object()) {
          msg = r["error"].value("message", msg);
        }
        throw StoreError("remote statement failed: " + msg);
      }
      if (type != "ok") throw StoreError("remote result has unexpected type '" + type + "'");

      const json& resp = r.at("response");
      if (resp.value("type", "") != "execute") continue;

      const json& res = resp.at("result");
      ResultSet rs;
      for (const auto& c : res.value("cols", json::array())) {
        rs.columns.push_back(c.contains("name") && c["name"].is_string()
                               ? c["name"].get<std::string>() : std::string());
      }
      for (const auto& row : res.value("rows", json::array())) {
        rs.rows.push_back(row.get<std::vector<json>>());
      }
      rs.affected_row_count = res.value("affected_row_count", int64_t{0});
      out.push_back(std::move(rs));
    }
  } catch (const json::exception& e) {
    throw StoreError(std::string("malformed remote result: ") + e.what());
  }
  return out;
}

std::string cellText(const json& cell) {
  if (!cell.is_object() || cell.value("type", "") == "null") return {};
  auto it = cell.find("value");
  if (it == cell.end()) throw StoreError("remote cell has no value");
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

int64_t cellInteger(const json& cell) {
  const std::string type = cell.is_object() ? cell.value("type", "") : "";
  auto it = cell.is_object() ? cell.find("value") : cell.end();
  if (type == "integer" && it != cell.end() && it->is_string()) {
    try {
      return std::stoll(it->get<std::string>());
    } catch (const std::exception&) {
      throw StoreError("remote integer cell is not a number: " + it->dump());
    }
  }
  if (type == "float" && it != cell.end() && it->is_number()) {
    return static_cast<int64_t>(it->get<double>());
  }
  throw StoreError("remote cell is not an integer: " + cell.dump());
}

} // namespace jds::hrana
