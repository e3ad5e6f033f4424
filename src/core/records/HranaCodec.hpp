#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Wire format of the libSQL "Hrana over HTTP" v2 pipeline endpoint.
namespace jds::hrana {

struct Statement {
  std::string sql;
  std::vector<nlohmann::json> args; // positional, built with textArg/integerArg
};

// A "sequence" executes a multi-statement script without results.
struct Sequence {
  std::string sql;
};

struct ResultSet {
  std::vector<std::string> columns;
  std::vector<std::vector<nlohmann::json>> rows;
  int64_t affected_row_count = 0;
};

nlohmann::json textArg(const std::string& v);
nlohmann::json integerArg(int64_t v);

// Builds {"requests":[execute..., close]}.
std::string encodePipeline(const std::vector<Statement>& stmts);
std::string encodeSequence(const Sequence& seq);

// One ResultSet per execute request, close/sequence results are dropped.
// Throws StoreError on malformed bodies or an "error" result.
std::vector<ResultSet> decodePipeline(const std::string& body);

std::string cellText(const nlohmann::json& cell);
int64_t cellInteger(const nlohmann::json& cell);

} // namespace jds::hrana
