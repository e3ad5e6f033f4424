#pragma once
#include <string>

namespace jds {

// Reads the whole schema file; throws std::runtime_error if it cannot be opened.
std::string loadSchema(const std::string& schemaPath);

// Creates the SQLite file (and parent dirs) if needed, sets pragmas and
// applies the schema. Safe to run on every startup.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace jds
