// src/core/records/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/records/RecordStore.hpp"

namespace jds {

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SQLite exec failed: " + msg);
    }
}

static bool hasColumn(sqlite3* db, const char* table, const char* column) {
    sqlite3_stmt* st = nullptr;
    const std::string sql = std::string("SELECT 1 FROM pragma_table_info('") + table + "') WHERE name = ?";
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw StoreError("table_info failed: " + msg);
    }
    sqlite3_bind_text(st, 1, column, -1, SQLITE_STATIC);
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw StoreError(std::string("table_info failed: ") + sqlite3_errmsg(db));
    }
    return rc == SQLITE_ROW;
}

// v1 files predate touched_seq; seed it from rowid so old ties keep their order.
static void migrate(sqlite3* db) {
    if (hasColumn(db, "json_data", "touched_seq")) return;
    execAll(db, "ALTER TABLE json_data ADD COLUMN touched_seq INTEGER NOT NULL DEFAULT 0;");
    execAll(db, "UPDATE json_data SET touched_seq = rowid;");
    spdlog::info("migrated json_data to schema v2 (touched_seq)");
}

std::string loadSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    return buf.str();
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    const auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    const std::string schema = loadSchema(schemaPath);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreError("Failed to open DB: " + msg);
    }

    try {
        // WAL survives across connections; the rest is re-applied per connection
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        execAll(db, schema);
        migrate(db);
        execAll(db, "PRAGMA user_version=2;");

        sqlite3_close(db);
        spdlog::info("schema applied to {}", dbPath);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

} // namespace jds
