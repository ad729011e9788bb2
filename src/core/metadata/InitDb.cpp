// src/core/metadata/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sgw {

namespace {

constexpr int kSchemaVersion = 1;

using DbPtr = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;

void exec_sql(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

int query_int(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  int v = 0;
  if (sqlite3_step(st) == SQLITE_ROW) v = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return v;
}

std::string read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open schema file: " + path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbPtr db(raw, &sqlite3_close);
  if (rc != SQLITE_OK) {
    throw std::runtime_error("Failed to open DB " + dbPath + ": " +
                             (raw ? sqlite3_errmsg(raw) : "out of memory"));
  }

  // Readers (one connection per upstream session) run alongside the CLI writer
  exec_sql(db.get(), "PRAGMA journal_mode=WAL;");
  exec_sql(db.get(), "PRAGMA synchronous=NORMAL;");
  exec_sql(db.get(), "PRAGMA busy_timeout=5000;");

  const int found = query_int(db.get(), "PRAGMA user_version;");
  if (found > kSchemaVersion) {
    throw std::runtime_error("DB " + dbPath + " has schema version " + std::to_string(found) +
                             ", newer than this build (" + std::to_string(kSchemaVersion) + ")");
  }

  exec_sql(db.get(), read_file(schemaPath));

  const int tables = query_int(db.get(),
      "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name IN ('objects','users');");
  if (tables != 2) throw std::runtime_error("schema " + schemaPath + " did not create the catalog tables");

  exec_sql(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
  return true;
}

} // namespace sgw
