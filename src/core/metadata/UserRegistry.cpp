#include "UserRegistry.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace sgw {

namespace {

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  return st;
}

// Steps a statement expected to produce at most one row. Returns true on SQLITE_ROW.
bool step_one(sqlite3* db, sqlite3_stmt* st, const char* what) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  std::string err = sqlite3_errmsg(db);
  sqlite3_finalize(st);
  throw std::runtime_error(std::string(what) + " failed: " + err);
}

} // namespace

UserRegistry::UserRegistry(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

UserRegistry::~UserRegistry() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

bool UserRegistry::exists(int64_t userId) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db, "SELECT 1 FROM users WHERE id = ?");
  sqlite3_bind_int64(st, 1, userId);
  bool found = step_one(db, st, "exists");
  sqlite3_finalize(st);
  return found;
}

void UserRegistry::add(int64_t userId, const std::string& name) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db,
      "INSERT OR IGNORE INTO users (id, name, banned) VALUES (?, ?, 0)");
  sqlite3_bind_int64(st, 1, userId);
  sqlite3_bind_text(st, 2, name.c_str(), -1, SQLITE_TRANSIENT);
  step_one(db, st, "add");
  sqlite3_finalize(st);
}

bool UserRegistry::isBanned(int64_t userId) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db, "SELECT banned FROM users WHERE id = ?");
  sqlite3_bind_int64(st, 1, userId);
  bool banned = false;
  if (step_one(db, st, "isBanned")) banned = sqlite3_column_int(st, 0) != 0;
  sqlite3_finalize(st);
  return banned;
}

bool UserRegistry::ban(int64_t userId)   { return setBanned(userId, true); }
bool UserRegistry::unban(int64_t userId) { return setBanned(userId, false); }

bool UserRegistry::setBanned(int64_t userId, bool banned) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db,
      "UPDATE users SET banned = ? WHERE id = ? AND banned <> ?");
  sqlite3_bind_int(st, 1, banned ? 1 : 0);
  sqlite3_bind_int64(st, 2, userId);
  sqlite3_bind_int(st, 3, banned ? 1 : 0);
  step_one(db, st, "setBanned");
  sqlite3_finalize(st);
  return sqlite3_changes(db) > 0;
}

bool UserRegistry::remove(int64_t userId) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db, "DELETE FROM users WHERE id = ?");
  sqlite3_bind_int64(st, 1, userId);
  step_one(db, st, "remove");
  sqlite3_finalize(st);
  return sqlite3_changes(db) > 0;
}

int64_t UserRegistry::count() {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db, "SELECT COUNT(*) FROM users");
  int64_t n = 0;
  if (step_one(db, st, "count")) n = sqlite3_column_int64(st, 0);
  sqlite3_finalize(st);
  return n;
}

} // namespace sgw
