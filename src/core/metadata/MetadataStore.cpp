#include "MetadataStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace sgw {

namespace {

void bind_optional_text(sqlite3_stmt* st, int i, const std::optional<std::string>& v) {
  if (v) sqlite3_bind_text(st, i, v->c_str(), -1, SQLITE_TRANSIENT);
  else   sqlite3_bind_null(st, i);
}

std::optional<std::string> column_optional_text(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st, i)));
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  return st;
}

} // namespace

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

MetadataStore::~MetadataStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

int64_t MetadataStore::insertObject(const ObjectRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO objects
      (id, content_hash, size, mime_type, file_name, storage_path, created_at)
    VALUES (?,?,?,?,?,?,?)
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  int i = 1;
  if (r.id > 0) sqlite3_bind_int64(st, i++, r.id);
  else          sqlite3_bind_null(st, i++);
  sqlite3_bind_text(st, i++, r.content_hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, i++, r.size);
  bind_optional_text(st, i++, r.mime_type);
  bind_optional_text(st, i++, r.file_name);
  sqlite3_bind_text(st, i++, r.storage_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, i++, r.created_at);

  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("insertObject failed: " + err);
  }
  sqlite3_finalize(st);
  return r.id > 0 ? r.id : static_cast<int64_t>(sqlite3_last_insert_rowid(db));
}

std::optional<ObjectRecord> MetadataStore::findObject(int64_t id) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT id, content_hash, size, mime_type, file_name, storage_path, created_at
      FROM objects WHERE id = ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_int64(st, 1, id);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("findObject failed: " + err);
  }

  ObjectRecord rec;
  rec.id           = sqlite3_column_int64(st, 0);
  rec.content_hash = reinterpret_cast<const char*>(sqlite3_column_text(st, 1));
  rec.size         = sqlite3_column_int64(st, 2);
  rec.mime_type    = column_optional_text(st, 3);
  rec.file_name    = column_optional_text(st, 4);
  rec.storage_path = reinterpret_cast<const char*>(sqlite3_column_text(st, 5));
  rec.created_at   = sqlite3_column_int64(st, 6);
  sqlite3_finalize(st);
  return rec;
}

} // namespace sgw
