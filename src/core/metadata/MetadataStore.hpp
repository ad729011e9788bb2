#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sgw {

struct ObjectRecord {
  int64_t                    id = 0;     // 0 = assign on insert
  std::string                content_hash;
  int64_t                    size = 0;
  std::optional<std::string> mime_type;
  std::optional<std::string> file_name;
  std::string                storage_path;
  int64_t                    created_at = 0;
};

// Catalog of servable objects (SQLite `objects` table). The connection is
// opened in serialized mode so one store may be shared across threads.
class MetadataStore {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;

  // Returns the stored id.
  int64_t insertObject(const ObjectRecord& r);
  std::optional<ObjectRecord> findObject(int64_t id);

private:
  void* db_; // sqlite3*
};

} // namespace sgw
