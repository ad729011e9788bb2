#pragma once
#include <cstdint>
#include <string>

namespace sgw {

// Persistent user list (SQLite `users` table) backing the chat-side command
// layer. The streaming path never consults it.
class UserRegistry {
public:
  explicit UserRegistry(const std::string& dbPath);
  ~UserRegistry();

  UserRegistry(const UserRegistry&) = delete;
  UserRegistry& operator=(const UserRegistry&) = delete;

  bool exists(int64_t userId);
  // No-op if the user already exists.
  void add(int64_t userId, const std::string& name);
  bool isBanned(int64_t userId);

  // Return true when a row was changed.
  bool ban(int64_t userId);
  bool unban(int64_t userId);
  bool remove(int64_t userId);

  int64_t count();

private:
  bool setBanned(int64_t userId, bool banned);

  void* db_; // sqlite3*
};

} // namespace sgw
