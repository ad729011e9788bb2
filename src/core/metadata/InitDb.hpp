#pragma once
#include <string>

namespace sgw {

// Opens (creating if needed) the SQLite database at dbPath and applies the
// schema file. Safe to call on every startup. Throws std::runtime_error.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace sgw
