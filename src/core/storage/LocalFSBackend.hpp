#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace sgw {

class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string root)
    : root_(std::move(root)) {}

  // Relative storage paths resolve under root; absolute ones are used as is.
  std::string resolve(const std::string& storage_path) const;

  // Reads up to `limit` bytes at `offset`. Returns fewer bytes at end of file.
  // Throws std::runtime_error if the file cannot be opened or read.
  std::string read_range(const std::string& storage_path,
                         int64_t offset,
                         int64_t limit) const;

  int64_t size_of(const std::string& storage_path) const;

private:
  std::string root_;
};

} // namespace sgw
