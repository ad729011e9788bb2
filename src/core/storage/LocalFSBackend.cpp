#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace sgw {

std::string LocalFSBackend::resolve(const std::string& storage_path) const {
  namespace fs = std::filesystem;
  fs::path p(storage_path);
  if (p.is_absolute() || root_.empty()) return p.string();
  return (fs::path(root_) / p).string();
}

std::string LocalFSBackend::read_range(const std::string& storage_path,
                                       int64_t offset,
                                       int64_t limit) const {
  const std::string file = resolve(storage_path);
  std::ifstream is(file, std::ios::binary);
  if (!is) throw std::runtime_error("cannot open " + file);

  std::string out;
  if (limit <= 0) return out;
  is.seekg(offset, std::ios::beg);
  if (!is) throw std::runtime_error("seek failed in " + file);

  out.resize(static_cast<size_t>(limit));
  is.read(out.data(), static_cast<std::streamsize>(limit));
  if (is.bad()) throw std::runtime_error("read failed in " + file);
  out.resize(static_cast<size_t>(is.gcount()));
  return out;
}

int64_t LocalFSBackend::size_of(const std::string& storage_path) const {
  std::error_code ec;
  auto n = std::filesystem::file_size(resolve(storage_path), ec);
  if (ec) throw std::runtime_error("stat failed for " + storage_path + ": " + ec.message());
  return static_cast<int64_t>(n);
}

} // namespace sgw
