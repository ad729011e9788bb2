#pragma once
#include <memory>
#include <string>

#include "core/metadata/MetadataStore.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/upstream/SessionClient.hpp"

namespace sgw {

// Session client serving objects registered in the local catalog. Each
// instance holds its own catalog connection.
class LocalSessionClient : public SessionClient {
public:
  LocalSessionClient(const std::string& dbPath, const LocalFSBackend& fs);

  Result<ObjectProperties> fetch_properties(int64_t id) override;
  Result<std::string> fetch_chunk(int64_t id, int64_t offset, int64_t limit) override;

private:
  std::unique_ptr<MetadataStore> store_;
  const LocalFSBackend&          fs_;
};

} // namespace sgw
