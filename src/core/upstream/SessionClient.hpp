#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/errors/Result.hpp"

namespace sgw {

struct ObjectProperties {
  int64_t                    id = 0;
  std::string                content_hash;
  int64_t                    size = 0;
  std::optional<std::string> mime_type;
  std::optional<std::string> file_name;
};

// An authenticated upstream connection that objects are read through.
// Implementations must be safe to call from several request threads at once.
class SessionClient {
public:
  virtual ~SessionClient() = default;

  // Fails with ObjectNotFound or UpstreamFetchFailure.
  virtual Result<ObjectProperties> fetch_properties(int64_t id) = 0;

  // Returns up to `limit` bytes starting at `offset`. A short (or empty) result
  // means the end of the object was reached.
  virtual Result<std::string> fetch_chunk(int64_t id, int64_t offset, int64_t limit) = 0;
};

} // namespace sgw
