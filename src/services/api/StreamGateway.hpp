#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/link/LinkCodec.hpp"
#include "core/session/SessionPool.hpp"
#include "core/session/StreamerCache.hpp"
#include "services/api/ResponseAssembler.hpp"

namespace sgw {

struct StreamRequest {
  std::string                path;        // without the leading '/'
  std::optional<std::string> query_hash;
  std::optional<std::string> range;
  std::string                remote;      // for logs only
};

// An object the caller proved access to, with the session it was read through.
struct AuthorizedObject {
  LinkRef                       link;
  ObjectProperties              props;
  std::shared_ptr<ByteStreamer> streamer;
  SessionPool::Lease            lease;
};

// Request pipeline from link to response:
//   parse link -> pick session -> get streamer -> fetch properties ->
//   check capability -> resolve range -> plan chunks -> assemble.
// Holds references only; the pool and cache belong to the server.
class StreamGateway {
public:
  StreamGateway(SessionPool& pool,
                StreamerCache& cache,
                int64_t chunk_size,
                HashPrecedence precedence);

  // Never throws; unexpected faults become a 500 response.
  StreamResponse handle(const StreamRequest& req);

  // Link parsing, session placement and capability check, shared with the
  // viewer page.
  Result<AuthorizedObject> authorize(std::string_view path,
                                     const std::optional<std::string>& query_hash,
                                     const std::string& remote = {});

  int64_t chunk_size() const { return chunk_size_; }

private:
  SessionPool&   pool_;
  StreamerCache& cache_;
  int64_t        chunk_size_;
  HashPrecedence precedence_;
};

} // namespace sgw
