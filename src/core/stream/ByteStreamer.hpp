#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/stream/ChunkPlan.hpp"
#include "core/stream/ChunkSequencer.hpp"
#include "core/upstream/SessionClient.hpp"

namespace sgw {

// Chunk-fetch adapter bound to one upstream session. Long-lived: one instance
// per session, shared by every request placed on that session.
class ByteStreamer : public std::enable_shared_from_this<ByteStreamer> {
public:
  ByteStreamer(int64_t session_id, std::shared_ptr<SessionClient> client);

  int64_t session_id() const { return session_id_; }

  // Always asks upstream; properties are never cached across requests.
  Result<ObjectProperties> get_file_properties(int64_t object_id);

  Result<std::string> fetch_chunk(int64_t object_id, int64_t offset, int64_t limit);

  // Lazy byte sequence for one request. Nothing is fetched until next().
  std::unique_ptr<ChunkSequencer> stream(const ObjectProperties& props, const ChunkPlan& plan);

  uint64_t chunks_fetched() const { return chunks_fetched_.load(std::memory_order_relaxed); }
  uint64_t bytes_fetched() const { return bytes_fetched_.load(std::memory_order_relaxed); }

private:
  int64_t                        session_id_;
  std::shared_ptr<SessionClient> client_;
  std::atomic<uint64_t>          chunks_fetched_{0};
  std::atomic<uint64_t>          bytes_fetched_{0};
};

} // namespace sgw
