#include "ByteStreamer.hpp"

#include <spdlog/spdlog.h>

namespace sgw {

ByteStreamer::ByteStreamer(int64_t session_id, std::shared_ptr<SessionClient> client)
  : session_id_(session_id), client_(std::move(client)) {}

Result<ObjectProperties> ByteStreamer::get_file_properties(int64_t object_id) {
  auto props = client_->fetch_properties(object_id);
  if (!props && props.error().kind == ErrorKind::UpstreamFetchFailure) {
    spdlog::error("session {}: properties fetch for object {} failed: {}",
                  session_id_, object_id, props.error().message);
  }
  return props;
}

Result<std::string> ByteStreamer::fetch_chunk(int64_t object_id, int64_t offset, int64_t limit) {
  auto chunk = client_->fetch_chunk(object_id, offset, limit);
  if (chunk) {
    chunks_fetched_.fetch_add(1, std::memory_order_relaxed);
    bytes_fetched_.fetch_add(chunk->size(), std::memory_order_relaxed);
  }
  return chunk;
}

std::unique_ptr<ChunkSequencer> ByteStreamer::stream(const ObjectProperties& props,
                                                     const ChunkPlan& plan) {
  return std::make_unique<ChunkSequencer>(shared_from_this(), props.id, plan);
}

} // namespace sgw
