#include "StreamerCache.hpp"

#include <spdlog/spdlog.h>

namespace sgw {

std::shared_ptr<ByteStreamer> StreamerCache::get_or_create(const Session& session) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = streamers_.find(session.id());
  if (it != streamers_.end()) {
    spdlog::debug("Using cached ByteStreamer for session {}", session.id());
    return it->second;
  }
  spdlog::debug("Creating ByteStreamer for session {}", session.id());
  auto streamer = std::make_shared<ByteStreamer>(session.id(), session.client());
  streamers_.emplace(session.id(), streamer);
  return streamer;
}

size_t StreamerCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return streamers_.size();
}

} // namespace sgw
