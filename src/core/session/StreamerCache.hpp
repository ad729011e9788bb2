#pragma once
#include <memory>
#include <mutex>
#include <unordered_map>

#include "core/session/SessionPool.hpp"
#include "core/stream/ByteStreamer.hpp"

namespace sgw {

// One ByteStreamer per session, created on first use and kept for the life of
// the process. Insert-if-absent runs under a lock, so concurrent first use of
// a session still yields a single adapter.
class StreamerCache {
public:
  std::shared_ptr<ByteStreamer> get_or_create(const Session& session);

  size_t size() const;

private:
  mutable std::mutex                                        mu_;
  std::unordered_map<int64_t, std::shared_ptr<ByteStreamer>> streamers_;
};

} // namespace sgw
