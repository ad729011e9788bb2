#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/errors/Result.hpp"
#include "core/stream/ChunkPlan.hpp"

namespace sgw {

class ByteStreamer;

// Pull-based iterator over the bytes of one ranged request. Each next() issues
// at most one upstream fetch, so a consumer that stops pulling stops fetching.
// Finite and not restartable: once exhausted, failed or cancelled it stays so.
class ChunkSequencer {
public:
  ChunkSequencer(std::shared_ptr<ByteStreamer> streamer, int64_t object_id, ChunkPlan plan);

  ChunkSequencer(const ChunkSequencer&) = delete;
  ChunkSequencer& operator=(const ChunkSequencer&) = delete;

  // true: `out` holds the next slice. false: the sequence is complete.
  // Errors: UpstreamFetchFailure / ObjectNotFound from upstream,
  // ClientDisconnected after cancel().
  Result<bool> next(std::string& out);

  // May be called from any thread; takes effect at the next pull.
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

  bool finished() const { return finished_; }
  int64_t parts_fetched() const { return part_; }
  int64_t bytes_emitted() const { return emitted_; }
  const ChunkPlan& plan() const { return plan_; }

private:
  std::shared_ptr<ByteStreamer> streamer_;
  int64_t                       object_id_;
  ChunkPlan                     plan_;
  int64_t                       part_ = 0;
  int64_t                       emitted_ = 0;
  bool                          finished_ = false;
  std::atomic<bool>             cancelled_{false};
};

} // namespace sgw
