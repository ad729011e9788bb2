#include "ChunkSequencer.hpp"

#include <algorithm>

#include "core/stream/ByteStreamer.hpp"

namespace sgw {

ChunkSequencer::ChunkSequencer(std::shared_ptr<ByteStreamer> streamer, int64_t object_id, ChunkPlan plan)
  : streamer_(std::move(streamer)), object_id_(object_id), plan_(plan) {}

Result<bool> ChunkSequencer::next(std::string& out) {
  out.clear();
  if (finished_) return false;
  if (cancelled()) {
    finished_ = true;
    return make_error(ErrorKind::ClientDisconnected, "sequence cancelled");
  }
  if (part_ >= plan_.part_count) {
    finished_ = true;
    return false;
  }

  auto chunk = streamer_->fetch_chunk(object_id_, plan_.offset_of(part_), plan_.chunk_size);
  if (!chunk) {
    finished_ = true;
    return chunk.error();
  }

  const std::string& data = chunk.value();
  const bool first = part_ == 0;
  const bool last = part_ == plan_.part_count - 1;

  if (data.empty()) {
    // upstream ran out before the plan did
    finished_ = true;
    return false;
  }
  if (!last && static_cast<int64_t>(data.size()) < plan_.chunk_size) {
    finished_ = true;
    return make_error(ErrorKind::UpstreamFetchFailure,
                      "short chunk " + std::to_string(part_) + " for object " +
                      std::to_string(object_id_));
  }

  size_t end = data.size();
  if (last) end = std::min(end, static_cast<size_t>(plan_.last_cut));
  size_t begin = first ? std::min(end, static_cast<size_t>(plan_.first_cut)) : 0;

  out.assign(data, begin, end - begin);
  emitted_ += static_cast<int64_t>(out.size());
  ++part_;
  return true;
}

} // namespace sgw
