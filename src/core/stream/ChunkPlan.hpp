#pragma once
#include <cstdint>

#include "core/stream/RangeResolver.hpp"

namespace sgw {

constexpr int64_t kDefaultChunkSize = 1024 * 1024;

// Upstream fetch layout for one request. Fetches start on chunk boundaries;
// the first chunk drops `first_cut` leading bytes and the last keeps
// `last_cut` bytes.
struct ChunkPlan {
  int64_t chunk_size = kDefaultChunkSize;
  int64_t aligned_offset = 0;
  int64_t first_cut = 0;
  int64_t last_cut = 0;
  int64_t part_count = 0;

  // Upstream offset of the i-th fetch (0-based).
  int64_t offset_of(int64_t part) const { return aligned_offset + part * chunk_size; }
};

// An empty range (until < from, e.g. a zero-byte object) yields part_count 0.
ChunkPlan make_chunk_plan(const RangeSpec& range, int64_t chunk_size);

} // namespace sgw
