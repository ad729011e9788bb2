#include "ChunkPlan.hpp"

#include <stdexcept>

namespace sgw {

ChunkPlan make_chunk_plan(const RangeSpec& range, int64_t chunk_size) {
  if (chunk_size <= 0) throw std::invalid_argument("chunk_size must be positive");

  ChunkPlan plan;
  plan.chunk_size = chunk_size;
  if (range.until < range.from) return plan;

  plan.aligned_offset = range.from - (range.from % chunk_size);
  plan.first_cut = range.from - plan.aligned_offset;
  const int64_t last_boundary = (range.until + 1) % chunk_size;
  plan.last_cut = last_boundary != 0 ? last_boundary : chunk_size;
  plan.part_count = range.until / chunk_size - plan.aligned_offset / chunk_size + 1;
  return plan;
}

} // namespace sgw
