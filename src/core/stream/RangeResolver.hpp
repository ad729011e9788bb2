#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/errors/Result.hpp"

namespace sgw {

enum class RangeStatus { Full, Partial };

struct RangeSpec {
  int64_t     from = 0;
  int64_t     until = -1;  // inclusive; -1 for an empty object
  RangeStatus status = RangeStatus::Full;

  int64_t length() const { return until - from + 1; }
};

// Turns an optional `Range` header into the byte span to serve.
//   absent                       -> Full [0, size-1]
//   "bytes=a-b" / "bytes=a-"     -> Partial, or UnsatisfiableRange if out of bounds
//   anything unparseable         -> Full (lenient)
Result<RangeSpec> resolve_range(const std::optional<std::string>& header, int64_t file_size);

} // namespace sgw
