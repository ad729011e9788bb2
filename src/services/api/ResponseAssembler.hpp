#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/errors/Result.hpp"
#include "core/session/SessionPool.hpp"
#include "core/stream/ChunkSequencer.hpp"
#include "core/stream/RangeResolver.hpp"
#include "core/upstream/SessionClient.hpp"

namespace sgw {

// Transport-independent response. Either `body` is the whole payload, or
// `sequencer` streams exactly `content_length` bytes.
struct StreamResponse {
  int                                              status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      content_type = "text/plain";
  std::string                                      body;
  int64_t                                          content_length = 0;
  std::unique_ptr<ChunkSequencer>                  sequencer;
  SessionPool::Lease                               lease;  // released with the body
  int64_t                                          object_id = 0;

  bool streamed() const { return sequencer != nullptr; }
  std::string header(const std::string& name) const;
};

// Error response with a short plain-text body. Internal faults never carry the
// underlying message to the client.
StreamResponse assemble_error(const GatewayError& err);

// 416 with "Content-Range: bytes */<size>" and an empty body.
StreamResponse assemble_unsatisfiable(int64_t file_size);

// 200 (Full) or 206 (Partial) headers for an object body.
StreamResponse assemble_stream(const ObjectProperties& props, const RangeSpec& range);

} // namespace sgw
