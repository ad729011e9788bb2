#include "StreamGateway.hpp"

#include <spdlog/spdlog.h>

#include <exception>

#include "core/access/CapabilityValidator.hpp"
#include "core/stream/ChunkPlan.hpp"
#include "core/stream/RangeResolver.hpp"

namespace sgw {

StreamGateway::StreamGateway(SessionPool& pool,
                             StreamerCache& cache,
                             int64_t chunk_size,
                             HashPrecedence precedence)
  : pool_(pool), cache_(cache), chunk_size_(chunk_size), precedence_(precedence) {}

Result<AuthorizedObject> StreamGateway::authorize(std::string_view path,
                                                  const std::optional<std::string>& query_hash,
                                                  const std::string& remote) {
  auto link = parse_link(path, query_hash, precedence_);
  if (!link) return link.error();

  AuthorizedObject auth;
  auth.link = link.value();
  auth.lease = pool_.acquire();
  Session& session = *auth.lease.session();
  if (pool_.size() > 1) {
    spdlog::info("Session {} is now serving {} for object {}",
                 session.id(), remote.empty() ? "-" : remote, auth.link.object_id);
  }

  auth.streamer = cache_.get_or_create(session);
  auto props = auth.streamer->get_file_properties(auth.link.object_id);
  if (!props) return props.error();
  auth.props = std::move(props.value());

  auto allowed = validate_capability(auth.props, auth.link.capability_hash);
  if (!allowed) return allowed.error();

  return std::move(auth);
}

StreamResponse StreamGateway::handle(const StreamRequest& req) {
  try {
    auto auth = authorize(req.path, req.query_hash, req.remote);
    if (!auth) {
      const auto& err = auth.error();
      if (err.kind == ErrorKind::ObjectNotFound) {
        spdlog::warn("Object not found for path /{}: {}", req.path, err.message);
      } else if (err.kind == ErrorKind::UpstreamFetchFailure) {
        spdlog::error("Upstream failure for path /{}: {}", req.path, err.message);
      }
      return assemble_error(err);
    }

    AuthorizedObject& obj = auth.value();
    auto range = resolve_range(req.range, obj.props.size);
    if (!range) return assemble_unsatisfiable(obj.props.size);

    StreamResponse res = assemble_stream(obj.props, range.value());
    const ChunkPlan plan = make_chunk_plan(range.value(), chunk_size_);
    res.sequencer = obj.streamer->stream(obj.props, plan);
    res.lease = std::move(obj.lease);
    return res;
  } catch (const std::exception& e) {
    spdlog::error("Unhandled error for path /{}: {}", req.path, e.what());
    return assemble_error(make_error(ErrorKind::InternalFault, e.what()));
  }
}

} // namespace sgw
