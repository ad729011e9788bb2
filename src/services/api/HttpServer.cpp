#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <memory>
#include <optional>
#include <string>

#include "core/config/GatewayConfig.hpp"
#include "core/session/SessionPool.hpp"
#include "core/session/StreamerCache.hpp"
#include "core/util/Format.hpp"
#include "services/api/StreamGateway.hpp"
#include "services/web/PageRenderer.hpp"

#ifndef SGW_VERSION
#define SGW_VERSION "0.0.0"
#endif

using nlohmann::json;

// -------- helpers --------

static std::optional<std::string> param_opt(const httplib::Request& req, const char* k) {
  if (!req.has_param(k)) return std::nullopt;
  return req.get_param_value(k);
}

static std::optional<std::string> header_opt(const httplib::Request& req, const char* k) {
  if (!req.has_header(k)) return std::nullopt;
  return req.get_header_value(k);
}

// httplib slices provider output against its own parse of the Range header.
// The gateway has already resolved the range, so the transport's copy is dropped.
static void detach_transport_ranges(const httplib::Request& req) {
  const_cast<httplib::Request&>(req).ranges.clear();
}

static int64_t uptime_seconds(const sgw::ServerContext& ctx) {
  using namespace std::chrono;
  return duration_cast<seconds>(steady_clock::now() - ctx.started).count();
}

namespace {

// Body state shared by httplib's provider and releaser callbacks. Holds the
// session lease, so the workload drops when the transfer ends either way.
struct BodyStream {
  std::unique_ptr<sgw::ChunkSequencer> sequencer;
  sgw::SessionPool::Lease              lease;
  int64_t                              object_id = 0;
  int64_t                              content_length = 0;

  bool pump(httplib::DataSink& sink) {
    if (!sink.is_writable()) sequencer->cancel();

    std::string chunk;
    auto more = sequencer->next(chunk);
    if (!more) {
      const auto& err = more.error();
      if (err.kind == sgw::ErrorKind::ClientDisconnected) {
        spdlog::debug("Client disconnected while streaming object {}", object_id);
      } else {
        spdlog::error("Stream for object {} aborted after {} bytes ({}): {}",
                      object_id, sequencer->bytes_emitted(), sgw::error_kind_name(err.kind),
                      err.message);
      }
      return false;
    }
    if (!more.value()) {
      spdlog::error("Stream for object {} ended after {} of {} bytes",
                    object_id, sequencer->bytes_emitted(), content_length);
      return false;
    }
    if (!sink.write(chunk.data(), chunk.size())) {
      sequencer->cancel();
      spdlog::debug("Client disconnected while streaming object {}", object_id);
      return false;
    }
    return true;
  }

  void finish(bool success) {
    if (!success) {
      sequencer->cancel();
      spdlog::debug("Stream for object {} closed early after {} of {} bytes",
                    object_id, sequencer->bytes_emitted(), content_length);
    }
    lease.release();
  }
};

std::atomic<httplib::Server*> g_running{nullptr};

void on_signal(int) {
  if (auto* svr = g_running.load()) svr->stop();
}

} // namespace

// -------- server --------

namespace sgw {

static void write_response(StreamResponse&& out, httplib::Response& res) {
  res.status = out.status;
  for (const auto& [k, v] : out.headers) res.set_header(k, v);

  if (!out.streamed() || out.content_length == 0) {
    if (!out.body.empty() || out.status < 400) res.set_content(out.body, out.content_type);
    return;
  }

  auto body = std::make_shared<BodyStream>();
  body->sequencer      = std::move(out.sequencer);
  body->lease          = std::move(out.lease);
  body->object_id      = out.object_id;
  body->content_length = out.content_length;

  res.set_content_provider(
      static_cast<size_t>(out.content_length),
      out.content_type,
      [body](size_t, size_t, httplib::DataSink& sink) { return body->pump(sink); },
      [body](bool success) { body->finish(success); });
}

static void serve_banner(ServerContext& ctx, httplib::Response& res) {
  const std::string text = std::string("streamgate is running\n\nVersion: ") + SGW_VERSION +
                           "\nUptime: " + readable_duration(uptime_seconds(ctx));
  res.status = 200;
  res.set_content(text, "text/plain");
}

static void serve_status(ServerContext& ctx, httplib::Response& res) {
  json sessions = json::array();
  for (const auto& s : ctx.pool.sessions()) {
    sessions.push_back({{"id", s->id()}, {"workload", s->workload()}});
  }
  const int64_t up = uptime_seconds(ctx);
  json out = {
    {"version", SGW_VERSION},
    {"uptime", readable_duration(up)},
    {"uptime_seconds", up},
    {"sessions", sessions},
    {"streamers", ctx.streamers.size()}
  };
  res.status = 200;
  res.set_content(out.dump(), "application/json");
}

// Pages are never ranged.
static void serve_page(ServerContext& ctx, const std::string& link,
                       const httplib::Request& req, httplib::Response& res) {
  detach_transport_ranges(req);
  RenderedPage page = ctx.pages.render(link, param_opt(req, "hash"), req.remote_addr);
  res.status = page.status;
  res.set_content(page.body, page.content_type);
}

static void serve_download(ServerContext& ctx, const std::string& link,
                           const httplib::Request& req, httplib::Response& res) {
  detach_transport_ranges(req);
  StreamRequest sreq;
  sreq.path       = link;
  sreq.query_hash = param_opt(req, "hash");
  sreq.range      = header_opt(req, "Range");
  sreq.remote     = req.remote_addr;
  write_response(ctx.gateway.handle(sreq), res);
}

// httplib answers 416 before routing when it cannot parse the Range header
// (or its first > last). Such requests are dispatched by path here so the
// gateway's own range rules apply.
static void reroute_rejected_range(ServerContext& ctx, const httplib::Request& req,
                                   httplib::Response& res) {
  static const std::string kWatch = "/watch/";
  detach_transport_ranges(req);
  const std::string& path = req.path;
  spdlog::debug("Transport rejected range '{}' for {}, rerouting",
                req.get_header_value("Range"), path);

  if (path == "/") {
    serve_banner(ctx, res);
  } else if (path == "/status") {
    serve_status(ctx, res);
  } else if (path.size() > kWatch.size() && path.compare(0, kWatch.size(), kWatch) == 0) {
    serve_page(ctx, path.substr(kWatch.size()), req, res);
  } else if (path.size() > 1 && path[0] == '/') {
    serve_download(ctx, path.substr(1), req, res);
  } else {
    res.status = 404;
    res.set_content("not found", "text/plain");
  }
}

void register_routes(httplib::Server& svr, ServerContext& ctx) {
  svr.Get("/", [&ctx](const httplib::Request&, httplib::Response& res) {
    serve_banner(ctx, res);
  });

  svr.Get("/status", [&ctx](const httplib::Request&, httplib::Response& res) {
    serve_status(ctx, res);
  });

  // GET /watch/{hash}{id}  or  /watch/{id}[/{name}]?hash={hash}
  svr.Get(R"(/watch/(.+))", [&ctx](const httplib::Request& req, httplib::Response& res) {
    serve_page(ctx, req.matches[1].str(), req, res);
  });

  // GET /{hash}{id}  or  /{id}[/{name}]?hash={hash}
  svr.Get(R"(/(.+))", [&ctx](const httplib::Request& req, httplib::Response& res) {
    serve_download(ctx, req.matches[1].str(), req, res);
  });

  // Fallback
  svr.set_error_handler([&ctx](const httplib::Request& req, httplib::Response& res) {
    const bool is_get = req.method == "GET" || req.method == "HEAD";
    if (is_get && res.status == 416 && !res.has_header("Content-Range")) {
      reroute_rejected_range(ctx, req, res);
      return httplib::Server::HandlerResponse::Handled;
    }
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
    return httplib::Server::HandlerResponse::Unhandled;
  });
}

bool run_http_server(const GatewayConfig& cfg, ServerContext& ctx) {
  httplib::Server svr;
  const size_t threads = static_cast<size_t>(cfg.worker_threads);
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  register_routes(svr, ctx);

  g_running.store(&svr);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  spdlog::info("HTTP server listening on http://{}:{}", cfg.bind_address, cfg.port);
  const bool ok = svr.listen(cfg.bind_address, cfg.port);
  g_running.store(nullptr);
  if (!ok) {
    spdlog::error("Failed to bind {}:{}", cfg.bind_address, cfg.port);
    return false;
  }
  spdlog::info("HTTP server stopped");
  return true;
}

} // namespace sgw
