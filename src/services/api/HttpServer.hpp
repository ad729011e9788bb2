#pragma once
#include <chrono>
#include <string>

namespace httplib { class Server; }

namespace sgw {

class SessionPool;
class StreamerCache;
class StreamGateway;
class PageRenderer;
struct GatewayConfig;

struct ServerContext {
  StreamGateway& gateway;
  PageRenderer&  pages;
  SessionPool&   pool;
  StreamerCache& streamers;
  std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
};

// Installs "/", "/status", "/watch/..." and the catch-all download route.
void register_routes(httplib::Server& svr, ServerContext& ctx);

// Start a blocking HTTP server. Returns when the server is stopped (SIGINT /
// SIGTERM) or fails to bind.
bool run_http_server(const GatewayConfig& cfg, ServerContext& ctx);

} // namespace sgw
