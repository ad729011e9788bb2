// src/main.cpp
#include <cstdlib>
#include <ctime>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/access/CapabilityValidator.hpp"
#include "core/config/CommandLine.hpp"
#include "core/config/GatewayConfig.hpp"
#include "core/link/LinkCodec.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataStore.hpp"
#include "core/metadata/UserRegistry.hpp"
#include "core/session/SessionPool.hpp"
#include "core/session/StreamerCache.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/upstream/LocalSessionClient.hpp"
#include "core/util/ContentHash.hpp"
#include "core/util/Mime.hpp"
#include "services/api/HttpServer.hpp"
#include "services/api/StreamGateway.hpp"
#include "services/web/PageRenderer.hpp"

using namespace sgw;

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path(get_env_or("SGW_SCHEMA", "src/core/metadata/schema.sql"))
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and SGW_SCHEMA)");
}

static void setup_logging(const GatewayConfig& cfg) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));
}

static int64_t parse_user_id(const char* s) {
  try {
    size_t pos = 0;
    const long long v = std::stoll(s, &pos);
    if (pos != std::string(s).size()) throw std::invalid_argument(s);
    return v;
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("not a user id: ") + s);
  }
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                      # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve                     # start HTTP server (SGW_PORT or 8080)\n"
            << "  " << argv0 << " --register <file> [--mime <type>] [--name <name>]\n"
            << "  " << argv0 << " --ban <user_id> | --unban <user_id>\n";
}

// ---------- commands ----------

static int cmd_register(const GatewayConfig& cfg, int argc, char** argv) {
  namespace fs = std::filesystem;
  const RegisterOptions opts = parse_register_args(std::vector<std::string>(argv + 2, argv + argc));

  const fs::path file = fs::absolute(opts.file);
  std::optional<std::string> mime = opts.mime_type, name = opts.file_name;
  if (!name) name = file.filename().string();
  if (!mime) mime = guess_mime_type(*name);

  LocalFSBackend storage(cfg.storage_root);
  ObjectRecord rec;
  rec.content_hash = content_hash_of_file(file.string());
  rec.size         = storage.size_of(file.string());
  rec.mime_type    = mime;
  rec.file_name    = name;
  rec.storage_path = file.string();
  rec.created_at   = static_cast<int64_t>(std::time(nullptr));

  MetadataStore store(cfg.db_path);
  const int64_t id = store.insertObject(rec);
  const std::string hash = short_hash(rec.content_hash);

  std::cout << "id:       " << id << "\n"
            << "watch:    " << make_watch_link(cfg.base_url(), id, *name, hash) << "\n"
            << "download: " << make_download_link(cfg.base_url(), id, *name, hash) << "\n";
  return 0;
}

static int cmd_serve(const GatewayConfig& cfg) {
  std::filesystem::create_directories(cfg.storage_root);
  LocalFSBackend storage(cfg.storage_root);

  std::vector<std::shared_ptr<SessionClient>> clients;
  for (int i = 0; i < cfg.session_count; ++i) {
    clients.push_back(std::make_shared<LocalSessionClient>(cfg.db_path, storage));
  }

  SessionPool pool(std::move(clients));
  StreamerCache streamers;
  StreamGateway gateway(pool, streamers, cfg.chunk_size, cfg.hash_precedence);
  PageRenderer pages(gateway, cfg.base_url());
  ServerContext ctx{gateway, pages, pool, streamers};

  spdlog::info("{} upstream session(s), chunk size {}, hash precedence {}",
               pool.size(), cfg.chunk_size, hash_precedence_name(cfg.hash_precedence));
  return run_http_server(cfg, ctx) ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    if (argc < 2) { print_usage(argv[0]); return 1; }
    const std::string cmd = argv[1];

    const GatewayConfig cfg = load_config();
    setup_logging(cfg);

    if (cmd == "--init") {
      initDatabase(cfg.db_path, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.db_path << "\n";
      return 0;
    }

    if (cmd == "--serve") {
      // Self-heal DB on startup (idempotent)
      initDatabase(cfg.db_path, findSchemaPath());
      return cmd_serve(cfg);
    }

    if (cmd == "--register") {
      initDatabase(cfg.db_path, findSchemaPath());
      return cmd_register(cfg, argc, argv);
    }

    if ((cmd == "--ban" || cmd == "--unban") && argc > 2) {
      UserRegistry users(cfg.db_path);
      const int64_t uid = parse_user_id(argv[2]);
      const bool changed = cmd == "--ban" ? users.ban(uid) : users.unban(uid);
      std::cout << (changed ? "updated" : "no change") << " (user " << uid << ")\n";
      return changed ? 0 : 3;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
