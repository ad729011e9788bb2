#include "GatewayConfig.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sgw {

using nlohmann::json;

// -------- helpers --------

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static int64_t parse_int(const std::string& key, const std::string& value) {
  try {
    size_t pos = 0;
    const long long v = std::stoll(value, &pos);
    if (pos != value.size()) throw std::invalid_argument(value);
    return static_cast<int64_t>(v);
  } catch (const std::exception&) {
    throw ConfigError(key + ": not an integer: '" + value + "'");
  }
}

static HashPrecedence parse_precedence(const std::string& key, const std::string& value) {
  auto p = parse_hash_precedence(value);
  if (!p) throw ConfigError(key + ": expected query, path or strict, got '" + value + "'");
  return *p;
}

std::string GatewayConfig::base_url() const {
  std::string url = public_url.empty() ? "http://localhost:" + std::to_string(port) + "/"
                                       : public_url;
  if (url.back() != '/') url.push_back('/');
  return url;
}

// -------- layers --------

void apply_config_json(GatewayConfig& cfg, const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("config: invalid JSON: ") + e.what());
  }
  if (!j.is_object()) throw ConfigError("config: top level must be an object");

  try {
    if (j.contains("bind_address"))    cfg.bind_address = j["bind_address"].get<std::string>();
    if (j.contains("port"))            cfg.port = j["port"].get<int>();
    if (j.contains("public_url"))      cfg.public_url = j["public_url"].get<std::string>();
    if (j.contains("chunk_size"))      cfg.chunk_size = j["chunk_size"].get<int64_t>();
    if (j.contains("session_count"))   cfg.session_count = j["session_count"].get<int>();
    if (j.contains("db_path"))         cfg.db_path = j["db_path"].get<std::string>();
    if (j.contains("storage_root"))    cfg.storage_root = j["storage_root"].get<std::string>();
    if (j.contains("hash_precedence"))
      cfg.hash_precedence = parse_precedence("hash_precedence", j["hash_precedence"].get<std::string>());
    if (j.contains("worker_threads"))  cfg.worker_threads = j["worker_threads"].get<int>();
    if (j.contains("log_level"))       cfg.log_level = j["log_level"].get<std::string>();
  } catch (const json::type_error& e) {
    throw ConfigError(std::string("config: wrong value type: ") + e.what());
  }
}

void apply_config_env(GatewayConfig& cfg) {
  auto env = [](const char* k) { return get_env_or(k, ""); };
  std::string v;

  if (!(v = env("SGW_BIND")).empty())            cfg.bind_address = v;
  if (!(v = env("SGW_PORT")).empty())            cfg.port = static_cast<int>(parse_int("SGW_PORT", v));
  if (!(v = env("SGW_URL")).empty())             cfg.public_url = v;
  if (!(v = env("SGW_CHUNK_SIZE")).empty())      cfg.chunk_size = parse_int("SGW_CHUNK_SIZE", v);
  if (!(v = env("SGW_SESSIONS")).empty())        cfg.session_count = static_cast<int>(parse_int("SGW_SESSIONS", v));
  if (!(v = env("SGW_DB_PATH")).empty())         cfg.db_path = v;
  if (!(v = env("SGW_STORAGE_ROOT")).empty())    cfg.storage_root = v;
  if (!(v = env("SGW_HASH_PRECEDENCE")).empty()) cfg.hash_precedence = parse_precedence("SGW_HASH_PRECEDENCE", v);
  if (!(v = env("SGW_THREADS")).empty())         cfg.worker_threads = static_cast<int>(parse_int("SGW_THREADS", v));
  if (!(v = env("SGW_LOG_LEVEL")).empty())       cfg.log_level = v;
}

void validate_config(const GatewayConfig& cfg) {
  if (cfg.port < 0 || cfg.port > 65535) throw ConfigError("port out of range: " + std::to_string(cfg.port));
  if (cfg.chunk_size <= 0) throw ConfigError("chunk_size must be positive");
  if (cfg.chunk_size > kMaxChunkSize) {
    throw ConfigError("chunk_size " + std::to_string(cfg.chunk_size) + " exceeds the " +
                      std::to_string(kMaxChunkSize) + " byte limit");
  }
  if (cfg.session_count < 1) throw ConfigError("session_count must be at least 1");
  if (cfg.worker_threads < 1) throw ConfigError("worker_threads must be at least 1");

  static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  bool known = false;
  for (const char* l : levels) known = known || cfg.log_level == l;
  if (!known) throw ConfigError("unknown log_level '" + cfg.log_level + "'");
}

GatewayConfig load_config() {
  GatewayConfig cfg;
  const std::string path = get_env_or("SGW_CONFIG", "");
  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);
    std::ostringstream buf; buf << in.rdbuf();
    apply_config_json(cfg, buf.str());
  }
  apply_config_env(cfg);
  validate_config(cfg);
  return cfg;
}

} // namespace sgw
