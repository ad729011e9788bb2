#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/link/LinkCodec.hpp"

namespace sgw {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Each chunk is buffered whole, so the size is capped.
constexpr int64_t kMaxChunkSize = 64LL * 1024 * 1024;

struct GatewayConfig {
  std::string    bind_address = "0.0.0.0";
  int            port = 8080;
  std::string    public_url;             // empty: http://localhost:<port>/
  int64_t        chunk_size = 1024 * 1024;
  int            session_count = 1;
  std::string    db_path = "data/streamgate.db";
  std::string    storage_root = "data/objects";
  HashPrecedence hash_precedence = HashPrecedence::Query;
  int            worker_threads = 8;
  std::string    log_level = "info";

  // public_url with a trailing '/', or the localhost default.
  std::string base_url() const;
};

std::string get_env_or(const char* key, const std::string& defval);

// Applies a JSON object of the same field names on top of `cfg`.
void apply_config_json(GatewayConfig& cfg, const std::string& json_text);

// Applies SGW_* environment variables on top of `cfg`.
void apply_config_env(GatewayConfig& cfg);

// Throws ConfigError when a field is out of range.
void validate_config(const GatewayConfig& cfg);

// Defaults, then the file named by SGW_CONFIG (if set), then the environment.
GatewayConfig load_config();

} // namespace sgw
