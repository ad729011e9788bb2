#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/errors/Result.hpp"

namespace sgw {

constexpr size_t kCapabilityHashLength = 6;

// Which hash wins when a request carries one in the path and another in `?hash=`.
enum class HashPrecedence {
  Query,  // query overrides path (compatible default)
  Path,   // path-embedded hash is authoritative
  Strict  // a disagreement is a malformed request
};

std::optional<HashPrecedence> parse_hash_precedence(std::string_view s);
const char* hash_precedence_name(HashPrecedence p);

struct LinkRef {
  int64_t     object_id = 0;
  std::string capability_hash;
};

// Extracts (object id, capability hash) from a request path (without the leading
// '/' or the "watch/" prefix) and the optional `hash` query value.
//   "<6-char token><digits>"   hash from path, id from digits
//   "<digits>[/anything]"      id from digits, hash from query
Result<LinkRef> parse_link(std::string_view path,
                           const std::optional<std::string>& query_hash,
                           HashPrecedence precedence = HashPrecedence::Query);

// Form-style quoting of a path segment: ' ' becomes '+', everything outside
// [A-Za-z0-9_.~-] is percent-encoded.
std::string quote_plus(std::string_view s);

// {base}watch/{id}/{name}?hash={hash}
std::string make_watch_link(const std::string& base_url, int64_t id,
                            const std::string& file_name, const std::string& hash);
// {base}{id}/{name}?hash={hash}
std::string make_download_link(const std::string& base_url, int64_t id,
                               const std::string& file_name, const std::string& hash);

} // namespace sgw
