#include "LinkCodec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>

namespace sgw {

// -------- helpers --------

static bool is_token_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

static bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

static std::optional<int64_t> to_id(std::string_view digits) {
  int64_t v = 0;
  auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
  if (ec != std::errc() || p != digits.data() + digits.size()) return std::nullopt;
  return v;
}

// -------- precedence --------

std::optional<HashPrecedence> parse_hash_precedence(std::string_view s) {
  if (s == "query")  return HashPrecedence::Query;
  if (s == "path")   return HashPrecedence::Path;
  if (s == "strict") return HashPrecedence::Strict;
  return std::nullopt;
}

const char* hash_precedence_name(HashPrecedence p) {
  switch (p) {
    case HashPrecedence::Query:  return "query";
    case HashPrecedence::Path:   return "path";
    case HashPrecedence::Strict: return "strict";
  }
  return "query";
}

// -------- parsing --------

Result<LinkRef> parse_link(std::string_view path,
                           const std::optional<std::string>& query_hash,
                           HashPrecedence precedence) {
  // "?hash=" with no value counts as absent
  std::optional<std::string> qhash;
  if (query_hash && !query_hash->empty()) qhash = *query_hash;

  // <token><digits>
  if (path.size() > kCapabilityHashLength) {
    std::string_view token = path.substr(0, kCapabilityHashLength);
    std::string_view digits = path.substr(kCapabilityHashLength);
    bool token_ok = true;
    for (char c : token) token_ok = token_ok && is_token_char(c);

    if (token_ok && all_digits(digits)) {
      auto id = to_id(digits);
      if (!id) return make_error(ErrorKind::MalformedRequest, "object id out of range");

      LinkRef ref{*id, std::string(token)};
      if (qhash && *qhash != ref.capability_hash) {
        spdlog::warn("Hash mismatch: query hash '{}' vs path hash '{}' for id {}",
                     *qhash, ref.capability_hash, *id);
        switch (precedence) {
          case HashPrecedence::Query:  ref.capability_hash = *qhash; break;
          case HashPrecedence::Path:   break;
          case HashPrecedence::Strict:
            return make_error(ErrorKind::MalformedRequest, "conflicting hashes in path and query");
        }
      }
      return ref;
    }
  }

  // <digits>[/anything]
  size_t n = 0;
  while (n < path.size() && std::isdigit(static_cast<unsigned char>(path[n]))) ++n;
  if (n == 0 || (n < path.size() && path[n] != '/')) {
    return make_error(ErrorKind::MalformedRequest, "no object id in path");
  }
  auto id = to_id(path.substr(0, n));
  if (!id) return make_error(ErrorKind::MalformedRequest, "object id out of range");
  if (!qhash) return make_error(ErrorKind::MalformedRequest, "missing hash");

  return LinkRef{*id, *qhash};
}

// -------- generation --------

std::string quote_plus(std::string_view s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '_' || c == '.' || c == '~' || c == '-') {
      out.push_back(static_cast<char>(c));
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(k[c >> 4]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

std::string make_watch_link(const std::string& base_url, int64_t id,
                            const std::string& file_name, const std::string& hash) {
  return base_url + "watch/" + std::to_string(id) + "/" + quote_plus(file_name) +
         "?hash=" + hash;
}

std::string make_download_link(const std::string& base_url, int64_t id,
                               const std::string& file_name, const std::string& hash) {
  return base_url + std::to_string(id) + "/" + quote_plus(file_name) + "?hash=" + hash;
}

} // namespace sgw
