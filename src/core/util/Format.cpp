#include "Format.hpp"

#include <cstdio>
#include <random>

namespace sgw {

std::string random_hex(size_t nbytes) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char* k = "0123456789abcdef";
  std::string s(nbytes * 2, '0');
  for (size_t i = 0; i < nbytes; ++i) {
    const auto b = static_cast<uint8_t>(rng() & 0xFF);
    s[2 * i]     = k[(b >> 4) & 0xF];
    s[2 * i + 1] = k[b & 0xF];
  }
  return s;
}

std::string readable_duration(int64_t seconds) {
  if (seconds < 0) seconds = 0;
  const int64_t parts[] = {seconds / 86400, (seconds % 86400) / 3600,
                           (seconds % 3600) / 60, seconds % 60};
  const char* units[] = {"d", "h", "m", "s"};

  std::string out;
  for (int i = 0; i < 4; ++i) {
    if (out.empty() && parts[i] == 0 && i < 3) continue;
    if (!out.empty()) out += ' ';
    out += std::to_string(parts[i]) + units[i];
  }
  return out;
}

std::string human_bytes(int64_t bytes) {
  if (bytes < 1024) return std::to_string(bytes < 0 ? 0 : bytes) + " B";
  static const char* units[] = {"KiB", "MiB", "GiB", "TiB", "PiB"};
  double v = static_cast<double>(bytes) / 1024.0;
  int u = 0;
  while (v >= 1024.0 && u < 4) { v /= 1024.0; ++u; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f %s", v, units[u]);
  return buf;
}

std::string html_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#39;";  break;
      default:   out += c;
    }
  }
  return out;
}

} // namespace sgw
