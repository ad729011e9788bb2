#include "RangeResolver.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <string_view>

namespace sgw {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static std::optional<int64_t> parse_offset(std::string_view s) {
  s = trim(s);
  // byte positions are plain digits; from_chars would also take a sign
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s.front()))) return std::nullopt;
  int64_t v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) return std::nullopt;
  return v;
}

Result<RangeSpec> resolve_range(const std::optional<std::string>& header, int64_t file_size) {
  RangeSpec full{0, file_size - 1, RangeStatus::Full};
  if (!header) return full;

  std::string_view h = trim(*header);
  constexpr std::string_view kUnit = "bytes=";
  if (h.substr(0, kUnit.size()) == kUnit) h.remove_prefix(kUnit.size());

  const auto dash = h.find('-');
  const auto from = parse_offset(h.substr(0, dash));
  std::optional<int64_t> until = file_size - 1;
  if (dash != std::string_view::npos && !trim(h.substr(dash + 1)).empty()) {
    until = parse_offset(h.substr(dash + 1));
  }

  if (!from || !until) {
    spdlog::warn("Malformed range header '{}', serving full object", *header);
    return full;
  }

  if (!(0 <= *from && *from < file_size && 0 <= *until && *until < file_size && *from <= *until)) {
    spdlog::warn("Unsatisfiable range '{}' for object of {} bytes", *header, file_size);
    return make_error(ErrorKind::UnsatisfiableRange, "416: Range Not Satisfiable");
  }
  return RangeSpec{*from, *until, RangeStatus::Partial};
}

} // namespace sgw
