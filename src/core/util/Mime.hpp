#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace sgw {

constexpr const char* kDefaultMimeType = "application/octet-stream";

// MIME type for a file name's extension (case-insensitive), if known.
std::optional<std::string> guess_mime_type(std::string_view file_name);

struct ContentIdentity {
  std::string mime_type;
  std::string file_name;
};

// Fills in whatever upstream metadata is missing: a known name yields a guessed
// type, a known type yields "<rand>.<subtype>", and with neither the result is
// application/octet-stream and "<rand>.unknown".
ContentIdentity resolve_content_identity(const std::optional<std::string>& mime_type,
                                         const std::optional<std::string>& file_name);

} // namespace sgw
