#include "Mime.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "core/util/Format.hpp"

namespace sgw {

namespace {

const std::unordered_map<std::string, std::string>& mime_table() {
  static const std::unordered_map<std::string, std::string> table = {
    {"mp4", "video/mp4"},        {"m4v", "video/x-m4v"},
    {"mkv", "video/x-matroska"}, {"webm", "video/webm"},
    {"avi", "video/x-msvideo"},  {"mov", "video/quicktime"},
    {"ts", "video/mp2t"},        {"3gp", "video/3gpp"},
    {"flv", "video/x-flv"},      {"wmv", "video/x-ms-wmv"},
    {"mp3", "audio/mpeg"},       {"m4a", "audio/mp4"},
    {"aac", "audio/aac"},        {"flac", "audio/flac"},
    {"ogg", "audio/ogg"},        {"opus", "audio/opus"},
    {"wav", "audio/x-wav"},      {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},      {"png", "image/png"},
    {"gif", "image/gif"},        {"webp", "image/webp"},
    {"svg", "image/svg+xml"},    {"pdf", "application/pdf"},
    {"zip", "application/zip"},  {"rar", "application/vnd.rar"},
    {"7z", "application/x-7z-compressed"},
    {"gz", "application/gzip"},  {"tar", "application/x-tar"},
    {"apk", "application/vnd.android.package-archive"},
    {"epub", "application/epub+zip"},
    {"json", "application/json"}, {"txt", "text/plain"},
    {"srt", "application/x-subrip"}, {"vtt", "text/vtt"},
    {"html", "text/html"},       {"htm", "text/html"},
    {"css", "text/css"},         {"csv", "text/csv"},
  };
  return table;
}

} // namespace

std::optional<std::string> guess_mime_type(std::string_view file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string_view::npos || dot + 1 == file_name.size()) return std::nullopt;
  std::string ext(file_name.substr(dot + 1));
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = mime_table().find(ext);
  if (it == mime_table().end()) return std::nullopt;
  return it->second;
}

ContentIdentity resolve_content_identity(const std::optional<std::string>& mime_type,
                                         const std::optional<std::string>& file_name) {
  const bool has_mime = mime_type && !mime_type->empty();
  const bool has_name = file_name && !file_name->empty();

  ContentIdentity id;
  if (has_mime) {
    id.mime_type = *mime_type;
    if (has_name) {
      id.file_name = *file_name;
    } else {
      const auto slash = mime_type->find('/');
      const std::string ext = (slash == std::string::npos || slash + 1 == mime_type->size())
                                ? "unknown" : mime_type->substr(slash + 1);
      id.file_name = random_hex(2) + "." + ext;
    }
  } else if (has_name) {
    id.file_name = *file_name;
    id.mime_type = guess_mime_type(*file_name).value_or(kDefaultMimeType);
  } else {
    id.mime_type = kDefaultMimeType;
    id.file_name = random_hex(2) + ".unknown";
  }
  return id;
}

} // namespace sgw
