#include "ResponseAssembler.hpp"

#include "core/util/Mime.hpp"

namespace sgw {

// Keeps a file name inside a quoted header parameter.
static std::string header_safe(std::string name) {
  for (auto& c : name) {
    if (c == '"' || c == '\\' || c == '\r' || c == '\n') c = '_';
  }
  return name;
}

std::string StreamResponse::header(const std::string& name) const {
  for (const auto& [k, v] : headers) {
    if (k == name) return v;
  }
  return {};
}

StreamResponse assemble_error(const GatewayError& err) {
  StreamResponse res;
  res.status = http_status_for(err.kind);
  switch (err.kind) {
    case ErrorKind::MalformedRequest:
      res.body = "Invalid URL format or missing hash.";
      break;
    case ErrorKind::InvalidCapability:
    case ErrorKind::ObjectNotFound:
      res.body = err.message;
      break;
    case ErrorKind::UnsatisfiableRange:
      res.body.clear();
      break;
    default:
      res.status = 500;
      res.body = "An internal server error occurred.";
  }
  return res;
}

StreamResponse assemble_unsatisfiable(int64_t file_size) {
  StreamResponse res;
  res.status = 416;
  res.headers.emplace_back("Content-Range", "bytes */" + std::to_string(file_size));
  return res;
}

StreamResponse assemble_stream(const ObjectProperties& props, const RangeSpec& range) {
  const ContentIdentity ident = resolve_content_identity(props.mime_type, props.file_name);

  StreamResponse res;
  res.object_id = props.id;
  res.status = range.status == RangeStatus::Partial ? 206 : 200;
  res.content_type = ident.mime_type;
  res.content_length = range.length() > 0 ? range.length() : 0;

  if (range.status == RangeStatus::Partial) {
    res.headers.emplace_back("Content-Range",
        "bytes " + std::to_string(range.from) + "-" + std::to_string(range.until) + "/" +
        std::to_string(props.size));
  }
  res.headers.emplace_back("Content-Disposition", "attachment; filename=\"" + header_safe(ident.file_name) + "\"");
  res.headers.emplace_back("Accept-Ranges", "bytes");
  res.headers.emplace_back("Cache-Control", "no-cache, no-store, must-revalidate");
  res.headers.emplace_back("Pragma", "no-cache");
  res.headers.emplace_back("Expires", "0");
  return res;
}

} // namespace sgw
