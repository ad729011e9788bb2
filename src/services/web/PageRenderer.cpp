#include "PageRenderer.hpp"

#include <spdlog/spdlog.h>

#include "core/util/Format.hpp"
#include "core/util/Mime.hpp"

namespace sgw {

static const char* kPageHead = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>{title}</title>
<style>
body { font-family: sans-serif; background: #111; color: #eee; margin: 0; padding: 2rem; text-align: center; }
video, audio { max-width: 100%; margin-top: 1rem; }
a.button { display: inline-block; margin-top: 1.5rem; padding: .7rem 1.4rem; background: #2a7de1; color: #fff; text-decoration: none; border-radius: 6px; }
</style>
</head>
<body>
<h3>{title}</h3>
)HTML";

static const char* kPageTail = "</body>\n</html>\n";

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  for (size_t pos = 0; (pos = s.find(from, pos)) != std::string::npos; pos += to.size()) {
    s.replace(pos, from.size(), to);
  }
  return s;
}

RenderedPage PageRenderer::render(std::string_view path,
                                  const std::optional<std::string>& query_hash,
                                  const std::string& remote) {
  RenderedPage page;
  auto auth = gateway_.authorize(path, query_hash, remote);
  if (!auth) {
    const auto& err = auth.error();
    page.status = http_status_for(err.kind);
    page.content_type = "text/plain";
    switch (err.kind) {
      case ErrorKind::MalformedRequest:  page.body = "Invalid URL format or missing hash."; break;
      case ErrorKind::InvalidCapability:
      case ErrorKind::ObjectNotFound:    page.body = err.message; break;
      default:
        spdlog::error("Viewer page for /watch/{} failed: {}", path, err.message);
        page.status = 500;
        page.body = "An internal server error occurred.";
    }
    return page;
  }

  const ObjectProperties& props = auth->props;
  const ContentIdentity ident = resolve_content_identity(props.mime_type, props.file_name);
  const std::string src = html_escape(base_url_ + std::to_string(props.id) +
                                      "?hash=" + auth->link.capability_hash);
  const std::string title = html_escape(ident.file_name);
  const std::string type = html_escape(ident.mime_type);

  std::string html = replace_all(kPageHead, "{title}", title);
  const std::string major = ident.mime_type.substr(0, ident.mime_type.find('/'));
  if (major == "video" || major == "audio") {
    html += "<" + major + " controls preload=\"metadata\">\n";
    html += "<source src=\"" + src + "\" type=\"" + type + "\">\n";
    html += "</" + major + ">\n";
  } else {
    html += "<p>Size: " + html_escape(human_bytes(props.size)) + "</p>\n";
  }
  html += "<a class=\"button\" href=\"" + src + "\">Download</a>\n";
  html += kPageTail;

  page.body = std::move(html);
  return page;
}

} // namespace sgw
