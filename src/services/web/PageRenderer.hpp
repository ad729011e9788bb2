#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "services/api/StreamGateway.hpp"

namespace sgw {

struct RenderedPage {
  int         status = 200;
  std::string content_type = "text/html; charset=utf-8";
  std::string body;
};

// HTML viewer for /watch/ links. Media objects get an inline player pointing
// at the download URL; anything else gets a download page.
class PageRenderer {
public:
  PageRenderer(StreamGateway& gateway, std::string base_url)
    : gateway_(gateway), base_url_(std::move(base_url)) {}

  RenderedPage render(std::string_view path,
                      const std::optional<std::string>& query_hash,
                      const std::string& remote = {});

private:
  StreamGateway& gateway_;
  std::string    base_url_;
};

} // namespace sgw
