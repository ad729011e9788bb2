#include "CapabilityValidator.hpp"

#include <spdlog/spdlog.h>

#include "core/link/LinkCodec.hpp"

namespace sgw {

std::string short_hash(std::string_view content_hash) {
  return std::string(content_hash.substr(0, kCapabilityHashLength));
}

Result<bool> validate_capability(const ObjectProperties& props, std::string_view supplied) {
  const std::string expected = short_hash(props.content_hash);
  // An object whose content hash is shorter than a full token can never be unlocked
  if (expected.size() != kCapabilityHashLength || supplied != expected) {
    spdlog::warn("Security alert: invalid hash '{}' for object {}", supplied, props.id);
    return make_error(ErrorKind::InvalidCapability, "Provided hash is invalid. Access Denied.");
  }
  return true;
}

} // namespace sgw
