#pragma once
#include <string>
#include <string_view>

#include "core/errors/Result.hpp"
#include "core/upstream/SessionClient.hpp"

namespace sgw {

// First six characters of the object's content hash.
std::string short_hash(std::string_view content_hash);

// Succeeds only if `supplied` equals short_hash(props.content_hash), compared
// case-sensitively. Fails with InvalidCapability and logs a security warning.
Result<bool> validate_capability(const ObjectProperties& props, std::string_view supplied);

} // namespace sgw
