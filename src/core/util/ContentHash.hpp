#pragma once
#include <string>
#include <string_view>

namespace sgw {

// URL-safe base64 (no padding) of the SHA-256 digest. Every character is in
// [A-Za-z0-9_-], so any 6-character prefix is a valid link token.
std::string content_hash_of(std::string_view bytes);

// Same digest over a file's contents, read in 1 MiB blocks.
// Throws std::runtime_error on I/O or OpenSSL failure.
std::string content_hash_of_file(const std::string& path);

} // namespace sgw
