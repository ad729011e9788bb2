#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace sgw {

// 2*nbytes lowercase hex characters from a per-thread PRNG.
std::string random_hex(size_t nbytes);

// "1d 2h 3m 4s"; leading zero units are dropped, "0s" for zero.
std::string readable_duration(int64_t seconds);

// "1.50 MiB" style size with two decimals ("512 B" below 1 KiB).
std::string human_bytes(int64_t bytes);

std::string html_escape(std::string_view s);

} // namespace sgw
