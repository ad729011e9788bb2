#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sgw {

// Bad command-line arguments; main prints usage and exits 1.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct RegisterOptions {
  std::string                file;
  std::optional<std::string> mime_type;
  std::optional<std::string> file_name;
};

// Arguments following "--register": <file> [--mime <type>] [--name <name>].
// Throws UsageError on a missing file, an unknown flag or a flag without a value.
RegisterOptions parse_register_args(const std::vector<std::string>& args);

} // namespace sgw
