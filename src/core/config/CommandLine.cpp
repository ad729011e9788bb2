#include "CommandLine.hpp"

namespace sgw {

RegisterOptions parse_register_args(const std::vector<std::string>& args) {
  if (args.empty() || args[0].empty()) throw UsageError("--register needs a file");

  RegisterOptions opts;
  opts.file = args[0];
  for (size_t i = 1; i < args.size(); i += 2) {
    const std::string& flag = args[i];
    if (flag != "--mime" && flag != "--name") throw UsageError("unknown option " + flag);
    if (i + 1 >= args.size() || args[i + 1].empty()) throw UsageError(flag + " needs a value");

    if (flag == "--mime") opts.mime_type = args[i + 1];
    else opts.file_name = args[i + 1];
  }
  return opts;
}

} // namespace sgw
