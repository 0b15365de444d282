#include "cli/registry.hpp"
#include "gitling/object_store.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace gitling::cli {

int cmd_hash_object(const Invocation &inv) {
  bool write = false;
  std::string type = "blob";
  std::string file;
  for (std::size_t i = 0; i < inv.args.size(); ++i) {
    const std::string &arg = inv.args[i];
    if (arg == "-w") {
      write = true;
    } else if (arg == "-t" && i + 1 < inv.args.size()) {
      type = inv.args[++i];
    } else if (file.empty()) {
      file = arg;
    } else {
      return usage_error(inv);
    }
  }
  if (file.empty()) {
    return usage_error(inv);
  }
  const auto kind = parse_kind(type);
  if (!kind) {
    std::cerr << "hash-object: unknown object type " << type << "\n";
    return kExitUsage;
  }

  // Only -w needs a repository; a dry run works anywhere.
  const Repository *repo = write ? &inv.repository() : nullptr;
  std::cout << hash_object(std::filesystem::absolute(file), *kind, repo) << "\n";
  return 0;
}

} // namespace gitling::cli
