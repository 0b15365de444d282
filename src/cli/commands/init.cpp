#include "cli/registry.hpp"
#include "gitling/repo.hpp"

#include <filesystem>
#include <iostream>

namespace gitling::cli {

int cmd_init(const Invocation &inv) {
  if (inv.args.size() != 1) {
    return usage_error(inv);
  }
  const auto repo = Repository::create(std::filesystem::absolute(inv.args[0]));
  std::cout << "Initialized empty repository in " << repo.git_dir().string() << "\n";
  return 0;
}

} // namespace gitling::cli
