#include "cli/registry.hpp"
#include "gitling/worktree.hpp"

#include <filesystem>

namespace gitling::cli {

int cmd_checkout(const Invocation &inv) {
  if (inv.args.size() != 2) {
    return usage_error(inv);
  }
  worktree::checkout(inv.repository(), inv.args[0], std::filesystem::absolute(inv.args[1]));
  return 0;
}

} // namespace gitling::cli
