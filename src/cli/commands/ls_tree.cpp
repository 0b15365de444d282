#include "cli/registry.hpp"
#include "gitling/consts.hpp"
#include "gitling/find.hpp"
#include "gitling/object_store.hpp"

#include <iostream>
#include <string>

namespace gitling::cli {

int cmd_ls_tree(const Invocation &inv) {
  if (inv.args.size() != 1) {
    return usage_error(inv);
  }
  const Repository &repo = inv.repository();
  const ObjectStore store{repo};
  const std::string id = find_object(repo, inv.args[0], ObjectKind::Tree);
  const auto tree = object_as<Tree>(store.read(id), "ls-tree");
  for (const auto &leaf : tree.leaves) {
    const auto kind = object_kind(store.read(leaf.id));
    const std::string pad(consts::kModeMaxLen - leaf.mode.size(), '0');
    std::cout << pad << leaf.mode << ' ' << kind_name(kind) << ' ' << leaf.id << '\t'
              << leaf.path << "\n";
  }
  return 0;
}

} // namespace gitling::cli
