#include "cli/registry.hpp"
#include "gitling/find.hpp"
#include "gitling/history.hpp"
#include "gitling/object_store.hpp"

#include <iostream>
#include <string>

namespace gitling::cli {

int cmd_log(const Invocation &inv) {
  if (inv.args.size() != 1) {
    return usage_error(inv);
  }
  const Repository &repo = inv.repository();
  const ObjectStore store{repo};
  const std::string start = find_object(repo, inv.args[0], ObjectKind::Commit);
  write_graphviz(std::cout, ancestry_edges(store, start));
  return 0;
}

} // namespace gitling::cli
