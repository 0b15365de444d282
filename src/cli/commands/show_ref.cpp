#include "cli/registry.hpp"
#include "gitling/consts.hpp"
#include "gitling/refs.hpp"

#include <iostream>

namespace gitling::cli {

int cmd_show_ref(const Invocation &inv) {
  if (!inv.args.empty()) {
    return usage_error(inv);
  }
  for (const auto &ref : list_refs(inv.repository(), consts::kRefsDir)) {
    std::cout << ref.id << " " << ref.path << "\n";
  }
  return 0;
}

} // namespace gitling::cli
