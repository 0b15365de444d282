#include "cli/registry.hpp"
#include "gitling/error.hpp"
#include "gitling/find.hpp"
#include "gitling/object_store.hpp"

#include <iostream>
#include <string>

namespace gitling::cli {

int cmd_cat_file(const Invocation &inv) {
  if (inv.args.size() != 2) {
    return usage_error(inv);
  }
  const auto kind = parse_kind(inv.args[0]);
  if (!kind) {
    std::cerr << "cat-file: unknown object type " << inv.args[0] << "\n";
    return kExitUsage;
  }
  const Repository &repo = inv.repository();
  const ObjectStore store{repo};
  const std::string id = find_object(repo, inv.args[1], kind);
  const auto obj = store.read(id);
  if (object_kind(obj) != *kind) {
    throw Error(ErrorCode::UnexpectedType, id + " is a " +
                                               std::string(kind_name(object_kind(obj))) +
                                               ", not a " + inv.args[0]);
  }
  const auto bytes = serialize_object(obj);
  std::cout.write(reinterpret_cast<const char *>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
  std::cout.flush();
  return 0;
}

} // namespace gitling::cli
