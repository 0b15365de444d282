#include "gitling/find.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/object_store.hpp"
#include "gitling/refs.hpp"
#include "gitling/repo.hpp"
#include "gitling/util.hpp"

#include <array>
#include <filesystem>
#include <string>

namespace gitling {

namespace {

[[nodiscard]] auto resolve_name(const Repository &repo, std::string_view name) -> std::string {
  if (name == consts::kHeadFile) {
    return resolve_ref(repo, consts::kHeadFile);
  }
  if (looks_hex40(name)) {
    return strutil::to_lower(name);
  }

  const std::array<std::string, 3> candidates{
      std::string(consts::kHeadsDir) + "/" + std::string(name),
      std::string(consts::kTagsDir) + "/" + std::string(name),
      std::string(name),
  };
  for (const auto &c : candidates) {
    const auto p = repo.path(c);
    if (fs::exists(p) && !std::filesystem::is_directory(p)) {
      return resolve_ref(repo, c);
    }
  }
  throw Error(ErrorCode::NotFound, "no such object or ref: " + std::string(name));
}

} // namespace

std::string find_object(const Repository &repo, std::string_view name,
                        std::optional<ObjectKind> kind, bool follow) {
  std::string id = resolve_name(repo, name);
  if (!kind || *kind != ObjectKind::Tree || !follow) {
    return id;
  }

  const ObjectStore store{repo};
  const Object obj = store.read(id);
  if (const auto *commit = std::get_if<Commit>(&obj)) {
    auto tree = commit->tree();
    if (!tree) {
      throw Error(ErrorCode::UnexpectedType, "commit " + id + " has no tree");
    }
    return *tree;
  }
  return id;
}

} // namespace gitling
