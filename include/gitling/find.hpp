#pragma once
#include "gitling/object.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace gitling {

class Repository; // fwd

// Turn a user-supplied name (HEAD, a 40-hex id, a branch, a tag or a ref
// path) into an object id. With `follow` and `kind == Tree`, a commit is
// replaced by its tree.
std::string find_object(const Repository &repo, std::string_view name,
                        std::optional<ObjectKind> kind = std::nullopt, bool follow = true);

} // namespace gitling
