#pragma once
#include <filesystem>
#include <string_view>

namespace gitling {

class ObjectStore; // fwd
class Repository;  // fwd
struct Tree;       // fwd

namespace worktree {

// Create `target` if missing. Throws NotADirectory if it is not a directory
// and NotEmpty if it already has entries.
void prepare_checkout_target(const std::filesystem::path &target);

// Write every leaf of `tree` under `target`: subtrees become directories,
// blobs become files holding the blob bytes verbatim.
void materialize_tree(const ObjectStore &store, const Tree &tree,
                      const std::filesystem::path &target);

// Resolve `name` to a tree (following a commit), prepare `target` and
// materialize the tree into it.
void checkout(const Repository &repo, std::string_view name, const std::filesystem::path &target);

} // namespace worktree

} // namespace gitling
