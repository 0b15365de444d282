#include "gitling/worktree.hpp"

#include "gitling/error.hpp"
#include "gitling/find.hpp"
#include "gitling/object.hpp"
#include "gitling/object_store.hpp"
#include "gitling/repo.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace gitling::worktree {

namespace {

struct Pending {
  Tree tree;
  stdfs::path dir;
  std::size_t next = 0;
};

// A leaf names exactly one entry inside its parent directory.
void check_leaf_path(const TreeLeaf &leaf) {
  if (leaf.path.empty() || leaf.path == "." || leaf.path == ".." ||
      leaf.path.find('/') != std::string::npos) {
    throw Error(ErrorCode::InvalidLeaf, "refusing to check out leaf path '" + leaf.path + "'");
  }
}

void write_blob(const stdfs::path &dest, const Blob &blob) {
  std::ofstream ofs(dest, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw Error(ErrorCode::Io, "open for write failed: " + dest.string());
  }
  ofs.write(reinterpret_cast<const char *>(blob.data.data()),
            static_cast<std::streamsize>(blob.data.size()));
  if (!ofs) {
    throw Error(ErrorCode::Io, "write failed: " + dest.string());
  }
}

} // namespace

void prepare_checkout_target(const stdfs::path &target) {
  std::error_code ec;
  const auto st = stdfs::status(target, ec);
  if (!stdfs::exists(st)) {
    stdfs::create_directories(target, ec);
    if (ec) {
      throw Error(ErrorCode::Io, "mkdir -p failed: " + target.string() + ": " + ec.message());
    }
    return;
  }
  if (!stdfs::is_directory(st)) {
    throw Error(ErrorCode::NotADirectory, "not a directory: " + target.string());
  }
  if (!stdfs::is_empty(target, ec) || ec) {
    throw Error(ErrorCode::NotEmpty, "not empty: " + target.string());
  }
}

void materialize_tree(const ObjectStore &store, const Tree &tree, const stdfs::path &target) {
  std::vector<Pending> stack;
  stack.push_back(Pending{.tree = tree, .dir = target});

  while (!stack.empty()) {
    Pending &top = stack.back();
    if (top.next == top.tree.leaves.size()) {
      stack.pop_back();
      continue;
    }
    const TreeLeaf leaf = top.tree.leaves[top.next++];
    check_leaf_path(leaf);
    const stdfs::path dest = top.dir / leaf.path;

    Object obj = store.read(leaf.id);
    if (auto *sub = std::get_if<Tree>(&obj)) {
      std::error_code ec;
      stdfs::create_directory(dest, ec);
      if (ec) {
        throw Error(ErrorCode::Io, "mkdir failed: " + dest.string() + ": " + ec.message());
      }
      stack.push_back(Pending{.tree = std::move(*sub), .dir = dest});
    } else if (const auto *blob = std::get_if<Blob>(&obj)) {
      write_blob(dest, *blob);
    } else {
      throw Error(ErrorCode::UnexpectedType, "cannot check out " +
                                                 std::string(kind_name(object_kind(obj))) +
                                                 " leaf '" + leaf.path + "'");
    }
  }
}

void checkout(const Repository &repo, std::string_view name, const stdfs::path &target) {
  const ObjectStore store{repo};
  const std::string tree_id = find_object(repo, name, ObjectKind::Tree, true);
  const auto tree = object_as<Tree>(store.read(tree_id), "checkout " + std::string(name));
  prepare_checkout_target(target);
  materialize_tree(store, tree, target);
}

} // namespace gitling::worktree
