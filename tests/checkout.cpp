#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/object_store.hpp"
#include "gitling/refs.hpp"
#include "gitling/repo.hpp"
#include "gitling/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using gitling::ErrorCode;
using gitling::ObjectKind;

template <typename F> static bool fails_with(F &&f, ErrorCode code) {
  try {
    f();
  } catch (const gitling::Error &e) {
    return e.code() == code;
  }
  return false;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitling_checkout_" + std::to_string(std::random_device{}()));

  try {
    const auto repo = gitling::Repository::create(root);
    const gitling::ObjectStore store{repo};

    const std::string binary("\x00\x01\xff\n", 4);
    const std::string a_id = store.write(ObjectKind::Blob, gitling::fs::as_bytes("A\n"));
    const std::string b_id = store.write(ObjectKind::Blob, gitling::fs::as_bytes("B\n"));
    const std::string bin_id = store.write(ObjectKind::Blob, gitling::fs::as_bytes(binary));

    gitling::Tree inner;
    inner.leaves.push_back({"100644", "b.txt", b_id});
    inner.leaves.push_back({"100644", "bin.dat", bin_id});
    const std::string inner_id = store.write(gitling::Object{inner});

    // Leaves after the subtree must still be written.
    gitling::Tree top;
    top.leaves.push_back({"40000", "dir", inner_id});
    top.leaves.push_back({"100644", "a.txt", a_id});
    const std::string top_id = store.write(gitling::Object{top});

    gitling::Commit commit;
    commit.kvlm.add("tree", top_id);
    commit.kvlm.add("author", "T <t@e> 1714412345 +0000");
    commit.kvlm.set_message("checkout fixture\n");
    const std::string commit_id = store.write(gitling::Object{commit});
    gitling::update_ref(repo, "refs/heads/master", commit_id);

    // ---- checkout by branch name into a directory that does not exist yet
    const fs::path out = root / "out";
    gitling::worktree::checkout(repo, "master", out);
    if (slurp(out / "a.txt") != "A\n" || slurp(out / "dir" / "b.txt") != "B\n" ||
        slurp(out / "dir" / "bin.dat") != binary) {
      std::cerr << "materialized contents mismatch\n";
      return 1;
    }

    // ---- a populated target is refused
    if (!fails_with([&] { gitling::worktree::checkout(repo, commit_id, out); },
                    ErrorCode::NotEmpty)) {
      std::cerr << "checkout into non-empty directory not refused\n";
      return 1;
    }
    if (!fails_with([&] { gitling::worktree::checkout(repo, "HEAD", out / "a.txt"); },
                    ErrorCode::NotADirectory)) {
      std::cerr << "checkout onto a file not refused\n";
      return 1;
    }

    // ---- a tree id checks out directly into an existing empty directory
    const fs::path sub_out = root / "sub_out";
    fs::create_directories(sub_out);
    gitling::worktree::checkout(repo, inner_id, sub_out);
    if (slurp(sub_out / "b.txt") != "B\n") {
      std::cerr << "tree checkout mismatch\n";
      return 1;
    }

    // ---- a blob is not something to check out
    if (!fails_with([&] { gitling::worktree::checkout(repo, a_id, root / "blob_out"); },
                    ErrorCode::UnexpectedType)) {
      std::cerr << "blob checkout not refused\n";
      return 1;
    }

    // ---- leaf paths cannot escape the target
    gitling::Tree evil;
    evil.leaves.push_back({"100644", "..", a_id});
    const std::string evil_id = store.write(gitling::Object{evil});
    if (!fails_with([&] { gitling::worktree::checkout(repo, evil_id, root / "evil_out"); },
                    ErrorCode::InvalidLeaf)) {
      std::cerr << "escaping leaf path accepted\n";
      return 1;
    }

    std::cout << "checkout OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
