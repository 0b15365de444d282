#include "cli/registry.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Outcome {
  int status;
  std::string out;
  std::string err;
};

// Run the dispatcher as `gitling <args...>` with stdout and stderr captured.
static Outcome run_cli(std::vector<std::string> args) {
  args.insert(args.begin(), "gitling");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  std::ostringstream out;
  std::ostringstream err;
  auto *old_out = std::cout.rdbuf(out.rdbuf());
  auto *old_err = std::cerr.rdbuf(err.rdbuf());
  const int status = gitling::cli::run(static_cast<int>(args.size()), argv.data());
  std::cout.rdbuf(old_out);
  std::cerr.rdbuf(old_err);
  return {status, out.str(), err.str()};
}

static bool inside_any_repo(const fs::path &dir) {
  for (fs::path p = fs::weakly_canonical(dir); !p.empty(); p = p.parent_path()) {
    if (fs::exists(p / ".git")) {
      return true;
    }
    if (p == p.parent_path()) {
      break;
    }
  }
  return false;
}

int main() {
  const auto tag = std::to_string(std::random_device{}());
  const fs::path root = fs::temp_directory_path() / ("gitling_cli_" + tag);
  const fs::path outside = fs::temp_directory_path() / ("gitling_cli_plain_" + tag);
  const std::string hello_id = "ce013625030ba8dba906f756967f9e9ca394464a";

  auto cleanup = [&] {
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::remove_all(outside, ec);
  };

  // ---- dispatcher-level usage errors
  if (run_cli({}).status != gitling::cli::kExitUsage ||
      run_cli({"frobnicate"}).status != gitling::cli::kExitUsage) {
    std::cerr << "missing or unknown command not a usage error\n";
    return 1;
  }

  // ---- init, then commands discover the repository from GITLING_WORKDIR
  const auto init = run_cli({"init", root.string()});
  if (init.status != 0 || !fs::is_directory(root / ".git" / "objects")) {
    std::cerr << "init failed: " << init.err << "\n";
    cleanup();
    return 1;
  }
  if (run_cli({"init", root.string()}).status != gitling::cli::kExitFailure) {
    std::cerr << "second init over the same worktree succeeded\n";
    cleanup();
    return 1;
  }

  fs::create_directories(root / "sub" / "dir");
  ::setenv("GITLING_WORKDIR", (root / "sub" / "dir").c_str(), 1);

  const fs::path input = root / "hello.txt";
  std::ofstream(input, std::ios::binary) << "hello\n";
  const auto hashed = run_cli({"hash-object", "-w", input.string()});
  if (hashed.status != 0 || hashed.out != hello_id + "\n" ||
      !fs::exists(root / ".git" / "objects" / "ce" / hello_id.substr(2))) {
    std::cerr << "hash-object -w: status " << hashed.status << " out '" << hashed.out << "' err '"
              << hashed.err << "'\n";
    cleanup();
    return 1;
  }

  const auto cat = run_cli({"cat-file", "blob", hello_id});
  if (cat.status != 0 || cat.out != "hello\n") {
    std::cerr << "cat-file blob: '" << cat.out << "' " << cat.err << "\n";
    cleanup();
    return 1;
  }

  // Library errors reach stderr once, tagged with the command and the code name.
  const auto wrong_kind = run_cli({"cat-file", "tree", hello_id});
  if (wrong_kind.status != gitling::cli::kExitFailure ||
      !wrong_kind.err.starts_with("cat-file: unexpected-type: ")) {
    std::cerr << "cat-file kind mismatch reported as '" << wrong_kind.err << "'\n";
    cleanup();
    return 1;
  }

  const auto short_args = run_cli({"cat-file", "blob"});
  if (short_args.status != gitling::cli::kExitUsage ||
      short_args.err != "usage: gitling cat-file <type> <object>\n") {
    std::cerr << "cat-file usage reported as '" << short_args.err << "'\n";
    cleanup();
    return 1;
  }

  // A broken metadata root between the start directory and the repository is skipped.
  fs::create_directories(root / "sub" / ".git");
  std::ofstream(root / "sub" / ".git" / "config") << "[core]\n\trepositoryformatversion = 1\n";
  const auto refs = run_cli({"show-ref"});
  if (refs.status != 0 || !refs.out.empty()) {
    std::cerr << "show-ref under a broken nested repository: " << refs.err << "\n";
    cleanup();
    return 1;
  }

  // ---- outside any repository only the dry-run hash works
  fs::create_directories(outside);
  if (!inside_any_repo(outside)) {
    ::setenv("GITLING_WORKDIR", outside.c_str(), 1);
    const auto no_repo = run_cli({"show-ref"});
    if (no_repo.status != gitling::cli::kExitFailure ||
        !no_repo.err.starts_with("show-ref: not-a-repository: ")) {
      std::cerr << "show-ref outside a repository reported as '" << no_repo.err << "'\n";
      cleanup();
      return 1;
    }
    const auto dry = run_cli({"hash-object", input.string()});
    if (dry.status != 0 || dry.out != hello_id + "\n") {
      std::cerr << "dry-run hash-object outside a repository: " << dry.err << "\n";
      cleanup();
      return 1;
    }
    if (run_cli({"hash-object", "-w", input.string()}).status != gitling::cli::kExitFailure) {
      std::cerr << "hash-object -w succeeded outside a repository\n";
      cleanup();
      return 1;
    }
  }

  std::cout << "cli OK\n";
  cleanup();
  return 0;
}
