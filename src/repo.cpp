#include "gitling/repo.hpp"

#include "gitling/config.hpp"
#include "gitling/consts.hpp"
#include "gitling/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

[[nodiscard]] auto trim_slashes(std::string_view path) -> std::string_view {
  while (!path.empty() && path.front() == '/') {
    path.remove_prefix(1);
  }
  while (!path.empty() && path.back() == '/') {
    path.remove_suffix(1);
  }
  return path;
}

void write_fixed_file(const gitling::Repository &repo, std::string_view name,
                      std::string_view content) {
  auto file = repo.open_or_create_file(name, true);
  if (!file) {
    throw gitling::Error(gitling::ErrorCode::AlreadyExists,
                         "file already exists: " + repo.path(name).string());
  }
  file->write(content.data(), static_cast<std::streamsize>(content.size()));
  file->flush();
  if (!*file) {
    throw gitling::Error(gitling::ErrorCode::Io, "write failed: " + repo.path(name).string());
  }
}

} // namespace

namespace gitling {

Repository::Repository(stdfs::path worktree, Config config)
    : worktree_(std::move(worktree)), gitdir_(worktree_ / consts::kGitDir),
      config_(config) {}

Repository Repository::open(const stdfs::path &worktree, bool force) {
  Repository repo{worktree, Config{}};

  std::error_code ec;
  if (!force && !stdfs::is_directory(repo.gitdir_, ec)) {
    throw Error(ErrorCode::NotARepository, "not a git repository: " + worktree.string());
  }

  try {
    repo.config_ = load_config(repo.path(consts::kConfigFile));
  } catch (const Error &) {
    if (!force) {
      throw;
    }
  }

  if (!force && repo.config_.repository_format_version != consts::kSupportedFormatVersion) {
    throw Error(ErrorCode::BadConfig,
                "unsupported repositoryformatversion " +
                    std::to_string(repo.config_.repository_format_version));
  }
  return repo;
}

Repository Repository::create(const stdfs::path &worktree) {
  std::error_code ec;
  if (stdfs::exists(worktree, ec) && !stdfs::is_directory(worktree, ec)) {
    throw Error(ErrorCode::NotADirectory, "not a directory: " + worktree.string());
  }
  stdfs::create_directories(worktree, ec);
  if (ec) {
    throw Error(ErrorCode::Io, "create worktree failed: " + ec.message());
  }

  Repository repo = open(worktree, true);

  repo.ensure_directories("", true);
  repo.ensure_directories(consts::kBranchesDir, true);
  repo.ensure_directories(consts::kObjectsDir, true);
  repo.ensure_directories(consts::kTagsDir, true);
  repo.ensure_directories(consts::kHeadsDir, true);

  const Config defaults{};
  write_fixed_file(repo, consts::kDescriptionFile, consts::kDefaultDescription);
  write_fixed_file(repo, consts::kHeadFile,
                   std::string(consts::kRefPrefix) + "refs/heads/" +
                       std::string(consts::kDefaultBranch) + "\n");
  write_fixed_file(repo, consts::kConfigFile, format_config(defaults));
  repo.config_ = defaults;
  return repo;
}

std::optional<Repository> Repository::find(const stdfs::path &start, bool required) {
  std::error_code ec;
  stdfs::path cur = stdfs::weakly_canonical(stdfs::absolute(start), ec);
  if (ec) {
    cur = stdfs::absolute(start);
  }

  for (;;) {
    if (stdfs::is_directory(cur / consts::kGitDir, ec)) {
      try {
        return open(cur, false);
      } catch (const Error &e) {
        // An unusable level does not hide an enclosing repository.
        if (e.code() != ErrorCode::BadConfig) {
          throw;
        }
      }
    }
    const stdfs::path parent = cur.parent_path();
    if (parent == cur || parent.empty()) {
      break;
    }
    cur = parent;
  }

  if (required) {
    throw Error(ErrorCode::NotARepository,
                "not a git repository (or any parent up to /): " + start.string());
  }
  return std::nullopt;
}

auto Repository::path(std::string_view relative) const -> stdfs::path {
  const std::string_view rel = trim_slashes(relative);
  if (rel.empty()) {
    return gitdir_;
  }
  return gitdir_ / stdfs::path(rel);
}

auto Repository::ensure_directories(std::string_view relative, bool create) const
    -> stdfs::path {
  const std::string_view rel = trim_slashes(relative);

  // The metadata root itself is the first segment.
  std::size_t end = 0;
  for (;;) {
    const stdfs::path p = path(rel.substr(0, end));
    std::error_code ec;
    const auto st = stdfs::status(p, ec);
    if (!stdfs::exists(st)) {
      if (create) {
        stdfs::create_directory(p, ec);
        if (ec) {
          throw Error(ErrorCode::Io, "mkdir failed: " + p.string() + ": " + ec.message());
        }
      }
    } else if (!stdfs::is_directory(st)) {
      throw Error(ErrorCode::NotADirectory, "not a directory: " + p.string());
    }

    if (end >= rel.size()) {
      break;
    }
    const auto slash = rel.find('/', end + 1);
    end = slash == std::string_view::npos ? rel.size() : slash;
  }
  return path(rel);
}

auto Repository::open_or_create_file(std::string_view relative, bool create) const
    -> std::optional<std::fstream> {
  const std::string_view rel = trim_slashes(relative);
  const auto slash = rel.rfind('/');
  ensure_directories(slash == std::string_view::npos ? std::string_view{} : rel.substr(0, slash),
                     create);

  const stdfs::path p = path(rel);
  std::error_code ec;
  const auto st = stdfs::status(p, ec);
  if (stdfs::exists(st)) {
    if (stdfs::is_directory(st)) {
      throw Error(ErrorCode::NotAFile, "is a directory, not a file: " + p.string());
    }
    return std::nullopt;
  }
  if (!create) {
    throw Error(ErrorCode::NotFound, "no such file: " + p.string());
  }

  std::fstream file(p, std::ios::in | std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file) {
    throw Error(ErrorCode::Io, "create failed: " + p.string());
  }
  return std::optional<std::fstream>(std::move(file));
}

} // namespace gitling
