#pragma once
#include "gitling/config.hpp"
#include "gitling/consts.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string_view>

namespace gitling {

class Repository {
public:
  // Open the repository whose worktree is `worktree`. Unless `force`, the
  // metadata root must be a directory and its config must carry format
  // version 0.
  static Repository open(const std::filesystem::path &worktree, bool force = false);

  // Lay out a fresh repository under `worktree` (created if missing).
  static Repository create(const std::filesystem::path &worktree);

  // Walk from `start` toward the filesystem root and open the first level
  // that holds a valid repository. Levels without a metadata root, or whose
  // config fails validation, are passed over. Throws NotARepository when
  // `required` and none is found, returns std::nullopt otherwise.
  static std::optional<Repository> find(const std::filesystem::path &start,
                                        bool required = true);

  [[nodiscard]] const std::filesystem::path &worktree() const { return worktree_; }
  [[nodiscard]] const std::filesystem::path &git_dir() const { return gitdir_; }
  [[nodiscard]] const Config &config() const { return config_; }

  // Metadata-root-relative path -> absolute path. No I/O.
  [[nodiscard]] auto path(std::string_view relative) const -> std::filesystem::path;

  // Make sure every segment of `relative` is a directory. Missing segments are
  // created when `create` is set and otherwise tolerated; a segment that
  // exists as a non-directory throws NotADirectory.
  auto ensure_directories(std::string_view relative, bool create) const
      -> std::filesystem::path;

  // Create `relative` and return it opened for read/write. Returns
  // std::nullopt when the file already exists so the caller can open it in
  // whatever mode it needs. Throws NotAFile if `relative` is a directory.
  auto open_or_create_file(std::string_view relative, bool create) const
      -> std::optional<std::fstream>;

private:
  Repository(std::filesystem::path worktree, Config config);

  std::filesystem::path worktree_;
  std::filesystem::path gitdir_;
  Config config_;
};

} // namespace gitling
