#pragma once
#include "gitling/object.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitling {

class Repository; // fwd decl to avoid header cycle

// Canonical frame: "<kind> <len>\0<payload>".
std::vector<std::uint8_t> frame_object(ObjectKind kind, std::span<const std::uint8_t> payload);

// 40-hex id of a payload framed as `kind`, without touching any repository.
std::string compute_object_id(ObjectKind kind, std::span<const std::uint8_t> payload);

// Loose objects under <gitdir>/objects/aa/bbbb...
// Holds the metadata root by value, so it may outlive the Repository it came from.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir) : gitdir_(std::move(gitdir)) {}
  explicit ObjectStore(const Repository &repo);

  // Read, inflate and decode the object named by a 40-hex id.
  [[nodiscard]] Object read(std::string_view hex_id) const;

  // Frame and hash `payload`; persist it when `persist` is set. Returns the id.
  std::string write(ObjectKind kind, std::span<const std::uint8_t> payload,
                    bool persist = true) const;
  std::string write(const Object &obj, bool persist = true) const;

  // "objects/aa/bbbb..." relative to the metadata root.
  [[nodiscard]] static auto relative_path(std::string_view hex_id) -> std::string;

  [[nodiscard]] const std::filesystem::path &git_dir() const { return gitdir_; }

private:
  std::filesystem::path gitdir_;
};

// Hash the contents of `file` as an object of `kind`. When `repo` is non-null
// the object is also persisted there.
std::string hash_object(const std::filesystem::path &file, ObjectKind kind,
                        const Repository *repo);

} // namespace gitling
