#include "gitling/object_store.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/hash.hpp"
#include "gitling/repo.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <string>

namespace gfs = gitling::fs;

namespace gitling {

std::vector<std::uint8_t> frame_object(ObjectKind kind, std::span<const std::uint8_t> payload) {
  std::string hdr(kind_name(kind));
  hdr.push_back(consts::kSpace);
  hdr.append(std::to_string(payload.size()));
  hdr.push_back(consts::kNul);

  std::vector<std::uint8_t> framed;
  framed.reserve(hdr.size() + payload.size());
  framed.insert(framed.end(), hdr.begin(), hdr.end());
  framed.insert(framed.end(), payload.begin(), payload.end());
  return framed;
}

std::string compute_object_id(ObjectKind kind, std::span<const std::uint8_t> payload) {
  return to_hex(sha1(frame_object(kind, payload)));
}

ObjectStore::ObjectStore(const Repository &repo) : gitdir_(repo.git_dir()) {}

auto ObjectStore::relative_path(std::string_view hex_id) -> std::string {
  raw_oid id{};
  if (!from_hex(hex_id, id)) {
    throw Error(ErrorCode::InvalidSha, "bad object id: '" + std::string(hex_id) + "'");
  }
  const std::string hex = to_hex(id);
  return std::string(consts::kObjectsDir) + "/" + hex.substr(0, consts::kFanoutDirHexLen) + "/" +
         hex.substr(consts::kFanoutDirHexLen);
}

Object ObjectStore::read(std::string_view hex_id) const {
  const auto path = gitdir_ / relative_path(hex_id);
  if (!gfs::exists(path)) {
    throw Error(ErrorCode::NotFound, "object not found: " + std::string(hex_id));
  }
  const auto store = gfs::z_decompress(gfs::read_file(path));

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw Error(ErrorCode::UnknownType, "object " + std::string(hex_id) + ": no type header");
  }
  const std::string type(store.begin(), it_space);
  const auto kind = parse_kind(type);
  if (!kind) {
    throw Error(ErrorCode::UnknownType,
                "unknown type tag=" + type + " sha=" + std::string(hex_id));
  }

  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw Error(ErrorCode::MalformedLength,
                "malformed object: no length terminator sha=" + std::string(hex_id));
  }
  const std::string size_str(it_space + 1, it_nul);
  std::size_t declared = 0;
  const auto [ptr, ec] =
      std::from_chars(size_str.data(), size_str.data() + size_str.size(), declared);
  const auto actual = static_cast<std::size_t>(store.end() - (it_nul + 1));
  if (size_str.empty() || ec != std::errc{} || ptr != size_str.data() + size_str.size() ||
      declared != actual) {
    throw Error(ErrorCode::MalformedLength,
                "malformed object: bad length " + size_str + " (payload is " +
                    std::to_string(actual) + " bytes) sha=" + std::string(hex_id));
  }

  const auto payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  return make_object(*kind, std::span<const std::uint8_t>(store).subspan(payload_off));
}

std::string ObjectStore::write(ObjectKind kind, std::span<const std::uint8_t> payload,
                               bool persist) const {
  const auto framed = frame_object(kind, payload);
  std::string hex = to_hex(sha1(framed));
  if (!persist) {
    return hex;
  }

  const auto path = gitdir_ / relative_path(hex);
  std::error_code ec;
  if (std::filesystem::exists(path.parent_path(), ec) &&
      !std::filesystem::is_directory(path.parent_path(), ec)) {
    throw Error(ErrorCode::NotADirectory, "not a directory: " + path.parent_path().string());
  }
  // The object only appears under its id once the rename lands, so a failed
  // write leaves nothing at that path. An existing file holds the same bytes
  // and is simply replaced.
  gfs::write_file_atomic(path, gfs::z_compress(framed));
  return hex;
}

std::string ObjectStore::write(const Object &obj, bool persist) const {
  return write(object_kind(obj), serialize_object(obj), persist);
}

std::string hash_object(const std::filesystem::path &file, ObjectKind kind,
                        const Repository *repo) {
  const auto bytes = gfs::read_file(file);
  const Object obj = make_object(kind, bytes);
  if (repo == nullptr) {
    return compute_object_id(kind, serialize_object(obj));
  }
  return ObjectStore{*repo}.write(obj, true);
}

} // namespace gitling
