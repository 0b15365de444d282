#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/object_store.hpp"
#include "gitling/repo.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <sys/resource.h>
#include <vector>

namespace fs = std::filesystem;
using gitling::ErrorCode;

template <typename F> static bool fails_with(F &&f, ErrorCode code) {
  try {
    f();
  } catch (const gitling::Error &e) {
    return e.code() == code;
  }
  return false;
}

// Store raw framed bytes under `hex` exactly as a loose object would be.
static void plant_object(const gitling::Repository &repo, const std::string &hex,
                         std::string_view framed) {
  const auto compressed = gitling::fs::z_compress(gitling::fs::as_bytes(framed));
  gitling::fs::write_file_atomic(repo.path(gitling::ObjectStore::relative_path(hex)), compressed);
}

// Caps the size of any file this process writes until destroyed.
struct FileSizeCap {
  explicit FileSizeCap(rlim_t bytes) {
    ::getrlimit(RLIMIT_FSIZE, &saved);
    prev = std::signal(SIGXFSZ, SIG_IGN);
    rlimit cap = saved;
    cap.rlim_cur = std::min<rlim_t>(bytes, saved.rlim_max);
    ::setrlimit(RLIMIT_FSIZE, &cap);
  }
  ~FileSizeCap() {
    ::setrlimit(RLIMIT_FSIZE, &saved);
    std::signal(SIGXFSZ, prev);
  }
  FileSizeCap(const FileSizeCap &) = delete;
  FileSizeCap &operator=(const FileSizeCap &) = delete;

  rlimit saved{};
  void (*prev)(int) = SIG_DFL;
};

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitling_objects_" + std::to_string(std::random_device{}()));

  try {
    const auto repo = gitling::Repository::create(root);
    const gitling::ObjectStore store{repo};

    // ---- hello blob: known id, dry run leaves no file
    const std::string hello = "hello\n";
    const std::string expected = "ce013625030ba8dba906f756967f9e9ca394464a";
    const std::string dry = store.write(gitling::ObjectKind::Blob, gitling::fs::as_bytes(hello), false);
    if (dry != expected) {
      std::cerr << "hello blob id mismatch: " << dry << "\n";
      return 1;
    }
    const fs::path obj_path = root / ".git" / "objects" / "ce" / expected.substr(2);
    if (fs::exists(obj_path)) {
      std::cerr << "dry run wrote an object file\n";
      return 1;
    }
    if (gitling::compute_object_id(gitling::ObjectKind::Blob, gitling::fs::as_bytes(hello)) != dry) {
      std::cerr << "compute_object_id disagrees with dry-run write\n";
      return 1;
    }

    // ---- persisted: the file sits at the id-derived path and inflates to the frame
    const std::string persisted = store.write(gitling::Object{gitling::Blob{{hello.begin(), hello.end()}}});
    if (persisted != expected || !fs::exists(obj_path)) {
      std::cerr << "persisted blob missing at " << obj_path << "\n";
      return 1;
    }
    const auto inflated = gitling::fs::z_decompress(gitling::fs::read_file(obj_path));
    if (std::string(inflated.begin(), inflated.end()) != std::string("blob 6\0hello\n", 13)) {
      std::cerr << "inflated frame mismatch\n";
      return 1;
    }

    // Writing the same object again is harmless and yields the same id.
    if (store.write(gitling::ObjectKind::Blob, gitling::fs::as_bytes(hello)) != expected) {
      std::cerr << "rewrite changed the id\n";
      return 1;
    }

    const auto back = gitling::object_as<gitling::Blob>(store.read(expected), "test");
    if (std::string(back.data.begin(), back.data.end()) != hello) {
      std::cerr << "blob read-back mismatch\n";
      return 1;
    }

    // ---- different content, different id
    const std::string other = "hello!\n";
    if (store.write(gitling::ObjectKind::Blob, gitling::fs::as_bytes(other), false) == expected) {
      std::cerr << "distinct payloads share an id\n";
      return 1;
    }

    // ---- length field must match the payload exactly
    const std::string short_id = "1111111111111111111111111111111111111111";
    plant_object(repo, short_id, std::string("blob 5\0hello\n", 13));
    if (!fails_with([&] { (void)store.read(short_id); }, ErrorCode::MalformedLength)) {
      std::cerr << "short length not rejected\n";
      return 1;
    }
    const std::string long_id = "2222222222222222222222222222222222222222";
    plant_object(repo, long_id, std::string("blob 60\0hello\n", 14));
    if (!fails_with([&] { (void)store.read(long_id); }, ErrorCode::MalformedLength)) {
      std::cerr << "long length not rejected\n";
      return 1;
    }
    const std::string nonnum_id = "3333333333333333333333333333333333333333";
    plant_object(repo, nonnum_id, std::string("blob x\0hello\n", 13));
    if (!fails_with([&] { (void)store.read(nonnum_id); }, ErrorCode::MalformedLength)) {
      std::cerr << "non-numeric length not rejected\n";
      return 1;
    }

    // ---- kind tag outside the closed set
    const std::string bogus_id = "4444444444444444444444444444444444444444";
    plant_object(repo, bogus_id, std::string("blobby 6\0hello\n", 15));
    if (!fails_with([&] { (void)store.read(bogus_id); }, ErrorCode::UnknownType)) {
      std::cerr << "unknown type not rejected\n";
      return 1;
    }

    // ---- tags are recognized but have no codec
    const std::string tag_id = "5555555555555555555555555555555555555555";
    plant_object(repo, tag_id, std::string("tag 0\0", 6));
    if (!fails_with([&] { (void)store.read(tag_id); }, ErrorCode::UnsupportedType)) {
      std::cerr << "tag object not rejected as unsupported\n";
      return 1;
    }

    // ---- missing and corrupt files
    if (!fails_with([&] { (void)store.read("6666666666666666666666666666666666666666"); },
                    ErrorCode::NotFound)) {
      std::cerr << "missing object not reported as not-found\n";
      return 1;
    }
    const std::string corrupt_id = "7777777777777777777777777777777777777777";
    gitling::fs::write_file_atomic(repo.path(gitling::ObjectStore::relative_path(corrupt_id)),
                                   std::string_view("definitely not zlib"));
    if (!fails_with([&] { (void)store.read(corrupt_id); }, ErrorCode::DecompressionError)) {
      std::cerr << "corrupt stream not reported as decompression error\n";
      return 1;
    }
    if (!fails_with([&] { (void)store.read("not-an-id"); }, ErrorCode::InvalidSha)) {
      std::cerr << "bad id not rejected\n";
      return 1;
    }

    // ---- the store keeps its own copy of the metadata root
    const gitling::ObjectStore detached{gitling::Repository::open(root)};
    if (detached.git_dir() != repo.git_dir() ||
        gitling::object_kind(detached.read(expected)) != gitling::ObjectKind::Blob) {
      std::cerr << "store built from a temporary repository cannot read\n";
      return 1;
    }

    // ---- a write that fails midway leaves nothing under the id
    std::vector<std::uint8_t> big(std::size_t{1} << 20);
    std::mt19937 gen{20240501};
    for (auto &b : big) {
      b = static_cast<std::uint8_t>(gen());
    }
    const std::string big_id = gitling::compute_object_id(gitling::ObjectKind::Blob, big);
    const fs::path big_path = repo.path(gitling::ObjectStore::relative_path(big_id));
    bool write_failed = false;
    {
      const FileSizeCap cap{64 * 1024};
      write_failed =
          fails_with([&] { (void)store.write(gitling::ObjectKind::Blob, big); }, ErrorCode::Io);
    }
    if (!write_failed) {
      std::cerr << "oversized write did not fail under the file size cap\n";
      return 1;
    }
    if (fs::exists(big_path)) {
      std::cerr << "failed write left a file at " << big_path << "\n";
      return 1;
    }
    if (fs::is_directory(big_path.parent_path())) {
      const std::string stem = big_path.filename().string();
      for (const auto &entry : fs::directory_iterator(big_path.parent_path())) {
        if (entry.path().filename().string().starts_with(stem)) {
          std::cerr << "failed write left " << entry.path() << "\n";
          return 1;
        }
      }
    }
    if (store.write(gitling::ObjectKind::Blob, big) != big_id ||
        gitling::object_as<gitling::Blob>(store.read(big_id), "test").data != big) {
      std::cerr << "write after a failed attempt did not round-trip\n";
      return 1;
    }

    // ---- rewriting an object leaves only the object file behind
    (void)store.write(gitling::ObjectKind::Blob, gitling::fs::as_bytes(hello));
    for (const auto &entry : fs::directory_iterator(obj_path.parent_path())) {
      if (entry.path() != obj_path) {
        std::cerr << "stray file next to an object: " << entry.path() << "\n";
        return 1;
      }
    }

    // ---- hash_object from a file, with and without a repository
    const fs::path input = root / "input.txt";
    std::ofstream(input, std::ios::binary) << hello;
    if (gitling::hash_object(input, gitling::ObjectKind::Blob, nullptr) != expected ||
        gitling::hash_object(input, gitling::ObjectKind::Blob, &repo) != expected) {
      std::cerr << "hash_object id mismatch\n";
      return 1;
    }
    if (!fails_with([&] { (void)gitling::hash_object(input, gitling::ObjectKind::Tag, nullptr); },
                    ErrorCode::UnsupportedType)) {
      std::cerr << "hash_object accepted a tag\n";
      return 1;
    }

    std::cout << "object store OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
