#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace gitling::fs {

bool exists(const std::filesystem::path &p);

// Whole-file read; NotFound if the file is absent, Io on other failures.
std::vector<std::uint8_t> read_file(const std::filesystem::path &p);

// Replace `p` with `data` via a sibling temp file and rename.
void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data);
void write_file_atomic(const std::filesystem::path &p, std::string_view text);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

} // namespace gitling::fs
