#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gitling {

struct TreeLeaf {
  std::string mode; // 5 or 6 ASCII octal digits, e.g. "100644" or "40000"
  std::string path; // single path component
  std::string id;   // 40-hex id of the referenced object

  bool operator==(const TreeLeaf &) const = default;
};

// Binary tree payload: repeated `mode SP path NUL id[20]`.
// Leaves keep the order they were parsed or supplied in.
std::vector<TreeLeaf> parse_tree(std::span<const std::uint8_t> raw);
std::vector<std::uint8_t> serialize_tree(const std::vector<TreeLeaf> &leaves);

} // namespace gitling
