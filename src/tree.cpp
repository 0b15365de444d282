#include "gitling/tree.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"
#include "gitling/hash.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace gitling {

std::vector<TreeLeaf> parse_tree(std::span<const std::uint8_t> raw) {
  std::vector<TreeLeaf> out;
  auto p = raw.begin();
  const auto end = raw.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    const auto mode_len = static_cast<std::size_t>(q_space - p);
    if (q_space == end || mode_len < consts::kModeMinLen || mode_len > consts::kModeMaxLen) {
      throw Error(ErrorCode::InvalidLeaf,
                  "tree parse: bad mode at offset " + std::to_string(p - raw.begin()));
    }

    TreeLeaf leaf{};
    leaf.mode.assign(p, q_space);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw Error(ErrorCode::InvalidLeaf, "tree parse: path of '" + leaf.mode + "' leaf has no NUL");
    }
    leaf.path.assign(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw Error(ErrorCode::InvalidLeaf, "tree parse: truncated id for '" + leaf.path + "'");
    }
    raw_oid id{};
    std::copy_n(p, consts::kOidRawLen, id.begin());
    leaf.id = to_hex(id);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(leaf));
  }
  return out;
}

std::vector<std::uint8_t> serialize_tree(const std::vector<TreeLeaf> &leaves) {
  std::vector<std::uint8_t> data;
  for (const auto &leaf : leaves) {
    if (leaf.mode.size() < consts::kModeMinLen || leaf.mode.size() > consts::kModeMaxLen ||
        leaf.mode.find(consts::kSpace) != std::string::npos) {
      throw Error(ErrorCode::InvalidLeaf,
                  "tree serialize: bad mode '" + leaf.mode + "' for '" + leaf.path + "'");
    }
    if (leaf.path.find(consts::kNul) != std::string::npos) {
      throw Error(ErrorCode::InvalidLeaf, "tree serialize: NUL in path of '" + leaf.mode + "' leaf");
    }
    raw_oid id{};
    if (!from_hex(leaf.id, id)) {
      throw Error(ErrorCode::InvalidSha,
                  "tree serialize: bad id '" + leaf.id + "' for '" + leaf.path + "'");
    }
    data.insert(data.end(), leaf.mode.begin(), leaf.mode.end());
    data.push_back(static_cast<std::uint8_t>(consts::kSpace));
    data.insert(data.end(), leaf.path.begin(), leaf.path.end());
    data.push_back(static_cast<std::uint8_t>(consts::kNul));
    data.insert(data.end(), id.begin(), id.end());
  }
  return data;
}

} // namespace gitling
