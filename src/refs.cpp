#include "gitling/refs.hpp"

#include "gitling/consts.hpp"
#include "gitling/error.hpp"
#include "gitling/fs.hpp"
#include "gitling/repo.hpp"
#include "gitling/util.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace gitling {

std::string resolve_ref(const Repository &repo, std::string_view ref_path) {
  std::set<std::string> followed;
  std::string cur(ref_path);
  for (;;) {
    if (!followed.insert(cur).second) {
      throw Error(ErrorCode::RefCycle, "symbolic ref cycle through " + cur);
    }
    const auto p = repo.path(cur);
    if (!fs::exists(p)) {
      throw Error(ErrorCode::NotFound, "ref not found: " + cur);
    }
    const auto bytes = fs::read_file(p);
    std::string s(bytes.begin(), bytes.end());
    strutil::rstrip_newlines(s);
    if (!s.starts_with(consts::kRefPrefix)) {
      return s;
    }
    cur = s.substr(consts::kRefPrefix.size());
  }
}

static void list_refs_impl(const Repository &repo, const std::string &rel, std::vector<Ref> &out) {
  std::vector<std::filesystem::directory_entry> entries;
  std::error_code ec;
  for (const auto &e : std::filesystem::directory_iterator(repo.path(rel), ec)) {
    entries.push_back(e);
  }
  if (ec) {
    throw Error(ErrorCode::Io, "cannot list " + repo.path(rel).string() + ": " + ec.message());
  }
  std::ranges::sort(entries, [](const auto &a, const auto &b) {
    return a.path().filename().string() < b.path().filename().string();
  });

  for (const auto &e : entries) {
    const std::string child = rel + "/" + e.path().filename().string();
    if (e.is_directory()) {
      list_refs_impl(repo, child, out);
    } else {
      out.push_back(Ref{.id = resolve_ref(repo, child), .path = child});
    }
  }
}

std::vector<Ref> list_refs(const Repository &repo, std::string_view subtree) {
  std::string rel(subtree);
  while (!rel.empty() && rel.back() == '/') {
    rel.pop_back();
  }
  if (!std::filesystem::is_directory(repo.path(rel))) {
    throw Error(ErrorCode::NotFound, "no ref directory: " + rel);
  }
  std::vector<Ref> out;
  list_refs_impl(repo, rel, out);
  return out;
}

void update_ref(const Repository &repo, std::string_view ref_path, std::string_view hex_id) {
  fs::write_file_atomic(repo.path(ref_path), std::string(hex_id) + "\n");
}

void set_symbolic_ref(const Repository &repo, std::string_view ref_path,
                      std::string_view target) {
  fs::write_file_atomic(repo.path(ref_path),
                        std::string(consts::kRefPrefix) + std::string(target) + "\n");
}

} // namespace gitling
