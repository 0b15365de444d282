#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitling {

class Repository; // fwd

struct Ref {
  std::string id;   // 40-hex object id
  std::string path; // e.g. "refs/heads/master"
};

// Follow `ref_path` (relative to the metadata root) through any "ref: "
// indirections down to a literal id. Throws NotFound for a missing ref file
// and RefCycle if the chain revisits a ref.
std::string resolve_ref(const Repository &repo, std::string_view ref_path);

// Every ref file under `subtree`, depth first, entries in name order.
std::vector<Ref> list_refs(const Repository &repo, std::string_view subtree = "refs");

// Overwrite/create a ref with the given 40-hex id (adds trailing newline on disk).
void update_ref(const Repository &repo, std::string_view ref_path, std::string_view hex_id);

// Write "ref: <target>\n".
void set_symbolic_ref(const Repository &repo, std::string_view ref_path, std::string_view target);

} // namespace gitling
