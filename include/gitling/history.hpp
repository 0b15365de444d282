#pragma once
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gitling {

class ObjectStore; // fwd

struct CommitEdge {
  std::string child;
  std::string parent;

  bool operator==(const CommitEdge &) const = default;
};

// Depth-first walk of the parent graph from `start`. Every commit is expanded
// once: ids already in `visited` are skipped, newly expanded ids are added.
// An edge is appended for each parent of each expanded commit, in header
// order, before descending into that parent.
void walk_ancestry(const ObjectStore &store, std::string_view start,
                   std::set<std::string> &visited, std::vector<CommitEdge> &edges);

std::vector<CommitEdge> ancestry_edges(const ObjectStore &store, std::string_view start);

// Graphviz rendering used by `gitling log`.
void write_graphviz(std::ostream &out, const std::vector<CommitEdge> &edges);

} // namespace gitling
