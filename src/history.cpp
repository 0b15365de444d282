#include "gitling/history.hpp"

#include "gitling/object.hpp"
#include "gitling/object_store.hpp"

#include <utility>

namespace gitling {

namespace {

struct Frame {
  std::string id;
  std::vector<std::string> parents;
  std::size_t next = 0;
};

} // namespace

void walk_ancestry(const ObjectStore &store, std::string_view start,
                   std::set<std::string> &visited, std::vector<CommitEdge> &edges) {
  std::vector<Frame> stack;

  const auto expand = [&](std::string id) {
    if (!visited.insert(id).second) {
      return;
    }
    const auto commit = object_as<Commit>(store.read(id), "commit " + id);
    stack.push_back(Frame{.id = std::move(id), .parents = commit.parents()});
  };

  expand(std::string(start));
  while (!stack.empty()) {
    Frame &top = stack.back();
    if (top.next == top.parents.size()) {
      stack.pop_back();
      continue;
    }
    std::string parent = top.parents[top.next++];
    edges.push_back(CommitEdge{.child = top.id, .parent = parent});
    expand(std::move(parent)); // may grow `stack`; `top` is dead past here
  }
}

std::vector<CommitEdge> ancestry_edges(const ObjectStore &store, std::string_view start) {
  std::set<std::string> visited;
  std::vector<CommitEdge> edges;
  walk_ancestry(store, start, visited, edges);
  return edges;
}

void write_graphviz(std::ostream &out, const std::vector<CommitEdge> &edges) {
  out << "digraph gitlinglog{\n";
  for (const auto &e : edges) {
    out << "c_" << e.child << " -> c_" << e.parent << "\n";
  }
  out << "}\n";
}

} // namespace gitling
