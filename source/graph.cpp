#include <pipedag/graph.hpp>

#include <cstdint>
#include <unordered_map>

namespace pipedag {

namespace {

enum class Color : std::uint8_t { White, Gray, Black };

using Adjacency = std::vector<std::vector<std::size_t>>;

struct Frame {
  std::size_t node;
  std::size_t next;
};

bool has_cycle_iterative(const Adjacency &adj) {
  std::vector<Color> color(adj.size(), Color::White);
  std::vector<Frame> stack;

  for (std::size_t root = 0; root < adj.size(); ++root) {
    if (color[root] != Color::White)
      continue;
    color[root] = Color::Gray;
    stack.push_back({root, 0});

    while (!stack.empty()) {
      Frame &top = stack.back();
      const auto &out = adj[top.node];
      if (top.next == out.size()) {
        color[top.node] = Color::Black;
        stack.pop_back();
        continue;
      }
      std::size_t v = out[top.next++];
      if (color[v] == Color::Gray)
        return true;
      if (color[v] == Color::White) {
        color[v] = Color::Gray;
        stack.push_back({v, 0});
      }
    }
  }
  return false;
}

bool visit(const Adjacency &adj, std::vector<Color> &color, std::size_t u) {
  color[u] = Color::Gray;
  for (std::size_t v : adj[u]) {
    if (color[v] == Color::Gray)
      return true;
    if (color[v] == Color::White && visit(adj, color, v))
      return true;
  }
  color[u] = Color::Black;
  return false;
}

bool has_cycle_recursive(const Adjacency &adj) {
  std::vector<Color> color(adj.size(), Color::White);
  for (std::size_t root = 0; root < adj.size(); ++root) {
    if (color[root] == Color::White && visit(adj, color, root))
      return true;
  }
  return false;
}

} // namespace

DagCheck check_dag(const std::vector<std::string> &nodes, const EdgeList &edges,
                   Traversal mode) {
  DagCheck res;
  if (nodes.empty())
    return res;

  std::unordered_map<std::string, std::size_t> index;
  index.reserve(nodes.size());
  for (const auto &id : nodes)
    index.try_emplace(id, index.size());

  Adjacency adj(index.size());
  for (const auto &[src, dst] : edges) {
    auto s = index.find(src);
    if (s == index.end())
      continue;
    auto d = index.find(dst);
    if (d == index.end())
      continue;
    adj[s->second].push_back(d->second);
    ++res.resolved_edges;
  }

  bool recurse = mode == Traversal::Recursive && adj.size() <= kRecursionLimit;
  bool cyclic = recurse ? has_cycle_recursive(adj) : has_cycle_iterative(adj);
  res.acyclic = !cyclic;
  return res;
}

bool is_acyclic(const std::vector<std::string> &nodes, const EdgeList &edges,
                Traversal mode) {
  return check_dag(nodes, edges, mode).acyclic;
}

const char *traversal_name(Traversal mode) {
  return mode == Traversal::Recursive ? "recursive" : "iterative";
}

} // namespace pipedag
