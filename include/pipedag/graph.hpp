#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace pipedag {

using EdgeList = std::vector<std::pair<std::string, std::string>>;

enum class Traversal { Iterative, Recursive };

// Recursion depth is bounded by the node count. Above this many distinct
// nodes a Recursive request runs the iterative traversal instead.
constexpr std::size_t kRecursionLimit = 10000;

struct DagCheck {
  bool acyclic = true;
  // edges whose source and target are both known nodes
  std::size_t resolved_edges = 0;
};

// Colours every node white/gray/black and stops at the first edge that
// reaches a gray node. Edges touching unknown ids are ignored; duplicate ids
// collapse to one node. Never throws.
DagCheck check_dag(const std::vector<std::string> &nodes, const EdgeList &edges,
                   Traversal mode = Traversal::Iterative);

bool is_acyclic(const std::vector<std::string> &nodes, const EdgeList &edges,
                Traversal mode = Traversal::Iterative);

const char *traversal_name(Traversal mode);

} // namespace pipedag
