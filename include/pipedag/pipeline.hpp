#pragma once
#include <pipedag/graph.hpp>

#include <json/json.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipedag {

// Editor node. Only `id` takes part in validation; the rest is passed
// through untouched.
struct Node {
  std::string id;
  std::optional<std::string> type;
  std::optional<std::map<std::string, double>> position;
  Json::Value data;
};

struct Edge {
  std::optional<std::string> id;
  std::string source;
  std::string target;
  std::optional<std::string> source_handle;
  std::optional<std::string> target_handle;
};

struct PipelineRequest {
  std::vector<Node> nodes;
  std::vector<Edge> edges;
};

struct PipelineSummary {
  std::size_t num_nodes = 0;
  std::size_t num_edges = 0;
  std::size_t num_edges_resolved = 0;
  bool is_dag = true;
};

struct ParseError {
  enum class Kind { Syntax, Schema };
  Kind kind = Kind::Syntax;
  std::string loc;
  std::string message;
  // machine-readable reason for Schema errors: missing, string_type, ...
  std::string type;

  std::string str() const;
};

std::optional<PipelineRequest> parse_pipeline(const std::string &body,
                                              ParseError *err);

std::vector<std::string> node_ids(const PipelineRequest &p);
EdgeList edge_pairs(const PipelineRequest &p);

PipelineSummary summarize(const PipelineRequest &p,
                          Traversal mode = Traversal::Iterative);

std::string summary_to_json(const PipelineSummary &s);

// {"detail":[{"type":..,"loc":["body","nodes",0,"id"],"msg":..}]}
std::string validation_error_json(const ParseError &err);

} // namespace pipedag
