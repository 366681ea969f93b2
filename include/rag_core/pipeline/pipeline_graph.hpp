#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rag_core {

enum class NodeKind {
  Stage,
  // Synthetic fan-out and merge markers around a ParallelJoin
  JoinInput,
  JoinOutput
};

std::string to_string(NodeKind kind);

struct GraphNode {
  size_t id;
  std::string label;
  NodeKind kind;
  std::string input_shape;
  std::string output_shape;
};

struct GraphEdge {
  size_t source;
  size_t target;

  bool operator==(const GraphEdge &other) const = default;
};

/**
 * @class PipelineGraph
 * @brief Nodes and data-dependency edges of a composed pipeline, for diagnostics only.
 *
 * Node ids are positions in nodes(). Every edge points from a lower id to a higher one,
 * which keeps the graph acyclic: composition only ever appends already-built graphs.
 */
class PipelineGraph {
 public:
  size_t add_node(const std::string &label, NodeKind kind, const std::string &input_shape = "",
                  const std::string &output_shape = "");

  // Throws std::invalid_argument unless source < target and both exist
  void add_edge(size_t source, size_t target);

  // Appends a copy of `other`; returns the offset added to its node ids.
  size_t absorb(const PipelineGraph &other);

  // Nodes without incoming / outgoing edges, ascending by id
  std::vector<size_t> sources() const;
  std::vector<size_t> sinks() const;

  const std::vector<GraphNode> &nodes() const { return nodes_; }
  const std::vector<GraphEdge> &edges() const { return edges_; }

  // Layered box-and-arrow rendering followed by an edge list
  std::string to_ascii() const;
  nlohmann::json to_json() const;

 private:
  std::vector<GraphNode> nodes_;
  std::vector<GraphEdge> edges_;

  std::vector<size_t> layers() const;
};

}  // namespace rag_core
