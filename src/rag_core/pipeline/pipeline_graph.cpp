#include "rag_core/pipeline/pipeline_graph.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rag_core {

namespace {

constexpr size_t BOX_GAP = 2;

std::string box_border(size_t width) {
  return "+" + std::string(width - 2, '-') + "+";
}

// Row with `mark` at each column, spaces elsewhere
std::string marker_row(const std::vector<size_t> &columns, char mark) {
  if (columns.empty()) {
    return "";
  }
  std::string row(*std::max_element(columns.begin(), columns.end()) + 1, ' ');
  for (size_t column : columns) {
    row[column] = mark;
  }
  return row;
}

}  // namespace

std::string to_string(NodeKind kind) {
  switch (kind) {
    case NodeKind::Stage:
      return "stage";
    case NodeKind::JoinInput:
      return "join_input";
    case NodeKind::JoinOutput:
      return "join_output";
  }
  return "unknown";
}

size_t PipelineGraph::add_node(const std::string &label, NodeKind kind,
                               const std::string &input_shape, const std::string &output_shape) {
  const size_t id = nodes_.size();
  nodes_.push_back({.id = id,
                    .label = label,
                    .kind = kind,
                    .input_shape = input_shape,
                    .output_shape = output_shape});
  return id;
}

void PipelineGraph::add_edge(size_t source, size_t target) {
  if (source >= nodes_.size() || target >= nodes_.size()) {
    throw std::invalid_argument("Edge refers to an unknown node");
  }
  if (source >= target) {
    throw std::invalid_argument("Edges must point from an earlier node to a later one");
  }
  const GraphEdge edge{.source = source, .target = target};
  if (std::find(edges_.begin(), edges_.end(), edge) == edges_.end()) {
    edges_.push_back(edge);
  }
}

size_t PipelineGraph::absorb(const PipelineGraph &other) {
  const size_t offset = nodes_.size();
  for (const auto &node : other.nodes_) {
    GraphNode copy = node;
    copy.id += offset;
    nodes_.push_back(std::move(copy));
  }
  for (const auto &edge : other.edges_) {
    edges_.push_back({.source = edge.source + offset, .target = edge.target + offset});
  }
  return offset;
}

std::vector<size_t> PipelineGraph::sources() const {
  std::vector<bool> has_incoming(nodes_.size(), false);
  for (const auto &edge : edges_) {
    has_incoming[edge.target] = true;
  }
  std::vector<size_t> result;
  for (size_t i = 0; i < nodes_.size(); ++i) {
    if (!has_incoming[i]) {
      result.push_back(i);
    }
  }
  return result;
}

std::vector<size_t> PipelineGraph::sinks() const {
  std::vector<bool> has_outgoing(nodes_.size(), false);
  for (const auto &edge : edges_) {
    has_outgoing[edge.source] = true;
  }
  std::vector<size_t> result;
  for (size_t i = 0; i < nodes_.size(); ++i) {
    if (!has_outgoing[i]) {
      result.push_back(i);
    }
  }
  return result;
}

// Longest distance from any source. Edges ascend by id, so one pass in id order suffices.
std::vector<size_t> PipelineGraph::layers() const {
  std::vector<size_t> depth(nodes_.size(), 0);
  for (size_t i = 0; i < nodes_.size(); ++i) {
    for (const auto &edge : edges_) {
      if (edge.target == i) {
        depth[i] = std::max(depth[i], depth[edge.source] + 1);
      }
    }
  }
  return depth;
}

std::string PipelineGraph::to_ascii() const {
  if (nodes_.empty()) {
    return "(empty graph)\n";
  }

  const std::vector<size_t> depth = layers();
  const size_t layer_count = *std::max_element(depth.begin(), depth.end()) + 1;
  std::vector<std::vector<size_t>> rows(layer_count);
  for (size_t i = 0; i < nodes_.size(); ++i) {
    rows[depth[i]].push_back(i);
  }

  std::vector<bool> has_outgoing(nodes_.size(), false);
  for (const auto &edge : edges_) {
    has_outgoing[edge.source] = true;
  }

  std::ostringstream out;
  for (size_t layer = 0; layer < layer_count; ++layer) {
    std::string border;
    std::string body;
    std::vector<size_t> centers;
    std::vector<size_t> outgoing_centers;
    for (size_t node_id : rows[layer]) {
      const std::string &label = nodes_[node_id].label;
      const size_t width = label.size() + 4;
      if (!border.empty()) {
        border += std::string(BOX_GAP, ' ');
        body += std::string(BOX_GAP, ' ');
      }
      const size_t center = border.size() + width / 2;
      centers.push_back(center);
      if (has_outgoing[node_id]) {
        outgoing_centers.push_back(center);
      }
      border += box_border(width);
      body += "| " + label + " |";
    }

    if (layer > 0) {
      out << marker_row(centers, 'v') << "\n";
    }
    out << border << "\n" << body << "\n" << border << "\n";
    if (!outgoing_centers.empty()) {
      out << marker_row(outgoing_centers, '|') << "\n";
    }
  }

  if (!edges_.empty()) {
    out << "\nEdges:\n";
    for (const auto &edge : edges_) {
      out << "  [" << edge.source << "] " << nodes_[edge.source].label << " -> [" << edge.target
          << "] " << nodes_[edge.target].label << "\n";
    }
  }
  return out.str();
}

nlohmann::json PipelineGraph::to_json() const {
  nlohmann::json nodes = nlohmann::json::array();
  for (const auto &node : nodes_) {
    nodes.push_back({{"id", node.id},
                     {"label", node.label},
                     {"kind", to_string(node.kind)},
                     {"input", node.input_shape},
                     {"output", node.output_shape}});
  }
  nlohmann::json edges = nlohmann::json::array();
  for (const auto &edge : edges_) {
    edges.push_back({{"source", edge.source}, {"target", edge.target}});
  }
  return {{"nodes", nodes}, {"edges", edges}};
}

}  // namespace rag_core
