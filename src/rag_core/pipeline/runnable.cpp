#include "rag_core/pipeline/runnable.hpp"

namespace rag_core {

Value Runnable::invoke(const Value &input, const RunContext &context) const {
  context.throw_if_cancelled();
  return run(input, context);
}

PipelineGraph Runnable::graph() const {
  PipelineGraph graph;
  graph.add_node(label(), NodeKind::Stage, input_shape(), output_shape());
  return graph;
}

}  // namespace rag_core
