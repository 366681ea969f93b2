#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/pipeline/pipeline_graph.hpp"
#include "rag_core/pipeline/run_context.hpp"

namespace rag_core {

// The dynamic value flowing between stages. A Bundle is a JSON object.
using Value = nlohmann::json;

/**
 * @class Runnable
 * @brief A composable unit mapping an input Value to an output Value.
 *
 * Runnables are immutable once built and keep no per-call state, so one instance may be
 * invoked from several threads at once. Call-scoped data travels in the values and in the
 * RunContext.
 */
class Runnable {
 public:
  virtual ~Runnable() = default;

  /**
   * @brief Runs the stage.
   *
   * Checks the context for cancellation first and throws CancelledError if it fired.
   * Errors raised by the stage propagate unmodified.
   */
  Value invoke(const Value &input, const RunContext &context = RunContext()) const;

  virtual std::string label() const = 0;
  virtual std::string input_shape() const { return "Any"; }
  virtual std::string output_shape() const { return "Any"; }

  // A single node by default; combinators splice their children's graphs together.
  virtual PipelineGraph graph() const;

 protected:
  virtual Value run(const Value &input, const RunContext &context) const = 0;
};

using RunnablePtr = std::shared_ptr<const Runnable>;

}  // namespace rag_core
