#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "rag_core/pipeline/runnable.hpp"

namespace rag_core {

// Returns its input unchanged.
class Identity : public Runnable {
 public:
  std::string label() const override { return "Passthrough"; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;
};

// Wraps a plain function. The function must not keep per-call state of its own.
class Lambda : public Runnable {
 public:
  using Function = std::function<Value(const Value &)>;

  Lambda(std::string label, Function function, std::string input_shape = "Any",
         std::string output_shape = "Any");

  std::string label() const override { return label_; }
  std::string input_shape() const override { return input_shape_; }
  std::string output_shape() const override { return output_shape_; }

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::string label_;
  Function function_;
  std::string input_shape_;
  std::string output_shape_;
};

/**
 * @class SequentialPipe
 * @brief Threads each step's output into the next step's input.
 *
 * Nested pipes are flattened on construction, so pipe(pipe(a, b), c) and
 * pipe(a, pipe(b, c)) hold the same three steps. A failing step short-circuits the rest.
 */
class SequentialPipe : public Runnable {
 public:
  // Throws std::invalid_argument on fewer than two steps or a null step
  explicit SequentialPipe(std::vector<RunnablePtr> steps);

  const std::vector<RunnablePtr> &steps() const { return steps_; }

  std::string label() const override;
  std::string input_shape() const override;
  std::string output_shape() const override;
  PipelineGraph graph() const override;

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::vector<RunnablePtr> steps_;
};

enum class JoinMode {
  // One thread per branch, results collected once every branch has finished
  Concurrent,
  // Branches run one after another on the calling thread, in declaration order
  Sequential
};

/**
 * @class ParallelJoin
 * @brief Feeds the same input to every branch and merges the outputs into a Bundle.
 *
 * The Bundle is a JSON object keyed by branch name, so its content never depends on the
 * order in which branches complete.
 *
 * When a branch fails in Concurrent mode the remaining branches are signalled through a
 * child cancellation token and are always joined before the join itself fails; the first
 * failure observed is rethrown. Sequential mode stops at the first failing branch.
 */
class ParallelJoin : public Runnable {
 public:
  using Branch = std::pair<std::string, RunnablePtr>;

  // Throws std::invalid_argument on no branches, duplicate names or a null branch
  explicit ParallelJoin(std::vector<Branch> branches, JoinMode mode = JoinMode::Concurrent);

  const std::vector<Branch> &branches() const { return branches_; }
  JoinMode mode() const { return mode_; }

  std::string label() const override;
  std::string input_shape() const override;
  std::string output_shape() const override;
  PipelineGraph graph() const override;

 protected:
  Value run(const Value &input, const RunContext &context) const override;

 private:
  std::vector<Branch> branches_;
  JoinMode mode_;

  Value run_sequential(const Value &input, const RunContext &context) const;
  Value run_concurrent(const Value &input, const RunContext &context) const;
  std::string branch_names() const;
};

RunnablePtr make_identity();
RunnablePtr make_lambda(const std::string &label, Lambda::Function function,
                        const std::string &input_shape = "Any",
                        const std::string &output_shape = "Any");
RunnablePtr pipe(RunnablePtr first, RunnablePtr second);
RunnablePtr pipe(std::initializer_list<RunnablePtr> steps);
RunnablePtr parallel(std::vector<ParallelJoin::Branch> branches,
                     JoinMode mode = JoinMode::Concurrent);

}  // namespace rag_core
