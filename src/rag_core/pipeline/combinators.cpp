#include "rag_core/pipeline/combinators.hpp"

#include <exception>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>

namespace rag_core {

Value Identity::run(const Value &input, const RunContext & /*context*/) const {
  return input;
}

Lambda::Lambda(std::string label, Function function, std::string input_shape,
               std::string output_shape)
    : label_(std::move(label)),
      function_(std::move(function)),
      input_shape_(std::move(input_shape)),
      output_shape_(std::move(output_shape)) {
  if (!function_) {
    throw std::invalid_argument("Lambda '" + label_ + "' has no function");
  }
}

Value Lambda::run(const Value &input, const RunContext & /*context*/) const {
  return function_(input);
}

SequentialPipe::SequentialPipe(std::vector<RunnablePtr> steps) {
  for (auto &step : steps) {
    if (!step) {
      throw std::invalid_argument("SequentialPipe step cannot be null");
    }
    // Flatten nested pipes so grouping does not change the structure
    if (auto nested = std::dynamic_pointer_cast<const SequentialPipe>(step)) {
      steps_.insert(steps_.end(), nested->steps_.begin(), nested->steps_.end());
    } else {
      steps_.push_back(std::move(step));
    }
  }
  if (steps_.size() < 2) {
    throw std::invalid_argument("SequentialPipe needs at least two steps");
  }
}

std::string SequentialPipe::label() const {
  std::string label;
  for (const auto &step : steps_) {
    if (!label.empty()) {
      label += " | ";
    }
    label += step->label();
  }
  return label;
}

std::string SequentialPipe::input_shape() const {
  return steps_.front()->input_shape();
}

std::string SequentialPipe::output_shape() const {
  return steps_.back()->output_shape();
}

PipelineGraph SequentialPipe::graph() const {
  PipelineGraph graph = steps_.front()->graph();
  for (size_t i = 1; i < steps_.size(); ++i) {
    const std::vector<size_t> previous_sinks = graph.sinks();
    const PipelineGraph next = steps_[i]->graph();
    const std::vector<size_t> next_sources = next.sources();
    const size_t offset = graph.absorb(next);
    for (size_t sink : previous_sinks) {
      for (size_t source : next_sources) {
        graph.add_edge(sink, source + offset);
      }
    }
  }
  return graph;
}

Value SequentialPipe::run(const Value &input, const RunContext &context) const {
  Value current = steps_.front()->invoke(input, context);
  for (size_t i = 1; i < steps_.size(); ++i) {
    current = steps_[i]->invoke(current, context);
  }
  return current;
}

ParallelJoin::ParallelJoin(std::vector<Branch> branches, JoinMode mode)
    : branches_(std::move(branches)), mode_(mode) {
  if (branches_.empty()) {
    throw std::invalid_argument("ParallelJoin needs at least one branch");
  }
  std::set<std::string> names;
  for (const auto &[name, runnable] : branches_) {
    if (!runnable) {
      throw std::invalid_argument("ParallelJoin branch '" + name + "' cannot be null");
    }
    if (!names.insert(name).second) {
      throw std::invalid_argument("Duplicate ParallelJoin branch name: " + name);
    }
  }
}

std::string ParallelJoin::branch_names() const {
  std::string names;
  for (const auto &branch : branches_) {
    if (!names.empty()) {
      names += ",";
    }
    names += branch.first;
  }
  return names;
}

std::string ParallelJoin::label() const {
  return "Parallel<" + branch_names() + ">";
}

std::string ParallelJoin::input_shape() const {
  const std::string first = branches_.front().second->input_shape();
  for (const auto &branch : branches_) {
    if (branch.second->input_shape() != first) {
      return "Any";
    }
  }
  return first;
}

std::string ParallelJoin::output_shape() const {
  return "Bundle{" + branch_names() + "}";
}

PipelineGraph ParallelJoin::graph() const {
  PipelineGraph graph;
  const size_t input_node =
      graph.add_node(label() + "Input", NodeKind::JoinInput, input_shape(), input_shape());

  std::vector<size_t> branch_sinks;
  for (const auto &branch : branches_) {
    const PipelineGraph branch_graph = branch.second->graph();
    const std::vector<size_t> sources = branch_graph.sources();
    const std::vector<size_t> sinks = branch_graph.sinks();
    const size_t offset = graph.absorb(branch_graph);
    for (size_t source : sources) {
      graph.add_edge(input_node, source + offset);
    }
    for (size_t sink : sinks) {
      branch_sinks.push_back(sink + offset);
    }
  }

  const size_t output_node =
      graph.add_node(label() + "Output", NodeKind::JoinOutput, output_shape(), output_shape());
  for (size_t sink : branch_sinks) {
    graph.add_edge(sink, output_node);
  }
  return graph;
}

Value ParallelJoin::run(const Value &input, const RunContext &context) const {
  if (mode_ == JoinMode::Sequential || branches_.size() == 1) {
    return run_sequential(input, context);
  }
  return run_concurrent(input, context);
}

Value ParallelJoin::run_sequential(const Value &input, const RunContext &context) const {
  Value bundle = Value::object();
  for (const auto &[name, runnable] : branches_) {
    bundle[name] = runnable->invoke(input, context);
  }
  return bundle;
}

Value ParallelJoin::run_concurrent(const Value &input, const RunContext &context) const {
  const RunContext branch_context = context.make_child();
  std::mutex failure_mutex;
  std::exception_ptr first_failure;

  std::vector<std::future<Value>> futures;
  futures.reserve(branches_.size());
  for (const auto &branch : branches_) {
    const RunnablePtr runnable = branch.second;
    futures.push_back(std::async(std::launch::async, [&, runnable]() {
      try {
        return runnable->invoke(input, branch_context);
      } catch (...) {
        {
          std::lock_guard<std::mutex> lock(failure_mutex);
          if (!first_failure) {
            first_failure = std::current_exception();
          }
        }
        CancellationToken siblings = branch_context.token();
        siblings.cancel();
        throw;
      }
    }));
  }

  // Every branch is joined before anything is reported, even after a failure
  for (auto &future : futures) {
    future.wait();
  }
  if (first_failure) {
    std::rethrow_exception(first_failure);
  }

  Value bundle = Value::object();
  for (size_t i = 0; i < branches_.size(); ++i) {
    bundle[branches_[i].first] = futures[i].get();
  }
  return bundle;
}

RunnablePtr make_identity() {
  return std::make_shared<const Identity>();
}

RunnablePtr make_lambda(const std::string &label, Lambda::Function function,
                        const std::string &input_shape, const std::string &output_shape) {
  return std::make_shared<const Lambda>(label, std::move(function), input_shape, output_shape);
}

RunnablePtr pipe(RunnablePtr first, RunnablePtr second) {
  return std::make_shared<const SequentialPipe>(
      std::vector<RunnablePtr>{std::move(first), std::move(second)});
}

RunnablePtr pipe(std::initializer_list<RunnablePtr> steps) {
  return std::make_shared<const SequentialPipe>(std::vector<RunnablePtr>(steps));
}

RunnablePtr parallel(std::vector<ParallelJoin::Branch> branches, JoinMode mode) {
  return std::make_shared<const ParallelJoin>(std::move(branches), mode);
}

}  // namespace rag_core
