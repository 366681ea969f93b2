#include "rag_core/pipeline/run_context.hpp"

#include <utility>

#include "rag_core/errors.hpp"

namespace rag_core {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
  state_->cancelled.store(true);
}

bool CancellationToken::is_cancelled() const {
  for (const State *state = state_.get(); state != nullptr; state = state->parent.get()) {
    if (state->cancelled.load()) {
      return true;
    }
  }
  return false;
}

CancellationToken CancellationToken::make_child() const {
  CancellationToken child;
  child.state_->parent = state_;
  return child;
}

RunContext::RunContext(CancellationToken token, std::optional<Clock::time_point> deadline)
    : token_(std::move(token)), deadline_(deadline) {}

RunContext RunContext::with_timeout(Clock::duration timeout) {
  return RunContext(CancellationToken(), Clock::now() + timeout);
}

bool RunContext::should_stop() const {
  if (token_.is_cancelled()) {
    return true;
  }
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

void RunContext::throw_if_cancelled() const {
  if (token_.is_cancelled()) {
    throw CancelledError("Invocation was cancelled");
  }
  if (deadline_.has_value() && Clock::now() >= *deadline_) {
    throw CancelledError("Invocation deadline exceeded");
  }
}

RunContext RunContext::make_child() const {
  return RunContext(token_.make_child(), deadline_);
}

}  // namespace rag_core
