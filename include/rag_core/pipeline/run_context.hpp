#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace rag_core {

/**
 * @class CancellationToken
 * @brief Shared, cooperative cancellation flag.
 *
 * Copies share state. A child token reports cancellation when it or any of its ancestors
 * has been cancelled; cancelling a child leaves its parent untouched.
 */
class CancellationToken {
 public:
  CancellationToken();

  void cancel();
  bool is_cancelled() const;

  CancellationToken make_child() const;

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<const State> parent;
  };
  std::shared_ptr<State> state_;
};

/**
 * @class RunContext
 * @brief Call-scoped data threaded through one invoke: cancellation and an optional deadline.
 */
class RunContext {
 public:
  using Clock = std::chrono::steady_clock;

  RunContext() = default;
  explicit RunContext(CancellationToken token, std::optional<Clock::time_point> deadline = {});

  static RunContext with_timeout(Clock::duration timeout);

  const CancellationToken &token() const { return token_; }
  const std::optional<Clock::time_point> &deadline() const { return deadline_; }

  bool should_stop() const;
  // Throws CancelledError if cancelled or past the deadline
  void throw_if_cancelled() const;

  // Same deadline, child token
  RunContext make_child() const;

 private:
  CancellationToken token_;
  std::optional<Clock::time_point> deadline_;
};

}  // namespace rag_core
