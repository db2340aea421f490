#pragma once

#include "taskq/task/task.hpp"

#include <chrono>

namespace taskq {

struct RetryOptions {
  std::chrono::milliseconds base_delay{1'000};
  std::chrono::milliseconds max_delay{600'000};
  // Up to this fraction of the delay is added at random.
  double jitter{0.2};
};

struct RetryDecision {
  enum class Action { Retry, Fail };

  Action action{Action::Fail};
  int next_retry_count{0};
  std::chrono::milliseconds delay{0};

  [[nodiscard]] auto retry() const noexcept -> bool {
    return action == Action::Retry;
  }
};

class RetryPolicy {
public:
  explicit RetryPolicy(RetryOptions options = {});

  // min(max_delay, base_delay * 2^retry_count) plus jitter, never above
  // max_delay.
  [[nodiscard]] auto backoff(int retry_count) const
      -> std::chrono::milliseconds;

  // Retry while retry_count < max_retry and the error allows it.
  [[nodiscard]] auto decide(const Task& task, const TaskError& error) const
      -> RetryDecision;

  [[nodiscard]] auto options() const noexcept -> const RetryOptions& {
    return options_;
  }

private:
  RetryOptions options_;
};

}  // namespace taskq
