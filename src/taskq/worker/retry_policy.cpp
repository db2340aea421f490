#include "taskq/worker/retry_policy.hpp"

#include <algorithm>
#include <random>

namespace taskq {

namespace {

auto jitter_fraction(double max) -> double {
  if (max <= 0.0) {
    return 0.0;
  }
  thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, max);
  return dist(gen);
}

}  // namespace

RetryPolicy::RetryPolicy(RetryOptions options) : options_(options) {
}

auto RetryPolicy::backoff(int retry_count) const -> std::chrono::milliseconds {
  const auto base = options_.base_delay.count();
  const auto cap = options_.max_delay.count();

  // Shifting past the cap would overflow; clamp the exponent first.
  std::int64_t delay = base;
  for (int i = 0; i < std::max(retry_count, 0) && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, cap);

  auto extra = static_cast<std::int64_t>(static_cast<double>(delay) *
                                         jitter_fraction(options_.jitter));
  return std::chrono::milliseconds(std::min(delay + extra, cap));
}

auto RetryPolicy::decide(const Task& task, const TaskError& error) const
    -> RetryDecision {
  if (error.skip_retry || task.retry_count >= task.max_retry) {
    return {RetryDecision::Action::Fail, task.retry_count,
            std::chrono::milliseconds{0}};
  }
  return {RetryDecision::Action::Retry, task.retry_count + 1,
          backoff(task.retry_count)};
}

}  // namespace taskq
