#pragma once

#include "taskq/broker/store.hpp"
#include "taskq/broker/weighted_scheduler.hpp"
#include "taskq/core/error.hpp"
#include "taskq/task/task.hpp"
#include "taskq/util/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace taskq {

struct BrokerOptions {
  std::vector<QueueWeight> queues;
  // Upper bound on how long dequeue sleeps before re-checking the store.
  std::chrono::milliseconds poll_interval{1'000};
  std::chrono::milliseconds lease{60'000};
  int default_max_retry{25};
  std::chrono::milliseconds completed_retention{0};
};

// Named, weighted queues over a QueueStore. Queue names are fixed at
// construction; each state transition is a single store operation.
class Broker {
public:
  Broker(QueueStore& store, BrokerOptions options);

  Broker(const Broker&) = delete;
  Broker& operator=(const Broker&) = delete;

  [[nodiscard]] auto enqueue(std::string_view queue, NewTask task,
                             const EnqueueOptions& options = {})
      -> Result<TaskId>;

  // Blocks until a task is ready or `token` is cancelled.
  [[nodiscard]] auto dequeue(const CancellationToken& token) -> Result<Task>;
  [[nodiscard]] auto try_dequeue() -> Result<std::optional<Task>>;

  [[nodiscard]] auto complete(const Task& task) -> Result<void>;
  // `task` carries the incremented retry_count; the task becomes ready again
  // after `delay`.
  [[nodiscard]] auto retry(Task task, std::chrono::milliseconds delay,
                           std::string_view error) -> Result<void>;
  [[nodiscard]] auto fail(Task task, std::string_view error) -> Result<void>;
  [[nodiscard]] auto extend_lease(const Task& task) -> Result<void>;

  [[nodiscard]] auto has_queue(std::string_view name) const -> bool;
  [[nodiscard]] auto queues() const noexcept -> const std::vector<QueueWeight>& {
    return options_.queues;
  }
  [[nodiscard]] auto options() const noexcept -> const BrokerOptions& {
    return options_;
  }
  [[nodiscard]] auto store() noexcept -> QueueStore& {
    return store_;
  }
  [[nodiscard]] auto scheduler() noexcept -> WeightedScheduler& {
    return scheduler_;
  }

  // Wakes every blocked dequeue so it re-checks the store and its token.
  auto notify_all() -> void;

private:
  QueueStore& store_;
  BrokerOptions options_;
  WeightedScheduler scheduler_;

  std::mutex wait_mu_;
  std::condition_variable wait_cv_;
  std::uint64_t generation_{0};
};

}  // namespace taskq
