#pragma once

#include "taskq/core/error.hpp"
#include "taskq/task/task.hpp"
#include "taskq/util/time.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskq {

enum class TaskFilter {
  Queued,  // pending, scheduled, retry and active
  Failed,
};

struct QueueCounts {
  std::int64_t pending{0};
  std::int64_t scheduled{0};
  std::int64_t retry{0};
  std::int64_t active{0};
  std::int64_t failed{0};
  std::int64_t completed{0};
  // Lifetime counters, not affected by deletes or purges.
  std::int64_t processed{0};
  std::int64_t failed_total{0};
};

// Durable task storage. Every mutation is one atomic store operation; the
// conditional ones (retry, fail, requeue_failed, delete_failed) only apply
// when the task is in the expected state.
class QueueStore {
public:
  virtual ~QueueStore() = default;

  [[nodiscard]] virtual auto enqueue(const Task& task) -> Result<void> = 0;

  // Claims the oldest ready task (process_at <= now) of `queue` and marks it
  // Active with a lease ending at `lease_until`.
  [[nodiscard]] virtual auto dequeue(std::string_view queue, TimePoint now,
                                     TimePoint lease_until)
      -> Result<std::optional<Task>> = 0;

  [[nodiscard]] virtual auto extend_lease(const Task& task,
                                          TimePoint lease_until)
      -> Result<void> = 0;

  // Active -> Completed. A zero retention removes the task immediately.
  [[nodiscard]] virtual auto complete(const Task& task, TimePoint now,
                                      std::chrono::milliseconds retention)
      -> Result<void> = 0;

  // Active -> Retry with the task's retry_count, last_error and process_at.
  [[nodiscard]] virtual auto retry(const Task& task) -> Result<void> = 0;

  // Active -> Failed with the task's last_error and last_failed_at.
  [[nodiscard]] virtual auto fail(const Task& task) -> Result<void> = 0;

  // Failed -> Pending with retry_count reset. TaskNotFound otherwise.
  [[nodiscard]] virtual auto requeue_failed(std::string_view queue,
                                            std::string_view id, TimePoint now)
      -> Result<Task> = 0;

  [[nodiscard]] virtual auto delete_failed(std::string_view queue,
                                           std::string_view id)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto find(std::string_view queue, std::string_view id)
      -> Result<std::optional<Task>> = 0;

  // Ordered by process_at then enqueue order (Queued) or by last_failed_at
  // newest first (Failed).
  [[nodiscard]] virtual auto list(std::string_view queue, TaskFilter filter,
                                  std::size_t offset, std::size_t limit)
      -> Result<std::vector<Task>> = 0;

  [[nodiscard]] virtual auto counts(std::string_view queue, TimePoint now)
      -> Result<QueueCounts> = 0;

  // Active tasks whose lease expired go to Retry with retry_count + 1, or to
  // Failed when the retry budget is spent. Returns the recovered tasks in
  // their new state.
  [[nodiscard]] virtual auto recover_expired(TimePoint now)
      -> Result<std::vector<Task>> = 0;

  // Drops completed tasks whose retention has passed; returns the count.
  [[nodiscard]] virtual auto purge_completed(TimePoint now)
      -> Result<std::size_t> = 0;
};

// TTL-keyed storage for idempotency records.
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  // Returns false when a live entry already holds the key.
  [[nodiscard]] virtual auto set_if_absent(std::string_view key,
                                           const Bytes& value,
                                           std::chrono::milliseconds ttl)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto set(std::string_view key, const Bytes& value,
                                 std::chrono::milliseconds ttl)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get(std::string_view key)
      -> Result<std::optional<Bytes>> = 0;
  [[nodiscard]] virtual auto erase(std::string_view key) -> Result<void> = 0;
  // Erases only when the stored value equals `expected`.
  [[nodiscard]] virtual auto erase_if(std::string_view key,
                                      const Bytes& expected)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto purge_expired() -> Result<std::size_t> = 0;
};

}  // namespace taskq
