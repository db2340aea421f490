#pragma once

#include "taskq/broker/store.hpp"

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace taskq {

// In-process store for a single worker process and for tests. Each
// operation runs under one mutex.
class MemoryStore final : public QueueStore, public KeyValueStore {
public:
  MemoryStore() = default;
  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  [[nodiscard]] auto enqueue(const Task& task) -> Result<void> override;
  [[nodiscard]] auto dequeue(std::string_view queue, TimePoint now,
                             TimePoint lease_until)
      -> Result<std::optional<Task>> override;
  [[nodiscard]] auto extend_lease(const Task& task, TimePoint lease_until)
      -> Result<void> override;
  [[nodiscard]] auto complete(const Task& task, TimePoint now,
                              std::chrono::milliseconds retention)
      -> Result<void> override;
  [[nodiscard]] auto retry(const Task& task) -> Result<void> override;
  [[nodiscard]] auto fail(const Task& task) -> Result<void> override;
  [[nodiscard]] auto requeue_failed(std::string_view queue,
                                    std::string_view id, TimePoint now)
      -> Result<Task> override;
  [[nodiscard]] auto delete_failed(std::string_view queue, std::string_view id)
      -> Result<void> override;
  [[nodiscard]] auto find(std::string_view queue, std::string_view id)
      -> Result<std::optional<Task>> override;
  [[nodiscard]] auto list(std::string_view queue, TaskFilter filter,
                          std::size_t offset, std::size_t limit)
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto counts(std::string_view queue, TimePoint now)
      -> Result<QueueCounts> override;
  [[nodiscard]] auto recover_expired(TimePoint now)
      -> Result<std::vector<Task>> override;
  [[nodiscard]] auto purge_completed(TimePoint now)
      -> Result<std::size_t> override;

  [[nodiscard]] auto set_if_absent(std::string_view key, const Bytes& value,
                                   std::chrono::milliseconds ttl)
      -> Result<bool> override;
  [[nodiscard]] auto set(std::string_view key, const Bytes& value,
                         std::chrono::milliseconds ttl) -> Result<void> override;
  [[nodiscard]] auto get(std::string_view key)
      -> Result<std::optional<Bytes>> override;
  [[nodiscard]] auto erase(std::string_view key) -> Result<void> override;
  [[nodiscard]] auto erase_if(std::string_view key, const Bytes& expected)
      -> Result<bool> override;
  [[nodiscard]] auto purge_expired() -> Result<std::size_t> override;

private:
  using OrderKey = std::pair<TimePoint, std::uint64_t>;

  struct Entry {
    Task task;
    std::uint64_t seq{0};
    TimePoint lease_until{};
    TimePoint expires_at{};
  };

  struct QueueData {
    std::unordered_map<std::string, Entry, StringHash, StringEqual> tasks;
    // Waiting tasks (pending, scheduled, retry) by (process_at, seq).
    std::map<OrderKey, std::string> waiting;
    std::int64_t processed{0};
    std::int64_t failed_total{0};
  };

  struct KvEntry {
    Bytes value;
    TimePoint expires_at;
  };

  [[nodiscard]] auto find_queue(std::string_view queue) -> QueueData*;
  [[nodiscard]] auto find_active(std::string_view queue, std::string_view id)
      -> std::pair<QueueData*, Entry*>;
  auto make_waiting(QueueData& q, Entry& e) -> void;
  [[nodiscard]] auto live_kv(std::string_view key, TimePoint now) -> KvEntry*;

  std::unordered_map<std::string, QueueData, StringHash, StringEqual> queues_;
  std::unordered_map<std::string, KvEntry, StringHash, StringEqual> kv_;
  std::uint64_t next_seq_{0};
  std::mutex mu_;
};

}  // namespace taskq
