#include "taskq/broker/memory_store.hpp"

#include <algorithm>

namespace taskq {

auto MemoryStore::find_queue(std::string_view queue) -> QueueData* {
  auto it = queues_.find(queue);
  return it != queues_.end() ? &it->second : nullptr;
}

auto MemoryStore::find_active(std::string_view queue, std::string_view id)
    -> std::pair<QueueData*, Entry*> {
  auto* q = find_queue(queue);
  if (!q) {
    return {nullptr, nullptr};
  }
  auto it = q->tasks.find(id);
  if (it == q->tasks.end() || it->second.task.state != TaskState::Active) {
    return {q, nullptr};
  }
  return {q, &it->second};
}

auto MemoryStore::make_waiting(QueueData& q, Entry& e) -> void {
  e.seq = next_seq_++;
  e.lease_until = {};
  q.waiting.emplace(OrderKey{e.task.process_at, e.seq}, e.task.id.str());
}

auto MemoryStore::enqueue(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  auto& q = queues_[task.queue];
  auto [it, inserted] = q.tasks.try_emplace(task.id.str(), Entry{.task = task});
  if (!inserted) {
    return taskq::fail(Error::AlreadyExists);
  }
  make_waiting(q, it->second);
  return ok();
}

auto MemoryStore::dequeue(std::string_view queue, TimePoint now,
                          TimePoint lease_until)
    -> Result<std::optional<Task>> {
  std::lock_guard lock(mu_);
  auto* q = find_queue(queue);
  if (!q || q->waiting.empty()) {
    return std::optional<Task>{};
  }
  auto head = q->waiting.begin();
  if (head->first.first > now) {
    return std::optional<Task>{};
  }
  auto& entry = q->tasks.at(head->second);
  q->waiting.erase(head);
  entry.task.state = TaskState::Active;
  entry.lease_until = lease_until;
  return std::optional<Task>{entry.task};
}

auto MemoryStore::extend_lease(const Task& task, TimePoint lease_until)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto [q, e] = find_active(task.queue, task.id.value());
  if (!e) {
    return taskq::fail(Error::TaskNotFound);
  }
  e->lease_until = lease_until;
  return ok();
}

auto MemoryStore::complete(const Task& task, TimePoint now,
                           std::chrono::milliseconds retention)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto [q, e] = find_active(task.queue, task.id.value());
  if (!e) {
    return taskq::fail(Error::TaskNotFound);
  }
  ++q->processed;
  if (retention.count() <= 0) {
    q->tasks.erase(task.id.str());
    return ok();
  }
  e->task.state = TaskState::Completed;
  e->task.processed_at = now;
  e->expires_at = now + retention;
  return ok();
}

auto MemoryStore::retry(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  auto [q, e] = find_active(task.queue, task.id.value());
  if (!e) {
    return taskq::fail(Error::TaskNotFound);
  }
  ++q->processed;
  ++q->failed_total;
  e->task.state = TaskState::Retry;
  e->task.retry_count = task.retry_count;
  e->task.process_at = task.process_at;
  e->task.last_error = task.last_error;
  e->task.last_failed_at = task.last_failed_at;
  make_waiting(*q, *e);
  return ok();
}

auto MemoryStore::fail(const Task& task) -> Result<void> {
  std::lock_guard lock(mu_);
  auto [q, e] = find_active(task.queue, task.id.value());
  if (!e) {
    return taskq::fail(Error::TaskNotFound);
  }
  ++q->processed;
  ++q->failed_total;
  e->task.state = TaskState::Failed;
  e->task.retry_count = task.retry_count;
  e->task.last_error = task.last_error;
  e->task.last_failed_at = task.last_failed_at;
  e->lease_until = {};
  return ok();
}

auto MemoryStore::requeue_failed(std::string_view queue, std::string_view id,
                                 TimePoint now) -> Result<Task> {
  std::lock_guard lock(mu_);
  auto* q = find_queue(queue);
  if (!q) {
    return taskq::fail(Error::TaskNotFound);
  }
  auto it = q->tasks.find(id);
  if (it == q->tasks.end() || it->second.task.state != TaskState::Failed) {
    return taskq::fail(Error::TaskNotFound);
  }
  auto& e = it->second;
  e.task.state = TaskState::Pending;
  e.task.retry_count = 0;
  e.task.last_error.clear();
  e.task.process_at = now;
  make_waiting(*q, e);
  return e.task;
}

auto MemoryStore::delete_failed(std::string_view queue, std::string_view id)
    -> Result<void> {
  std::lock_guard lock(mu_);
  auto* q = find_queue(queue);
  if (!q) {
    return taskq::fail(Error::TaskNotFound);
  }
  auto it = q->tasks.find(id);
  if (it == q->tasks.end() || it->second.task.state != TaskState::Failed) {
    return taskq::fail(Error::TaskNotFound);
  }
  q->tasks.erase(it);
  return ok();
}

auto MemoryStore::find(std::string_view queue, std::string_view id)
    -> Result<std::optional<Task>> {
  std::lock_guard lock(mu_);
  auto* q = find_queue(queue);
  if (!q) {
    return std::optional<Task>{};
  }
  auto it = q->tasks.find(id);
  if (it == q->tasks.end()) {
    return std::optional<Task>{};
  }
  return std::optional<Task>{it->second.task};
}

auto MemoryStore::list(std::string_view queue, TaskFilter filter,
                       std::size_t offset, std::size_t limit)
    -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  std::vector<Task> out;
  auto* q = find_queue(queue);
  if (!q) {
    return out;
  }

  std::vector<const Entry*> matched;
  for (const auto& [_, e] : q->tasks) {
    bool keep = filter == TaskFilter::Failed
                    ? e.task.state == TaskState::Failed
                    : is_waiting(e.task.state) ||
                          e.task.state == TaskState::Active;
    if (keep) {
      matched.push_back(&e);
    }
  }

  if (filter == TaskFilter::Failed) {
    std::ranges::sort(matched, [](const Entry* a, const Entry* b) {
      if (a->task.last_failed_at != b->task.last_failed_at) {
        return a->task.last_failed_at > b->task.last_failed_at;
      }
      return a->seq < b->seq;
    });
  } else {
    std::ranges::sort(matched, [](const Entry* a, const Entry* b) {
      return OrderKey{a->task.process_at, a->seq} <
             OrderKey{b->task.process_at, b->seq};
    });
  }

  for (std::size_t i = offset; i < matched.size() && out.size() < limit; ++i) {
    out.push_back(matched[i]->task);
  }
  return out;
}

auto MemoryStore::counts(std::string_view queue, TimePoint now)
    -> Result<QueueCounts> {
  std::lock_guard lock(mu_);
  QueueCounts c;
  auto* q = find_queue(queue);
  if (!q) {
    return c;
  }
  c.processed = q->processed;
  c.failed_total = q->failed_total;
  for (const auto& [_, e] : q->tasks) {
    switch (effective_state(e.task, now)) {
      case TaskState::Pending: ++c.pending; break;
      case TaskState::Scheduled: ++c.scheduled; break;
      case TaskState::Active: ++c.active; break;
      case TaskState::Retry: ++c.retry; break;
      case TaskState::Completed: ++c.completed; break;
      case TaskState::Failed: ++c.failed; break;
    }
  }
  return c;
}

auto MemoryStore::recover_expired(TimePoint now) -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  std::vector<Task> recovered;
  for (auto& [_, q] : queues_) {
    for (auto& [_, e] : q.tasks) {
      if (e.task.state != TaskState::Active || e.lease_until > now) {
        continue;
      }
      ++q.processed;
      ++q.failed_total;
      e.task.last_error = "lease expired: worker lost while processing";
      e.task.last_failed_at = now;
      if (e.task.retry_count < e.task.max_retry) {
        ++e.task.retry_count;
        e.task.state = TaskState::Retry;
        e.task.process_at = now;
        make_waiting(q, e);
      } else {
        e.task.state = TaskState::Failed;
        e.lease_until = {};
      }
      recovered.push_back(e.task);
    }
  }
  return recovered;
}

auto MemoryStore::purge_completed(TimePoint now) -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  std::size_t purged = 0;
  for (auto& [_, q] : queues_) {
    purged += std::erase_if(q.tasks, [now](const auto& kv) {
      return kv.second.task.state == TaskState::Completed &&
             kv.second.expires_at <= now;
    });
  }
  return purged;
}

auto MemoryStore::live_kv(std::string_view key, TimePoint now) -> KvEntry* {
  auto it = kv_.find(key);
  if (it == kv_.end()) {
    return nullptr;
  }
  if (it->second.expires_at <= now) {
    kv_.erase(it);
    return nullptr;
  }
  return &it->second;
}

auto MemoryStore::set_if_absent(std::string_view key, const Bytes& value,
                                std::chrono::milliseconds ttl) -> Result<bool> {
  std::lock_guard lock(mu_);
  auto now = Clock::now();
  if (live_kv(key, now)) {
    return false;
  }
  kv_.insert_or_assign(std::string(key), KvEntry{value, now + ttl});
  return true;
}

auto MemoryStore::set(std::string_view key, const Bytes& value,
                      std::chrono::milliseconds ttl) -> Result<void> {
  std::lock_guard lock(mu_);
  kv_.insert_or_assign(std::string(key), KvEntry{value, Clock::now() + ttl});
  return ok();
}

auto MemoryStore::get(std::string_view key) -> Result<std::optional<Bytes>> {
  std::lock_guard lock(mu_);
  if (auto* e = live_kv(key, Clock::now())) {
    return std::optional<Bytes>{e->value};
  }
  return std::optional<Bytes>{};
}

auto MemoryStore::erase(std::string_view key) -> Result<void> {
  std::lock_guard lock(mu_);
  if (auto it = kv_.find(key); it != kv_.end()) {
    kv_.erase(it);
  }
  return ok();
}

auto MemoryStore::erase_if(std::string_view key, const Bytes& expected)
    -> Result<bool> {
  std::lock_guard lock(mu_);
  auto* e = live_kv(key, Clock::now());
  if (!e || e->value != expected) {
    return false;
  }
  kv_.erase(kv_.find(key));
  return true;
}

auto MemoryStore::purge_expired() -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto now = Clock::now();
  return std::erase_if(kv_, [now](const auto& kv) {
    return kv.second.expires_at <= now;
  });
}

}  // namespace taskq
