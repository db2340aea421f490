#include "taskq/broker/broker.hpp"

#include "taskq/util/log.hpp"

#include <algorithm>

namespace taskq {

namespace {

// Store failures other than a missing or duplicate task mean the backing
// store could not be reached.
auto as_broker_error(std::error_code ec) -> std::error_code {
  if (ec == Error::TaskNotFound || ec == Error::AlreadyExists) {
    return ec;
  }
  return make_error_code(Error::BrokerUnavailable);
}

}  // namespace

Broker::Broker(QueueStore& store, BrokerOptions options)
    : store_(store),
      options_(std::move(options)),
      scheduler_(options_.queues) {
}

auto Broker::has_queue(std::string_view name) const -> bool {
  return std::ranges::any_of(options_.queues,
                             [name](const auto& q) { return q.name == name; });
}

auto Broker::enqueue(std::string_view queue, NewTask task,
                     const EnqueueOptions& options) -> Result<TaskId> {
  if (!has_queue(queue)) {
    log::warn("Enqueue rejected: unknown queue '{}'", queue);
    return taskq::fail(Error::QueueUnknown);
  }
  if (task.type.empty()) {
    return taskq::fail(Error::SerializationFailed);
  }
  int max_retry = options.max_retry.value_or(options_.default_max_retry);
  if (max_retry < 0) {
    return taskq::fail(Error::InvalidArgument);
  }

  auto now = Clock::now();
  Task t;
  t.id = new_task_id();
  t.type = std::move(task.type);
  t.payload = std::move(task.payload);
  t.queue = std::string(queue);
  t.max_retry = max_retry;
  t.timeout = options.timeout;
  t.enqueued_at = now;
  t.process_at = now + options.process_in;
  t.state = options.process_in.count() > 0 ? TaskState::Scheduled
                                           : TaskState::Pending;

  if (auto r = store_.enqueue(t); !r) {
    log::error("Enqueue of {} to '{}' failed: {}", t.type, queue,
               r.error().message());
    return std::unexpected(as_broker_error(r.error()));
  }
  log::debug("Enqueued task_id={} task_type={} queue={}", t.id, t.type, queue);
  if (t.state == TaskState::Pending) {
    notify_all();
  }
  return t.id;
}

auto Broker::try_dequeue() -> Result<std::optional<Task>> {
  std::optional<Task> taken;
  std::error_code error;
  auto now = Clock::now();
  auto lease_until = now + options_.lease;

  auto picked = scheduler_.next([&](std::size_t i) {
    auto r = store_.dequeue(options_.queues[i].name, now, lease_until);
    if (!r) {
      error = r.error();
      return WeightedScheduler::TakeResult::Abort;
    }
    if (!*r) {
      return WeightedScheduler::TakeResult::Empty;
    }
    taken = std::move(**r);
    return WeightedScheduler::TakeResult::Taken;
  });

  if (error) {
    return std::unexpected(as_broker_error(error));
  }
  if (!picked) {
    return std::optional<Task>{};
  }
  return taken;
}

auto Broker::dequeue(const CancellationToken& token) -> Result<Task> {
  while (true) {
    if (token.is_cancelled()) {
      return taskq::fail(Error::Cancelled);
    }

    std::uint64_t seen;
    {
      std::lock_guard lock(wait_mu_);
      seen = generation_;
    }

    auto r = try_dequeue();
    if (!r) {
      return std::unexpected(r.error());
    }
    if (*r) {
      return std::move(**r);
    }

    std::unique_lock lock(wait_mu_);
    wait_cv_.wait_for(lock, options_.poll_interval, [&] {
      return generation_ != seen || token.is_cancelled();
    });
  }
}

auto Broker::complete(const Task& task) -> Result<void> {
  auto r = store_.complete(task, Clock::now(), options_.completed_retention);
  if (!r) {
    return std::unexpected(as_broker_error(r.error()));
  }
  return ok();
}

auto Broker::retry(Task task, std::chrono::milliseconds delay,
                   std::string_view error) -> Result<void> {
  auto now = Clock::now();
  task.process_at = now + delay;
  task.last_error = std::string(error);
  task.last_failed_at = now;
  if (auto r = store_.retry(task); !r) {
    return std::unexpected(as_broker_error(r.error()));
  }
  if (delay.count() <= 0) {
    notify_all();
  }
  return ok();
}

auto Broker::fail(Task task, std::string_view error) -> Result<void> {
  task.last_error = std::string(error);
  task.last_failed_at = Clock::now();
  if (auto r = store_.fail(task); !r) {
    return std::unexpected(as_broker_error(r.error()));
  }
  return ok();
}

auto Broker::extend_lease(const Task& task) -> Result<void> {
  if (auto r = store_.extend_lease(task, Clock::now() + options_.lease); !r) {
    return std::unexpected(as_broker_error(r.error()));
  }
  return ok();
}

auto Broker::notify_all() -> void {
  {
    std::lock_guard lock(wait_mu_);
    ++generation_;
  }
  wait_cv_.notify_all();
}

}  // namespace taskq
