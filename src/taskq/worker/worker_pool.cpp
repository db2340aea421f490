#include "taskq/worker/worker_pool.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/task/state_strings.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <format>

namespace taskq {

WorkerPool::WorkerPool(Broker& broker, HandlerRegistry& registry,
                       RetryPolicy policy, WorkerOptions options,
                       Metrics* metrics, KeyValueStore* kv)
    : broker_(broker),
      registry_(registry),
      policy_(policy),
      options_(options),
      metrics_(metrics),
      kv_(kv) {
}

WorkerPool::~WorkerPool() {
  stop();
}

auto WorkerPool::use(Middleware mw) -> void {
  extra_.push_back(std::move(mw));
}

auto WorkerPool::in_flight() const -> std::size_t {
  std::lock_guard lock(inflight_mu_);
  return inflight_.size();
}

auto WorkerPool::handler_for(const std::string& type) const -> const Handler& {
  auto it = chained_.find(type);
  return it != chained_.end() ? it->second : unknown_;
}

auto WorkerPool::start() -> Result<void> {
  if (options_.concurrency < 1) {
    return fail(Error::InvalidArgument);
  }
  if (running_.exchange(true)) {
    return fail(Error::AlreadyExists);
  }

  registry_.freeze();
  auto mws = default_middleware(options_.panic_is_terminal, metrics_);
  mws.insert(mws.end(), extra_.begin(), extra_.end());
  mws.push_back(deadline_middleware());

  chained_.clear();
  for (const auto& type : registry_.types()) {
    chained_.emplace(type, chain(*registry_.find(type), mws));
  }
  unknown_ = chain(
      [](TaskContext&, const Task& task) -> HandlerResult {
        return std::unexpected(TaskError::configuration(std::format(
            "no handler registered for task type \"{}\"", task.type)));
      },
      mws);

  stop_source_ = CancellationSource{};
  monitor_source_ = CancellationSource{};
  {
    std::lock_guard lock(inflight_mu_);
    claiming_ = 0;
    cancel_late_ = CancelReason::None;
  }

  workers_.reserve(static_cast<std::size_t>(options_.concurrency));
  for (int i = 0; i < options_.concurrency; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
  monitor_ = std::thread([this] { monitor_loop(); });

  log::info("Worker pool started: concurrency={} queues={} handlers={}",
            options_.concurrency, broker_.queues().size(), chained_.size());
  return ok();
}

auto WorkerPool::run(const CancellationToken& token) -> Result<void> {
  if (auto r = start(); !r) {
    return r;
  }
  while (!token.wait_for(std::chrono::seconds(1))) {
  }
  stop();
  return ok();
}

auto WorkerPool::stop() -> void {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  log::info("Worker pool stopping: in_flight={}", in_flight());

  stop_source_.cancel(CancelReason::Shutdown);
  broker_.notify_all();

  {
    std::unique_lock lock(inflight_mu_);
    bool drained = inflight_cv_.wait_for(
        lock, options_.shutdown_timeout,
        [this] { return inflight_.empty() && claiming_ == 0; });
    if (!drained) {
      log::warn("Shutdown timeout: cancelling {} in-flight task(s)",
                inflight_.size());
    }
  }
  cancel_in_flight(CancelReason::Shutdown);

  for (auto& t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  workers_.clear();

  monitor_source_.cancel(CancelReason::Shutdown);
  if (monitor_.joinable()) {
    monitor_.join();
  }

  running_.store(false, std::memory_order_release);
  log::info("Worker pool stopped");
}

auto WorkerPool::worker_loop(int index) -> void {
  auto token = stop_source_.token();
  auto backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
      timing::kBrokerBackoffInitial);
  const auto backoff_max =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          timing::kBrokerBackoffMax);

  log::debug("Worker {} started", index);
  while (!token.is_cancelled()) {
    {
      std::lock_guard lock(inflight_mu_);
      ++claiming_;
    }
    auto task = broker_.dequeue(token);
    if (!task) {
      end_claim();
      if (task.error() == Error::Cancelled) {
        break;
      }
      log::warn("Worker {} dequeue failed: {}; retrying in {}ms", index,
                task.error().message(), backoff.count());
      if (token.wait_for(backoff)) {
        break;
      }
      backoff = std::min(backoff * 2, backoff_max);
      continue;
    }
    backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
        timing::kBrokerBackoffInitial);
    process(std::move(*task));
  }
  log::debug("Worker {} stopped", index);
}

auto WorkerPool::process(Task task) -> void {
  auto timeout =
      task.timeout.count() > 0 ? task.timeout : options_.processing_timeout;
  auto entry = std::make_shared<InFlight>(
      InFlight{task, std::chrono::steady_clock::now() + timeout, {}});

  std::uint64_t slot;
  {
    std::lock_guard lock(inflight_mu_);
    slot = next_slot_++;
    inflight_.emplace(slot, entry);
    --claiming_;
    if (cancel_late_ != CancelReason::None) {
      entry->cancel.cancel(cancel_late_);
    }
  }

  TaskContext ctx(entry->task, entry->deadline, entry->cancel.token());
  auto result = handler_for(task.type)(ctx, entry->task);

  route(entry->task, std::move(result));

  {
    std::lock_guard lock(inflight_mu_);
    inflight_.erase(slot);
  }
  inflight_cv_.notify_all();
}

auto WorkerPool::route(const Task& task, HandlerResult result) -> void {
  if (result) {
    if (auto r = broker_.complete(task); !r) {
      log::error("Failed to complete task_id={}: {}", task.id,
                 r.error().message());
    }
    return;
  }

  const auto& err = result.error();
  auto decision = policy_.decide(task, err);
  if (decision.retry()) {
    Task next = task;
    next.retry_count = decision.next_retry_count;
    log::warn("Retrying task_id={} task_type={} queue={} retry_count={} "
              "delay_ms={} kind={}",
              task.id, task.type, task.queue, next.retry_count,
              decision.delay.count(), failure_kind_name(err.kind));
    if (auto r = broker_.retry(std::move(next), decision.delay, err.message);
        !r) {
      log::error("Failed to schedule retry for task_id={}: {}", task.id,
                 r.error().message());
    }
    return;
  }

  log::error("Task moved to failed task_id={} task_type={} queue={} "
             "retry_count={} kind={} error=\"{}\"",
             task.id, task.type, task.queue, task.retry_count,
             failure_kind_name(err.kind), err.message);
  if (auto r = broker_.fail(task, err.message); !r) {
    log::error("Failed to mark task_id={} failed: {}", task.id,
               r.error().message());
  }
}

auto WorkerPool::monitor_loop() -> void {
  auto token = monitor_source_.token();
  auto lease_every = broker_.options().lease / 3;
  auto now = std::chrono::steady_clock::now();
  auto next_lease = now + lease_every;
  auto next_janitor = now + options_.janitor_interval;

  while (!token.wait_for(timing::kMonitorTick)) {
    enforce_deadlines();

    now = std::chrono::steady_clock::now();
    if (now >= next_lease) {
      extend_leases();
      next_lease = now + lease_every;
    }
    if (now >= next_janitor) {
      run_janitor();
      next_janitor = now + options_.janitor_interval;
    }
  }
}

auto WorkerPool::enforce_deadlines() -> void {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard lock(inflight_mu_);
  for (auto& [_, entry] : inflight_) {
    if (now >= entry->deadline && !entry->cancel.is_cancelled()) {
      log::warn("Deadline exceeded task_id={} task_type={}", entry->task.id,
                entry->task.type);
      entry->cancel.cancel(CancelReason::Deadline);
    }
  }
}

auto WorkerPool::extend_leases() -> void {
  std::vector<std::shared_ptr<InFlight>> snapshot;
  {
    std::lock_guard lock(inflight_mu_);
    for (const auto& [_, entry] : inflight_) {
      snapshot.push_back(entry);
    }
  }
  for (const auto& entry : snapshot) {
    if (auto r = broker_.extend_lease(entry->task); !r) {
      log::warn("Lease extension failed task_id={}: {}", entry->task.id,
                r.error().message());
    }
  }
}

auto WorkerPool::end_claim() -> void {
  {
    std::lock_guard lock(inflight_mu_);
    --claiming_;
  }
  inflight_cv_.notify_all();
}

auto WorkerPool::cancel_in_flight(CancelReason reason) -> void {
  std::lock_guard lock(inflight_mu_);
  cancel_late_ = reason;
  for (auto& [_, entry] : inflight_) {
    entry->cancel.cancel(reason);
  }
}

auto WorkerPool::run_janitor() -> void {
  auto& store = broker_.store();
  auto now = Clock::now();

  if (auto recovered = store.recover_expired(now); !recovered) {
    log::warn("Janitor: lease recovery failed: {}",
              recovered.error().message());
  } else if (!recovered->empty()) {
    for (const auto& t : *recovered) {
      log::warn("Janitor: recovered orphaned task_id={} queue={} state={} "
                "retry_count={}",
                t.id, t.queue, task_state_name(t.state), t.retry_count);
    }
    broker_.notify_all();
  }

  if (auto purged = store.purge_completed(now); !purged) {
    log::warn("Janitor: purge of completed tasks failed: {}",
              purged.error().message());
  } else if (*purged > 0) {
    log::debug("Janitor: purged {} completed task(s)", *purged);
  }

  if (kv_) {
    if (auto purged = kv_->purge_expired(); !purged) {
      log::warn("Janitor: purge of idempotency records failed: {}",
                purged.error().message());
    } else if (*purged > 0) {
      log::debug("Janitor: purged {} idempotency record(s)", *purged);
    }
  }

  if (metrics_) {
    for (const auto& q : broker_.queues()) {
      if (auto c = store.counts(q.name, now)) {
        metrics_->set_queue_depth(q.name, c->pending + c->scheduled + c->retry);
      }
    }
  }
}

}  // namespace taskq
