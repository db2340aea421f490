#pragma once

#include "taskq/broker/broker.hpp"
#include "taskq/core/error.hpp"
#include "taskq/task/registry.hpp"
#include "taskq/util/cancellation.hpp"
#include "taskq/worker/metrics.hpp"
#include "taskq/worker/middleware.hpp"
#include "taskq/worker/retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace taskq {

struct WorkerOptions {
  int concurrency{10};
  std::chrono::milliseconds shutdown_timeout{30'000};
  // Deadline for tasks that do not carry their own timeout.
  std::chrono::milliseconds processing_timeout{1'800'000};
  std::chrono::milliseconds janitor_interval{5'000};
  bool panic_is_terminal{false};
};

// Fixed set of threads that pull from the broker, run each task through the
// middleware chain and its handler, and route the outcome to complete, retry
// or fail. A monitor thread enforces deadlines, extends leases of in-flight
// tasks and runs the janitor.
class WorkerPool {
public:
  WorkerPool(Broker& broker, HandlerRegistry& registry, RetryPolicy policy,
             WorkerOptions options, Metrics* metrics = nullptr,
             KeyValueStore* kv = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Appended inside the default chain; only the deadline check sits closer
  // to the handler.
  auto use(Middleware mw) -> void;

  // Freezes the registry and launches the worker and monitor threads.
  [[nodiscard]] auto start() -> Result<void>;
  // start(), then blocks until `token` is cancelled and shuts down.
  [[nodiscard]] auto run(const CancellationToken& token) -> Result<void>;
  // Stops dequeuing, waits up to shutdown_timeout for in-flight tasks,
  // cancels the rest and joins every thread.
  auto stop() -> void;

  // Recovers expired leases, purges completed tasks and expired idempotency
  // records, refreshes queue depth gauges.
  auto run_janitor() -> void;

  [[nodiscard]] auto running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto in_flight() const -> std::size_t;

private:
  struct InFlight {
    Task task;
    Deadline deadline;
    CancellationSource cancel;
  };

  auto worker_loop(int index) -> void;
  auto monitor_loop() -> void;
  auto process(Task task) -> void;
  auto route(const Task& task, HandlerResult result) -> void;
  auto enforce_deadlines() -> void;
  auto extend_leases() -> void;
  auto cancel_in_flight(CancelReason reason) -> void;
  auto end_claim() -> void;
  [[nodiscard]] auto handler_for(const std::string& type) const
      -> const Handler&;

  Broker& broker_;
  HandlerRegistry& registry_;
  RetryPolicy policy_;
  WorkerOptions options_;
  Metrics* metrics_;
  KeyValueStore* kv_;

  std::vector<Middleware> extra_;
  std::unordered_map<std::string, Handler> chained_;
  Handler unknown_;

  std::atomic<bool> running_{false};
  CancellationSource stop_source_;
  CancellationSource monitor_source_;
  std::vector<std::thread> workers_;
  std::thread monitor_;

  mutable std::mutex inflight_mu_;
  std::condition_variable inflight_cv_;
  std::unordered_map<std::uint64_t, std::shared_ptr<InFlight>> inflight_;
  std::uint64_t next_slot_{0};
  // Workers inside dequeue; a task they return is not in inflight_ yet.
  int claiming_{0};
  // Set by cancel_in_flight; tasks registered afterwards start cancelled.
  CancelReason cancel_late_{CancelReason::None};
};

}  // namespace taskq
