#pragma once

#include "taskq/admin/router.hpp"
#include "taskq/broker/broker.hpp"
#include "taskq/broker/client.hpp"
#include "taskq/config/system_config.hpp"
#include "taskq/core/error.hpp"
#include "taskq/idempotency/guard.hpp"
#include "taskq/inspector/queue_inspector.hpp"
#include "taskq/schedule/periodic.hpp"
#include "taskq/task/registry.hpp"
#include "taskq/worker/metrics.hpp"
#include "taskq/worker/worker_pool.hpp"

#include <memory>
#include <vector>

namespace taskq {

class MemoryStore;
class SqliteStore;

// Owns the store, broker and everything layered on it. init() builds the
// object graph from the config; start() runs the worker pool.
class Application {
public:
  explicit Application(SystemConfig config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Opens the store and wires broker, guard, inspector and admin routes.
  [[nodiscard]] auto init() -> Result<void>;
  // Registers the built-in handlers and starts the worker pool.
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig& {
    return config_;
  }
  [[nodiscard]] auto broker() -> Broker&;
  [[nodiscard]] auto client() -> Client&;
  [[nodiscard]] auto inspector() -> QueueInspector&;
  [[nodiscard]] auto registry() noexcept -> HandlerRegistry& {
    return registry_;
  }
  [[nodiscard]] auto guard() -> IdempotencyGuard&;
  [[nodiscard]] auto metrics() noexcept -> Metrics& {
    return metrics_;
  }
  [[nodiscard]] auto router() noexcept -> http::Router& {
    return router_;
  }

private:
  SystemConfig config_;
  std::unique_ptr<MemoryStore> memory_;
  std::unique_ptr<SqliteStore> sqlite_;
  QueueStore* queue_store_{nullptr};
  KeyValueStore* kv_store_{nullptr};

  HandlerRegistry registry_;
  Metrics metrics_;
  http::Router router_;
  std::unique_ptr<Broker> broker_;
  std::unique_ptr<Client> client_;
  std::unique_ptr<IdempotencyGuard> guard_;
  std::unique_ptr<QueueInspector> inspector_;
  std::unique_ptr<WorkerPool> pool_;
};

[[nodiscard]] auto make_broker_options(const SystemConfig& config)
    -> BrokerOptions;
[[nodiscard]] auto make_worker_options(const SystemConfig& config)
    -> WorkerOptions;
[[nodiscard]] auto make_retry_options(const SystemConfig& config)
    -> RetryOptions;
// One job per `schedules` entry; ParseError if a payload is not JSON.
[[nodiscard]] auto make_scheduled_jobs(const SystemConfig& config)
    -> Result<std::vector<ScheduledJob>>;

}  // namespace taskq
