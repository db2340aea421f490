#include "taskq/app/application.hpp"

#include "taskq/admin/admin_routes.hpp"
#include "taskq/broker/memory_store.hpp"
#include "taskq/broker/sqlite_store.hpp"
#include "taskq/config/config.hpp"
#include "taskq/tasks/order_archive.hpp"
#include "taskq/util/log.hpp"

namespace taskq {

auto make_broker_options(const SystemConfig& config) -> BrokerOptions {
  BrokerOptions opts;
  for (const auto& q : config.queues) {
    opts.queues.push_back(QueueWeight{q.name, q.weight});
  }
  opts.poll_interval = config.worker.poll_interval;
  opts.lease = config.worker.lease;
  opts.default_max_retry = config.retry.default_max_retry;
  opts.completed_retention = config.worker.completed_retention;
  return opts;
}

auto make_worker_options(const SystemConfig& config) -> WorkerOptions {
  return WorkerOptions{
      .concurrency = config.worker.concurrency,
      .shutdown_timeout = config.worker.shutdown_timeout,
      .processing_timeout = config.worker.processing_timeout,
      .janitor_interval = config.worker.janitor_interval,
      .panic_is_terminal = config.worker.panic_is_terminal,
  };
}

auto make_retry_options(const SystemConfig& config) -> RetryOptions {
  return RetryOptions{
      .base_delay = config.retry.base_delay,
      .max_delay = config.retry.max_delay,
      .jitter = config.retry.jitter,
  };
}

auto make_scheduled_jobs(const SystemConfig& config)
    -> Result<std::vector<ScheduledJob>> {
  std::vector<ScheduledJob> jobs;
  jobs.reserve(config.schedules.size());
  for (const auto& sc : config.schedules) {
    auto payload = nlohmann::json::parse(sc.payload, nullptr, false);
    if (payload.is_discarded()) {
      log::error("Schedule {}: payload is not valid JSON", sc.type);
      return taskq::fail(Error::ParseError);
    }
    ScheduledJob job;
    job.cronspec = sc.cron;
    job.type = sc.type;
    job.payload = std::move(payload);
    job.options.queue = sc.queue;
    job.options.max_retry = sc.max_retry;
    job.description = sc.description;
    jobs.push_back(std::move(job));
  }
  return ok(std::move(jobs));
}

Application::Application(SystemConfig config) : config_(std::move(config)) {
}

Application::~Application() {
  stop();
}

auto Application::init() -> Result<void> {
  if (auto r = validate(config_); !r) {
    log::error("Invalid configuration: {}", r.error().message());
    return r;
  }

  if (config_.storage.backend == StorageBackend::Sqlite) {
    sqlite_ = std::make_unique<SqliteStore>(config_.storage.db_file);
    if (auto r = sqlite_->open(); !r) {
      log::error("Failed to open store {}: {}", config_.storage.db_file,
                 r.error().message());
      return r;
    }
    queue_store_ = sqlite_.get();
    kv_store_ = sqlite_.get();
  } else {
    memory_ = std::make_unique<MemoryStore>();
    queue_store_ = memory_.get();
    kv_store_ = memory_.get();
  }

  broker_ = std::make_unique<Broker>(*queue_store_, make_broker_options(config_));
  client_ = std::make_unique<Client>(*broker_);
  guard_ = std::make_unique<IdempotencyGuard>(
      *kv_store_, config_.idempotency.key_prefix, config_.idempotency.fail_mode);
  inspector_ = std::make_unique<QueueInspector>(*broker_);

  admin::register_admin_routes(router_, *inspector_);
  admin::register_metrics_route(router_, metrics_);

  log::info("Application initialized: backend={} queues={}",
            storage_backend_name(config_.storage.backend),
            config_.queues.size());
  return ok();
}

auto Application::start() -> Result<void> {
  if (!broker_) {
    return fail(Error::InvalidArgument);
  }
  if (pool_ && pool_->running()) {
    return fail(Error::AlreadyExists);
  }

  if (!registry_.frozen()) {
    if (auto r = tasks::register_builtin_handlers(registry_, *guard_,
                                                  config_.idempotency.ttl);
        !r) {
      log::error("Failed to register handlers: {}", r.error().message());
      return r;
    }
  }

  pool_ = std::make_unique<WorkerPool>(
      *broker_, registry_, RetryPolicy{make_retry_options(config_)},
      make_worker_options(config_), &metrics_, kv_store_);
  return pool_->start();
}

auto Application::stop() -> void {
  if (pool_) {
    pool_->stop();
  }
}

auto Application::is_running() const noexcept -> bool {
  return pool_ && pool_->running();
}

auto Application::broker() -> Broker& {
  return *broker_;
}

auto Application::client() -> Client& {
  return *client_;
}

auto Application::inspector() -> QueueInspector& {
  return *inspector_;
}

auto Application::guard() -> IdempotencyGuard& {
  return *guard_;
}

}  // namespace taskq
