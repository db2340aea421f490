#pragma once

#include "taskq/broker/client.hpp"
#include "taskq/core/error.hpp"
#include "taskq/schedule/cron.hpp"
#include "taskq/util/cancellation.hpp"
#include "taskq/util/time.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskq {

// A task enqueued whenever `cronspec` fires.
struct ScheduledJob {
  std::string cronspec;
  std::string type;
  nlohmann::json payload = nlohmann::json::object();
  ClientOptions options;
  std::string description;
};

struct ScheduledEntry {
  std::string id;
  ScheduledJob job;
  TimePoint next_run;
  TimePoint last_run;
};

// Enqueues registered jobs through a Client on their cron schedules. A job
// that was due several times while the scheduler was idle fires once.
class PeriodicScheduler {
public:
  explicit PeriodicScheduler(Client& client) : client_(client) {
  }
  ~PeriodicScheduler();

  PeriodicScheduler(const PeriodicScheduler&) = delete;
  PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

  // Returns the entry id. ParseError for a bad cronspec, InvalidArgument
  // for an empty task type.
  [[nodiscard]] auto register_job(ScheduledJob job, TimePoint now = Clock::now())
      -> Result<std::string>;
  // Stops at the first job that fails to register; the earlier ones stay.
  [[nodiscard]] auto register_jobs(std::vector<ScheduledJob> jobs)
      -> Result<std::vector<std::string>>;
  auto unregister(std::string_view id) -> bool;

  // Enqueues every job due at or before `now`; returns how many fired.
  auto tick(TimePoint now) -> std::size_t;

  [[nodiscard]] auto next_run() const -> TimePoint;
  [[nodiscard]] auto entries() const -> std::vector<ScheduledEntry>;

  [[nodiscard]] auto start() -> Result<void>;
  // start(), then blocks until `token` is cancelled.
  [[nodiscard]] auto run(const CancellationToken& token) -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

private:
  struct Entry {
    ScheduledEntry info;
    CronSchedule schedule;
  };

  auto loop() -> void;

  Client& client_;
  mutable std::mutex mu_;
  std::vector<Entry> entries_;

  std::atomic<bool> running_{false};
  CancellationSource stop_source_;
  std::thread thread_;
};

}  // namespace taskq
