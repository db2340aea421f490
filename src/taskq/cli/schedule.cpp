#include "common.hpp"

#include "taskq/schedule/periodic.hpp"
#include "taskq/util/log.hpp"
#include "taskq/util/signals.hpp"

#include <print>

namespace taskq::cli {

// Runs apart from `serve`: only enqueues, the workers pick the tasks up.
auto cmd_schedule(const ServeOptions& opts) -> int {
  ShutdownSignals signals;

  auto app_result = open_application(opts.common);
  if (!app_result) {
    return 1;
  }
  auto& app = **app_result;

  const auto log_file = opts.log_file.value_or(app.config().log.file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::start();

  auto jobs = make_scheduled_jobs(app.config());
  if (!jobs) {
    log::stop();
    return 1;
  }
  if (jobs->empty()) {
    log::warn("No schedules configured; nothing to do");
    log::stop();
    return 0;
  }

  PeriodicScheduler scheduler(app.client());
  auto ids = scheduler.register_jobs(std::move(*jobs));
  if (!ids) {
    log::error("Failed to register scheduled jobs: {}", ids.error().message());
    log::stop();
    return 1;
  }
  if (auto r = scheduler.start(); !r) {
    log::error("Failed to start scheduler: {}", r.error().message());
    log::stop();
    return 1;
  }
  log::info("taskq scheduler running: jobs={} timezone=UTC", ids->size());

  signals.wait();
  scheduler.stop();

  log::info("taskq scheduler stopped.");
  log::stop();
  return 0;
}

}  // namespace taskq::cli
