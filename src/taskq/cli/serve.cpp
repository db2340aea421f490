#include "common.hpp"

#include "taskq/util/log.hpp"
#include "taskq/util/signals.hpp"

#include <print>

namespace taskq::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  // Before any thread starts, so none of them receives SIGINT or SIGTERM.
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

  log::info("taskq worker starting: concurrency={} backend={}",
            app.config().worker.concurrency,
            storage_backend_name(app.config().storage.backend));

  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  signals.wait();
  app.stop();

  log::info("taskq worker stopped.");
  log::stop();
  return 0;
}

}  // namespace taskq::cli
