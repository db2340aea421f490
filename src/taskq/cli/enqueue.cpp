#include "common.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <print>

namespace taskq::cli {

auto cmd_enqueue(const EnqueueOptions& opts) -> int {
  if (opts.type.empty()) {
    std::println(stderr, "Error: --type is required");
    return 1;
  }
  auto payload = nlohmann::json::parse(opts.payload, nullptr, false);
  if (payload.is_discarded()) {
    std::println(stderr, "Error: --payload is not valid JSON");
    return 1;
  }

  auto app_result = open_application(opts.common);
  if (!app_result) {
    return 1;
  }
  auto& app = **app_result;

  ClientOptions client_opts{
      .queue = opts.queue,
      .max_retry = opts.max_retry,
      .process_in = std::chrono::milliseconds(opts.delay_ms),
      .timeout = std::chrono::milliseconds(opts.timeout_ms),
  };
  auto id = app.client().enqueue(opts.type, payload, client_opts);
  if (!id) {
    std::println(stderr, "Error: Failed to enqueue: {}", id.error().message());
    return 1;
  }

  nlohmann::json out = {
      {"task_id", id->str()}, {"type", opts.type}, {"queue", opts.queue}};
  std::println("{}", out.dump(2));
  return 0;
}

}  // namespace taskq::cli
