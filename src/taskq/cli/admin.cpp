#include "common.hpp"

#include "taskq/admin/router.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace taskq::cli {

namespace {

template <typename T>
auto print_result(const Result<T>& r) -> int {
  if (!r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  nlohmann::json j = *r;
  std::println("{}", j.dump(2, ' ', false,
                            nlohmann::json::error_handler_t::replace));
  return 0;
}

auto require_queue(const std::string& queue) -> bool {
  if (queue.empty()) {
    std::println(stderr, "Error: --queue is required");
    return false;
  }
  return true;
}

}  // namespace

auto cmd_stats(const CommonOptions& opts) -> int {
  auto app = open_application(opts);
  if (!app) {
    return 1;
  }
  return print_result((*app)->inspector().get_stats());
}

auto cmd_jobs(const ListOptions& opts) -> int {
  if (!require_queue(opts.queue)) {
    return 1;
  }
  auto app = open_application(opts.common);
  if (!app) {
    return 1;
  }
  return print_result(
      (*app)->inspector().list_jobs(opts.queue, opts.page, opts.page_size));
}

auto cmd_failed(const ListOptions& opts) -> int {
  if (!require_queue(opts.queue)) {
    return 1;
  }
  auto app = open_application(opts.common);
  if (!app) {
    return 1;
  }
  return print_result((*app)->inspector().list_failed_jobs(
      opts.queue, opts.page, opts.page_size));
}

auto cmd_retry(const TaskOptions& opts) -> int {
  if (!require_queue(opts.queue)) {
    return 1;
  }
  auto app = open_application(opts.common);
  if (!app) {
    return 1;
  }
  return print_result(
      (*app)->inspector().retry_failed_job(opts.queue, opts.task_id));
}

auto cmd_delete(const TaskOptions& opts) -> int {
  if (!require_queue(opts.queue)) {
    return 1;
  }
  auto app = open_application(opts.common);
  if (!app) {
    return 1;
  }
  if (auto r = (*app)->inspector().delete_failed_job(opts.queue, opts.task_id);
      !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  nlohmann::json out = {
      {"message", "Task deleted"}, {"task_id", opts.task_id}, {"queue", opts.queue}};
  std::println("{}", out.dump(2));
  return 0;
}

auto cmd_call(const CallOptions& opts) -> int {
  auto method = http::parse_method(opts.method);
  if (!method) {
    std::println(stderr, "Error: unknown method '{}'", opts.method);
    return 1;
  }
  if (!opts.target.starts_with('/')) {
    std::println(stderr, "Error: --target must start with '/'");
    return 1;
  }
  auto app = open_application(opts.common);
  if (!app) {
    return 1;
  }

  auto req = http::Request::from_target(*method, opts.target);
  if (!opts.actor.empty()) {
    req.headers.emplace("X-Actor-ID", opts.actor);
  }
  auto resp = (*app)->router().dispatch(req);

  std::println(stderr, "{} {} {}", static_cast<int>(resp.status),
               http::reason_phrase(resp.status), resp.content_type());
  if (!resp.body.empty()) {
    std::println("{}", resp.body);
  }
  return resp.status == http::Status::Ok ? 0 : 1;
}

}  // namespace taskq::cli
