#pragma once

#include <optional>
#include <string>

namespace taskq::cli {

// Shared by every command: config file (defaults apply when empty) and an
// optional override of the sqlite file.
struct CommonOptions {
  std::string config_file;
  std::string db_file;
};

struct ServeOptions {
  CommonOptions common;
  std::optional<std::string> log_file;
};

struct EnqueueOptions {
  CommonOptions common;
  std::string type;
  std::string payload{"{}"};
  std::string queue{"default"};
  std::optional<int> max_retry;
  int delay_ms{0};
  int timeout_ms{0};
};

struct ListOptions {
  CommonOptions common;
  std::string queue;
  int page{1};
  int page_size{20};
};

struct TaskOptions {
  CommonOptions common;
  std::string queue;
  std::string task_id;
};

// One admin endpoint invoked in-process, e.g. method "GET" and target
// "/admin/queues/default/jobs?page=2".
struct CallOptions {
  CommonOptions common;
  std::string method{"GET"};
  std::string target;
  std::string actor;
};

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_schedule(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_enqueue(const EnqueueOptions& opts) -> int;
[[nodiscard]] auto cmd_stats(const CommonOptions& opts) -> int;
[[nodiscard]] auto cmd_jobs(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_failed(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_retry(const TaskOptions& opts) -> int;
[[nodiscard]] auto cmd_delete(const TaskOptions& opts) -> int;
[[nodiscard]] auto cmd_call(const CallOptions& opts) -> int;

}  // namespace taskq::cli
