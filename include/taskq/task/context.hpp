#pragma once

#include "taskq/task/task.hpp"
#include "taskq/util/cancellation.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace taskq {

using Deadline = std::chrono::steady_clock::time_point;

// Per-execution state handed to a handler. Lives for one attempt only.
class TaskContext {
public:
  TaskContext(const Task& task, Deadline deadline, CancellationToken token)
      : task_(&task),
        started_at_(std::chrono::steady_clock::now()),
        deadline_(deadline),
        token_(std::move(token)) {
  }

  [[nodiscard]] auto task() const noexcept -> const Task& {
    return *task_;
  }
  [[nodiscard]] auto started_at() const noexcept -> Deadline {
    return started_at_;
  }
  [[nodiscard]] auto deadline() const noexcept -> Deadline {
    return deadline_;
  }
  [[nodiscard]] auto token() const noexcept -> const CancellationToken& {
    return token_;
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return token_.is_cancelled();
  }
  [[nodiscard]] auto deadline_exceeded() const noexcept -> bool {
    return std::chrono::steady_clock::now() >= deadline_;
  }

  [[nodiscard]] auto trace_id() const noexcept -> const std::string& {
    return trace_id_;
  }
  [[nodiscard]] auto span_id() const noexcept -> const std::string& {
    return span_id_;
  }
  auto set_trace(std::string trace_id, std::string span_id) -> void {
    trace_id_ = std::move(trace_id);
    span_id_ = std::move(span_id);
  }

  // Handler output; cached by the idempotency wrapper and returned to
  // duplicates.
  auto set_result(Bytes result) -> void {
    result_ = std::move(result);
  }
  [[nodiscard]] auto result() const noexcept -> const std::optional<Bytes>& {
    return result_;
  }

private:
  const Task* task_;
  Deadline started_at_;
  Deadline deadline_;
  CancellationToken token_;
  std::string trace_id_;
  std::string span_id_;
  std::optional<Bytes> result_;
};

using Handler = std::function<HandlerResult(TaskContext&, const Task&)>;

}  // namespace taskq
