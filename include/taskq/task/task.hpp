#pragma once

#include "taskq/util/id.hpp"
#include "taskq/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace taskq {

using Bytes = std::vector<std::uint8_t>;

// Pending -> Active -> {Completed | Retry (-> Active when due) | Failed}.
// Scheduled is a pending task whose process_at lies in the future.
enum class TaskState : std::uint8_t {
  Pending,
  Scheduled,
  Active,
  Retry,
  Completed,
  Failed,
};

struct Task {
  TaskId id;
  std::string type;
  Bytes payload;
  std::string queue;
  TaskState state{TaskState::Pending};
  int retry_count{0};
  int max_retry{0};
  std::chrono::milliseconds timeout{0};
  TimePoint enqueued_at{};
  TimePoint process_at{};
  TimePoint processed_at{};
  TimePoint last_failed_at{};
  std::string last_error;
};

struct NewTask {
  std::string type;
  Bytes payload;
};

struct EnqueueOptions {
  std::optional<int> max_retry;
  std::chrono::milliseconds process_in{0};
  // Zero means the worker's default processing deadline.
  std::chrono::milliseconds timeout{0};
};

[[nodiscard]] inline auto is_waiting(TaskState s) noexcept -> bool {
  return s == TaskState::Pending || s == TaskState::Scheduled ||
         s == TaskState::Retry;
}

// A scheduled task whose time has come reads as pending.
[[nodiscard]] inline auto effective_state(const Task& t, TimePoint now) noexcept
    -> TaskState {
  if (t.state == TaskState::Scheduled && t.process_at <= now) {
    return TaskState::Pending;
  }
  return t.state;
}

enum class FailureKind : std::uint8_t {
  Transient,
  Validation,
  Panic,
  Timeout,
  Configuration,
  StoreUnavailable,
};

// Task-level failure reported by a handler or by the dispatcher around it.
// skip_retry moves the task straight to Failed.
struct TaskError {
  FailureKind kind{FailureKind::Transient};
  std::string message;
  bool skip_retry{false};

  [[nodiscard]] static auto transient(std::string msg) -> TaskError {
    return {FailureKind::Transient, std::move(msg), false};
  }
  [[nodiscard]] static auto validation(std::string msg) -> TaskError {
    return {FailureKind::Validation, std::move(msg), true};
  }
  [[nodiscard]] static auto timeout(std::string msg) -> TaskError {
    return {FailureKind::Timeout, std::move(msg), false};
  }
  [[nodiscard]] static auto panic(std::string msg, bool terminal) -> TaskError {
    return {FailureKind::Panic, std::move(msg), terminal};
  }
  [[nodiscard]] static auto configuration(std::string msg) -> TaskError {
    return {FailureKind::Configuration, std::move(msg), true};
  }
  [[nodiscard]] static auto store_unavailable(std::string msg) -> TaskError {
    return {FailureKind::StoreUnavailable, std::move(msg), false};
  }
};

using HandlerResult = std::expected<void, TaskError>;

[[nodiscard]] inline auto retryable(std::string msg)
    -> std::unexpected<TaskError> {
  return std::unexpected{TaskError::transient(std::move(msg))};
}

[[nodiscard]] inline auto skip_retry(std::string msg)
    -> std::unexpected<TaskError> {
  return std::unexpected{TaskError::validation(std::move(msg))};
}

}  // namespace taskq
