#pragma once

#include "taskq/task/task.hpp"

#include <initializer_list>
#include <string_view>

namespace taskq {

// Names used in the sqlite schema and in admin JSON.
[[nodiscard]] constexpr auto task_state_name(TaskState state) noexcept
    -> std::string_view {
  switch (state) {
    case TaskState::Pending: return "pending";
    case TaskState::Scheduled: return "scheduled";
    case TaskState::Active: return "active";
    case TaskState::Retry: return "retry";
    case TaskState::Completed: return "completed";
    case TaskState::Failed: return "failed";
  }
  return "unknown";
}

// Unrecognized names read back as Pending.
[[nodiscard]] constexpr auto parse_task_state(std::string_view name) noexcept
    -> TaskState {
  for (auto state : {TaskState::Scheduled, TaskState::Active, TaskState::Retry,
                     TaskState::Completed, TaskState::Failed}) {
    if (task_state_name(state) == name) {
      return state;
    }
  }
  return TaskState::Pending;
}

[[nodiscard]] constexpr auto failure_kind_name(FailureKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case FailureKind::Transient: return "transient";
    case FailureKind::Validation: return "validation";
    case FailureKind::Panic: return "panic";
    case FailureKind::Timeout: return "timeout";
    case FailureKind::Configuration: return "configuration";
    case FailureKind::StoreUnavailable: return "store_unavailable";
  }
  return "unknown";
}

}  // namespace taskq
